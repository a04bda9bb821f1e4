// Copyright 2026 Google Inc. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "desugar_graph_log.h"

#include <assert.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>

#include <vector>

#include "dependency_graph.h"
#include "disk_interface.h"
#include "metrics.h"
#include "util.h"

// The version is stored as 4 bytes after the signature and also serves as a
// byte order mark. Signature and version combined are 20 bytes long.
static constexpr StringPiece kFileSignature { "# desugar graph\n", 16 };
static_assert(kFileSignature.size() % 4 == 0,
              "file signature size is not a multiple of 4");
static constexpr size_t kFileHeaderSize = kFileSignature.size() + 4;
const int32_t kCurrentVersion = 1;

// Record size is limited to less than the full 32 bit so that a corrupt size
// word can't make us skip over most of the file.
const uint32_t kMaxRecordSize = (1 << 19) - 1;

const uint32_t kEdgesRecordBit = 0x80000000;

namespace {

void AppendWord(string* out, uint32_t word) {
  out->append(reinterpret_cast<const char*>(&word), sizeof(word));
}

uint32_t ReadWord(StringPiece data, size_t word_index) {
  uint32_t word;
  memcpy(&word, data.data() + word_index * sizeof(uint32_t), sizeof(word));
  return word;
}

/// A stored path must already be in the form DesugarGraph produces: relative,
/// canonical and free of "..".
bool IsValidNodePath(const string& path) {
  if (path.empty() || path[0] == '/')
    return false;
  string canonical = path;
  string err;
  if (!CanonicalizePath(&canonical, &err) || canonical != path)
    return false;
  return path != ".." && path.compare(0, 3, "../") != 0;
}

}  // anonymous namespace

// static
bool DesugarGraphLog::Serialize(DependencyGraph* graph, string* out,
                                string* err) {
  METRIC_RECORD("desugar graph serialize");
  out->clear();
  out->append(kFileSignature.data(), kFileSignature.size());
  AppendWord(out, static_cast<uint32_t>(kCurrentVersion));

  // Path records for every node first, so isolated nodes survive a round
  // trip, then the edges grouped by dependent.
  int next_id = 0;
  for (const auto& entry : graph->paths()) {
    GraphNode* node = entry.second;
    const string& path = node->path();
    size_t padding = (4 - path.size() % 4) % 4;  // Pad path to 4 byte boundary.
    size_t record_size = path.size() + padding + 4;
    if (record_size > kMaxRecordSize) {
      *err = "path too long for the desugar graph: " + path.substr(0, 64) +
          "...";
      out->clear();
      return false;
    }
    AppendWord(out, static_cast<uint32_t>(record_size));
    out->append(path);
    out->append(padding, '\0');
    node->set_id(next_id);
    AppendWord(out, ~static_cast<uint32_t>(next_id));
    ++next_id;
  }

  const size_t kMaxDependenciesPerRecord = kMaxRecordSize / 4 - 1;
  for (const auto& entry : graph->paths()) {
    GraphNode* node = entry.second;
    const NodeSet& dependencies = node->dependencies();
    NodeSet::const_iterator it = dependencies.begin();
    while (it != dependencies.end()) {
      // Split very wide nodes over several records; loading merges them.
      vector<uint32_t> ids;
      for (; it != dependencies.end() && ids.size() < kMaxDependenciesPerRecord;
           ++it) {
        ids.push_back(static_cast<uint32_t>((*it)->id()));
      }
      AppendWord(out, static_cast<uint32_t>(4 * (1 + ids.size())) |
                      kEdgesRecordBit);
      AppendWord(out, static_cast<uint32_t>(node->id()));
      for (uint32_t id : ids)
        AppendWord(out, id);
    }
  }
  return true;
}

// static
bool DesugarGraphLog::Parse(StringPiece data, DependencyGraph* graph,
                            string* err) {
  METRIC_RECORD("desugar graph parse");
  assert(graph->empty());

  if (data.size() < kFileHeaderSize ||
      data.substr(0, kFileSignature.size()) != kFileSignature) {
    *err = "bad desugar graph signature";
    return false;
  }
  int32_t version = 0;
  memcpy(&version, data.data() + kFileSignature.size(), sizeof(version));
  if (version != kCurrentVersion) {
    *err = "bad desugar graph version " + to_string(version) +
        " (expected " + to_string(kCurrentVersion) + ")";
    return false;
  }

  data.remove_prefix(kFileHeaderSize);
  if (data.size() % sizeof(uint32_t) != 0) {
    *err = "premature end of file";
    return false;
  }
  const size_t word_count = data.size() / sizeof(uint32_t);

  vector<GraphNode*> nodes;
  for (size_t index = 0; index < word_count; ) {
    const uint32_t header = ReadWord(data, index);
    const uint32_t raw_size = header & ~kEdgesRecordBit;
    if (raw_size % sizeof(uint32_t) != 0 || raw_size > kMaxRecordSize) {
      *err = "corrupt record header at word " + to_string(index);
      graph->Clear();
      return false;
    }
    // Number of words in the record, including the header.
    const size_t size = raw_size / sizeof(uint32_t) + 1;
    if (word_count - index < size) {
      *err = "premature end of file";
      graph->Clear();
      return false;
    }

    if ((header & kEdgesRecordBit) == 0) {
      // Path record (header, content, checksum).
      if (size < 3) {
        *err = "corrupt path record at word " + to_string(index);
        graph->Clear();
        return false;
      }
      const char* chars = data.data() + (index + 1) * sizeof(uint32_t);
      size_t path_size = (size - 2) * sizeof(uint32_t);
      for (int i = 0; i < 3 && path_size > 0 && chars[path_size - 1] == '\0';
           ++i) {
        --path_size;
      }
      string path(chars, path_size);
      const uint32_t checksum = ReadWord(data, index + size - 1);
      if (checksum != ~static_cast<uint32_t>(nodes.size())) {
        *err = "bad checksum for path record '" + path + "'";
        graph->Clear();
        return false;
      }
      if (!IsValidNodePath(path)) {
        *err = "invalid node path '" + path + "'";
        graph->Clear();
        return false;
      }
      if (graph->LookupNode(path)) {
        *err = "duplicate node path '" + path + "'";
        graph->Clear();
        return false;
      }
      GraphNode* node = graph->GetNode(path);
      node->set_id(static_cast<int>(nodes.size()));
      nodes.push_back(node);
    } else {
      // Edges record (header, dependent_id, dependency_id...).
      if (size < 3) {
        *err = "corrupt edges record at word " + to_string(index);
        graph->Clear();
        return false;
      }
      const uint32_t dependent_id = ReadWord(data, index + 1);
      if (dependent_id >= nodes.size()) {
        *err = "edges record refers to unknown node " + to_string(dependent_id);
        graph->Clear();
        return false;
      }
      for (size_t i = index + 2; i < index + size; ++i) {
        const uint32_t dependency_id = ReadWord(data, i);
        if (dependency_id >= nodes.size()) {
          *err = "edges record refers to unknown node " +
              to_string(dependency_id);
          graph->Clear();
          return false;
        }
        graph->AddEdge(nodes[dependent_id], nodes[dependency_id]);
      }
    }
    index += size;
  }

  return true;
}

bool DesugarGraphLog::Write(const string& path, DependencyGraph* graph,
                            string* err) {
  METRIC_RECORD("desugar graph write");
  string content;
  if (!Serialize(graph, &content, err))
    return false;

  string temp_path = path + ".tmp";
  if (!disk_interface_->MakeDirs(path)) {
    *err = "failed to create directory for " + path;
    return false;
  }
  if (!disk_interface_->WriteFile(temp_path, content)) {
    *err = "failed to write " + temp_path;
    return false;
  }
  return disk_interface_->RenameFile(temp_path, path, err);
}

LoadStatus DesugarGraphLog::Load(const string& path, DependencyGraph* graph,
                                 string* err) {
  METRIC_RECORD("desugar graph load");
  graph->Clear();

  string content;
  string load_err;
  switch (disk_interface_->ReadFile(path, &content, &load_err)) {
  case FileReader::Okay:
    break;
  case FileReader::NotFound:
    return LOAD_NOT_FOUND;
  default:
    *err = "loading '" + path + "': " + load_err;
    return LOAD_ERROR;
  }

  if (!Parse(content, graph, err)) {
    *err = path + ": " + *err;
    return LOAD_ERROR;
  }
  return LOAD_SUCCESS;
}
