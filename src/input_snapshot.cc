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

#include "input_snapshot.h"

#include <ctype.h>
#include <errno.h>
#include <inttypes.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "disk_interface.h"
#include "metrics.h"
#include "parallel_map.h"
#include "util.h"

namespace {

const char kFileSignature[] = "# incdex inputs v%d\n";
const int kCurrentVersion = 2;
const char kParametersPrefix[] = "# parameters ";

/// Split the next piece off |input| up to and including |sep|. Returns false
/// when |sep| does not occur, leaving |input| untouched.
bool GetNextPiece(StringPiece* input, char sep, StringPiece* out) {
  size_t split = input->find(sep);
  if (split == StringPiece::npos)
    return false;
  size_t len = split + 1;
  *out = input->substr(0, len);
  *input = input->substr(len);
  return true;
}

bool ParseInt64(StringPiece text, int64_t* value) {
  if (text.empty())
    return false;
  string copy = text.AsString();
  char* end = nullptr;
  errno = 0;
  long long parsed = strtoll(copy.c_str(), &end, 10);
  if (errno != 0 || *end != '\0')
    return false;
  *value = parsed;
  return true;
}

/// Parse "# parameters <16 hex digits>\n".
bool ParseParametersLine(StringPiece line, uint64_t* hash) {
  const size_t prefix_size = sizeof(kParametersPrefix) - 1;
  if (line.size() != prefix_size + 16 + 1 ||
      line.substr(0, prefix_size) != kParametersPrefix)
    return false;
  string digits = line.substr(prefix_size, 16).AsString();
  for (char c : digits) {
    if (!isxdigit(static_cast<unsigned char>(c)))
      return false;
  }
  *hash = strtoull(digits.c_str(), nullptr, 16);
  return true;
}

}  // anonymous namespace

bool IsClassFile(const string& path) {
  return EndsWith(path, ".class");
}

void InputSnapshot::Add(const string& path, TimeStamp mtime, int64_t size) {
  Entry& entry = entries_[path];
  entry.mtime = mtime;
  entry.size = size;
}

bool InputSnapshot::Capture(DiskInterface* disk_interface,
                            ThreadPool* thread_pool, const string& root,
                            string* err) {
  METRIC_RECORD("input snapshot");
  entries_.clear();

  vector<string> files;
  if (!disk_interface->ListFilesRecursively(root, &files, err))
    return false;
  files.erase(remove_if(files.begin(), files.end(),
                        [](const string& file) { return !IsClassFile(file); }),
              files.end());

  struct StatResult {
    TimeStamp mtime = 0;
    FileInfo info;
    string err;
  };
  vector<StatResult> stats = ParallelMap(thread_pool, files,
      [disk_interface, &root](const string& file) {
    StatResult result;
    result.mtime = disk_interface->Stat(JoinPath(root, file), &result.info,
                                        &result.err);
    return result;
  });

  for (size_t i = 0; i < files.size(); ++i) {
    const StatResult& stat = stats[i];
    if (stat.mtime < 0) {
      *err = stat.err;
      entries_.clear();
      return false;
    }
    // Deleted between listing and stat; the next run will see it as removed.
    if (stat.mtime == 0)
      continue;
    Add(files[i], stat.mtime, stat.info.size);
  }
  return true;
}

// static
bool InputSnapshot::Parse(StringPiece content, Entries* entries,
                          uint64_t* parameters_hash, string* err) {
  entries->clear();

  StringPiece header_line;
  int version = 0;
  if (GetNextPiece(&content, '\n', &header_line))
    sscanf(header_line.AsString().c_str(), kFileSignature, &version);
  if (version != kCurrentVersion) {
    *err = "input snapshot version invalid";
    return false;
  }

  StringPiece parameters_line;
  if (!GetNextPiece(&content, '\n', &parameters_line) ||
      !ParseParametersLine(parameters_line, parameters_hash)) {
    *err = "corrupt input snapshot at line 2";
    return false;
  }

  int line_number = 2;
  StringPiece line;
  while (GetNextPiece(&content, '\n', &line)) {
    ++line_number;
    line.remove_suffix(1);

    // mtime and size never contain a tab, so the path is everything after
    // the second one.
    StringPiece fields[2];
    bool ok = true;
    for (int i = 0; i < 2 && ok; ++i) {
      StringPiece field;
      if (GetNextPiece(&line, '\t', &field)) {
        field.remove_suffix(1);
        fields[i] = field;
      } else {
        ok = false;
      }
    }
    int64_t mtime = 0, size = 0;
    if (!ok || line.empty() || !ParseInt64(fields[0], &mtime) ||
        !ParseInt64(fields[1], &size) || mtime <= 0 || size < 0) {
      *err = "corrupt input snapshot at line " + to_string(line_number);
      entries->clear();
      return false;
    }
    Entry& entry = (*entries)[line.AsString()];
    entry.mtime = mtime;
    entry.size = size;
  }

  if (!content.empty()) {
    *err = "input snapshot ends with a partial line";
    entries->clear();
    return false;
  }
  return true;
}

LoadStatus InputSnapshot::Load(DiskInterface* disk_interface,
                               const string& path, string* err) {
  METRIC_RECORD("input snapshot load");
  entries_.clear();
  parameters_hash_ = 0;

  string content;
  string load_err;
  switch (disk_interface->ReadFile(path, &content, &load_err)) {
  case FileReader::Okay:
    break;
  case FileReader::NotFound:
    return LOAD_NOT_FOUND;
  default:
    *err = "loading '" + path + "': " + load_err;
    return LOAD_ERROR;
  }

  if (!Parse(content, &entries_, &parameters_hash_, err)) {
    *err = path + ": " + *err;
    parameters_hash_ = 0;
    return LOAD_ERROR;
  }
  return LOAD_SUCCESS;
}

bool InputSnapshot::Write(DiskInterface* disk_interface, const string& path,
                          string* err) {
  METRIC_RECORD("input snapshot write");
  char header[64];
  snprintf(header, sizeof(header), kFileSignature, kCurrentVersion);
  string content = header;
  snprintf(header, sizeof(header), "%s%016" PRIx64 "\n", kParametersPrefix,
           parameters_hash_);
  content += header;
  for (const auto& entry : entries_) {
    if (entry.first.find('\n') != string::npos) {
      *err = "cannot record path containing a newline: " + entry.first;
      return false;
    }
    content += to_string(entry.second.mtime);
    content += '\t';
    content += to_string(entry.second.size);
    content += '\t';
    content += entry.first;
    content += '\n';
  }

  string temp_path = path + ".tmp";
  if (!disk_interface->MakeDirs(path) ||
      !disk_interface->WriteFile(temp_path, content)) {
    *err = "failed to write " + temp_path;
    return false;
  }
  return disk_interface->RenameFile(temp_path, path, err);
}

// static
FileChanges InputSnapshot::ComputeChanges(const InputSnapshot& previous,
                                          const InputSnapshot& current) {
  FileChanges changes;
  Entries::const_iterator prev = previous.entries_.begin();
  Entries::const_iterator cur = current.entries_.begin();
  // Both maps are sorted by path, so walk them in lockstep.
  while (prev != previous.entries_.end() || cur != current.entries_.end()) {
    if (cur == current.entries_.end() ||
        (prev != previous.entries_.end() && prev->first < cur->first)) {
      changes.removed.push_back(prev->first);
      ++prev;
    } else if (prev == previous.entries_.end() || cur->first < prev->first) {
      changes.added.push_back(cur->first);
      ++cur;
    } else {
      if (prev->second != cur->second)
        changes.modified.push_back(cur->first);
      ++prev;
      ++cur;
    }
  }
  return changes;
}
