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

#ifndef INCDEX_DESUGAR_GRAPH_LOG_H_
#define INCDEX_DESUGAR_GRAPH_LOG_H_

#include <string>
using namespace std;

#include "load_status.h"
#include "string_piece.h"

struct DependencyGraph;
struct DiskInterface;

/// Persists a DependencyGraph between runs as a binary file.
///
/// The file is rewritten in full on every save and is only ever read as a
/// whole: a file that fails validation anywhere is rejected, and the caller
/// is expected to fall back to a non-incremental run.
///
/// Format:
///  - 16 byte signature "# desugar graph\n"
///  - int32 version, which doubles as a byte order mark
///  - a sequence of records, each starting with a uint32 size (in bytes,
///    excluding the size word itself):
///
///    path (high bit of size clear):
///     - the node's path, padded to a multiple of 4 bytes with NULs
///     - uint32 checksum (ones complement of the node's id)
///
///    edges (high bit of size set):
///     - int32 dependent_id
///     - int32 dependency_id[...] -- every remaining word
///
/// Node ids are assigned in the order the path records appear, and an edge
/// record may only refer to ids whose path record came before it.
struct DesugarGraphLog {
  explicit DesugarGraphLog(DiskInterface* disk_interface)
      : disk_interface_(disk_interface) {}

  /// Write |graph| to |path|, going through a temporary file so that a
  /// crash never leaves a half-written graph behind.
  bool Write(const string& path, DependencyGraph* graph, string* err);

  /// Replace the content of |graph| with the graph stored at |path|. On
  /// LOAD_ERROR, |err| explains why and |graph| is left empty.
  LoadStatus Load(const string& path, DependencyGraph* graph, string* err);

  /// Encode |graph| into |out|. Assigns node ids as a side effect. Fails if
  /// a path does not fit in a record.
  static bool Serialize(DependencyGraph* graph, string* out, string* err);

  /// Decode |data| into |graph|, which must be empty.
  static bool Parse(StringPiece data, DependencyGraph* graph, string* err);

 private:
  DiskInterface* disk_interface_;
};

#endif  // INCDEX_DESUGAR_GRAPH_LOG_H_
