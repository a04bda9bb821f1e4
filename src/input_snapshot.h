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

#ifndef INCDEX_INPUT_SNAPSHOT_H_
#define INCDEX_INPUT_SNAPSHOT_H_

#include <map>
#include <string>
#include <vector>
using namespace std;

#include "load_status.h"
#include "string_piece.h"
#include "timestamp.h"

struct DiskInterface;
struct ThreadPool;

/// Class files that differ between two snapshots. Each list is sorted and
/// holds paths relative to the input root.
struct FileChanges {
  vector<string> added;
  vector<string> removed;
  vector<string> modified;

  bool empty() const {
    return added.empty() && removed.empty() && modified.empty();
  }
};

/// The state of every class file below an input directory, as of one run.
///
/// Stored as a text log so it can be inspected by hand:
///
///   # incdex inputs v2
///   # parameters <hash of the settings the outputs were built with>
///   <mtime>\t<size>\t<relative path>
///   ...
struct InputSnapshot {
  struct Entry {
    TimeStamp mtime = 0;
    int64_t size = 0;

    bool operator==(const Entry& o) const {
      return mtime == o.mtime && size == o.size;
    }
    bool operator!=(const Entry& o) const { return !(*this == o); }
  };

  typedef map<string, Entry> Entries;

  /// Replace the snapshot with the class files currently under |root|.
  bool Capture(DiskInterface* disk_interface, ThreadPool* thread_pool,
               const string& root, string* err);

  /// Load the on-disk snapshot. A corrupt file is a LOAD_ERROR and leaves
  /// the snapshot empty.
  LoadStatus Load(DiskInterface* disk_interface, const string& path,
                  string* err);

  /// Write the snapshot to |path|, replacing any previous one.
  bool Write(DiskInterface* disk_interface, const string& path, string* err);

  static bool Parse(StringPiece content, Entries* entries,
                    uint64_t* parameters_hash, string* err);

  /// What changed going from |previous| to |current|.
  static FileChanges ComputeChanges(const InputSnapshot& previous,
                                    const InputSnapshot& current);

  void Add(const string& path, TimeStamp mtime, int64_t size);

  const Entries& entries() const { return entries_; }
  bool empty() const { return entries_.empty(); }

  uint64_t parameters_hash() const { return parameters_hash_; }
  void set_parameters_hash(uint64_t hash) { parameters_hash_ = hash; }

 private:
  Entries entries_;
  uint64_t parameters_hash_ = 0;
};

/// True if |path| names a class file.
bool IsClassFile(const string& path);

#endif  // INCDEX_INPUT_SNAPSHOT_H_
