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

#ifndef INCDEX_TEST_H_
#define INCDEX_TEST_H_

#include <gtest/gtest.h>

#include <map>
#include <set>
#include <string>
#include <vector>
using namespace std;

#include "disk_interface.h"

/// An implementation of DiskInterface that uses an in-memory representation
/// of disk state.  It also logs file accesses and directory creations
/// so it can be used by tests to verify disk access patterns.
///
/// Not thread-safe; tests that use it run with a single job.
struct VirtualFileSystem : public DiskInterface {
  VirtualFileSystem() : now_(1) {}

  /// "Create" a file with contents. Parent directories are created as
  /// needed.
  void Create(const string& path, const string& contents);

  /// Tick "time" forwards; subsequent file operations will be newer than
  /// previous ones.
  int Tick() {
    return ++now_;
  }

  /// True if |path| exists as a file.
  bool Exists(const string& path) const { return files_.count(path) != 0; }

  /// The content of |path|, which must exist.
  const string& Contents(const string& path) const;

  /// Paths of every file below |dir|, sorted.
  vector<string> FilesUnder(const string& dir) const;

  // DiskInterface
  virtual TimeStamp Stat(const string& path, FileInfo* info,
                         string* err) const;
  virtual bool WriteFile(const string& path, const string& contents);
  virtual bool MakeDir(const string& path);
  virtual Status ReadFile(const string& path, string* contents, string* err);
  virtual int RemoveFile(const string& path);
  virtual int RemoveDir(const string& path);
  virtual bool RenameFile(const string& from, const string& to, string* err);
  virtual bool ReadDir(const string& path, vector<DirEntry>* entries,
                       string* err);

  /// An entry for a single in-memory file.
  struct Entry {
    int mtime;
    string contents;
  };

  typedef map<string, Entry> FileMap;
  typedef map<string, int> DirMap;
  vector<string> directories_made_;
  vector<string> files_read_;
  FileMap files_;
  DirMap dirs_;
  set<string> files_removed_;
  set<string> files_created_;

  /// A simple fake timestamp for file operations.
  int now_;

 private:
  bool HasChildren(const string& dir) const;
};

struct ScopedTempDir {
  /// Create a temporary directory and chdir into it.
  void CreateAndEnter(const string& name);

  /// Clean up the temporary directory.
  void Cleanup();

  /// The temp directory containing our dir.
  string start_dir_;
  /// The subdirectory name for our dir, or empty if it hasn't been set up.
  string temp_dir_name_;
};

/// Assemble a class file declaring |this_class| with the given super class
/// (none if empty), interfaces and one invokedynamic call site per lambda
/// interface.
string MakeClassFile(const string& this_class, const string& super_class,
                     const vector<string>& interfaces = vector<string>(),
                     const vector<string>& lambda_interfaces =
                         vector<string>());

#endif  // INCDEX_TEST_H_
