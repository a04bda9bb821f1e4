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

#ifndef INCDEX_DISK_INTERFACE_H_
#define INCDEX_DISK_INTERFACE_H_

#include <stdint.h>

#include <string>
#include <vector>
using namespace std;

#include "timestamp.h"

/// Read access to files. See DiskInterface.
struct FileReader {
  virtual ~FileReader() {}

  /// Result of ReadFile.
  enum Status {
    Okay,
    NotFound,
    OtherError
  };

  /// Read the whole file into |contents|. Anything but Okay comes with an
  /// explanation in |err|.
  virtual Status ReadFile(const string& path, string* contents,
                          string* err) = 0;
};

/// What Stat() learned about a path besides its mtime.
struct FileInfo {
  int64_t size = 0;
  bool is_dir = false;
};

/// One entry of a directory listing.
struct DirEntry {
  string name;
  bool is_dir = false;
};

/// Everything a dexing run does to the file system: scanning the input
/// directory, writing outputs, and persisting state between runs.
///
/// Abstract so that tests can run against VirtualFileSystem. The real
/// implementation is RealDiskInterface.
struct DiskInterface : public FileReader {
  /// stat() a path, returning the mtime, 0 if it is missing and -1 on other
  /// errors. |info| may be null. Thread-safe.
  virtual TimeStamp Stat(const string& path, FileInfo* info,
                         string* err) const = 0;

  /// Create one directory. An existing directory is not an error.
  virtual bool MakeDir(const string& path) = 0;

  /// Create or truncate |path| and write |contents| to it.
  virtual bool WriteFile(const string& path, const string& contents) = 0;

  /// Remove a file, like `rm -f`.
  /// @returns 0 if the file has been removed,
  ///          1 if the file does not exist, and
  ///          -1 if an error occurs.
  virtual int RemoveFile(const string& path) = 0;

  /// Remove an empty directory. Same return values as RemoveFile.
  virtual int RemoveDir(const string& path) = 0;

  /// Atomically replace |to| with |from|.
  virtual bool RenameFile(const string& from, const string& to,
                          string* err) = 0;

  /// List a directory, without "." and "..", in no particular order.
  /// Symlinks are reported as files.
  virtual bool ReadDir(const string& path, vector<DirEntry>* entries,
                       string* err) = 0;

  /// Create every missing parent directory of |path|, like
  /// `mkdir -p $(dirname path)`.
  bool MakeDirs(const string& path);

  /// Collect every file below |root|, as sorted paths relative to |root|.
  /// A missing |root| yields an empty list.
  bool ListFilesRecursively(const string& root, vector<string>* files,
                            string* err);

  /// Delete the contents of |path| and make sure it exists as an empty
  /// directory, like `rm -rf path && mkdir -p path`.
  bool CleanDir(const string& path, string* err);

  /// Remove |path| and everything below it. Missing paths are not an error.
  bool RemoveTree(const string& path, string* err);
};

/// Implementation of DiskInterface that actually hits the disk.
struct RealDiskInterface : public DiskInterface {
  virtual ~RealDiskInterface() {}
  virtual TimeStamp Stat(const string& path, FileInfo* info,
                         string* err) const;
  virtual bool MakeDir(const string& path);
  virtual bool WriteFile(const string& path, const string& contents);
  virtual Status ReadFile(const string& path, string* contents, string* err);
  virtual int RemoveFile(const string& path);
  virtual int RemoveDir(const string& path);
  virtual bool RenameFile(const string& from, const string& to, string* err);
  virtual bool ReadDir(const string& path, vector<DirEntry>* entries,
                       string* err);
};

#endif  // INCDEX_DISK_INTERFACE_H_
