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

#include "disk_interface.h"

#include <algorithm>

#include <dirent.h>
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "metrics.h"
#include "util.h"

namespace {

TimeStamp StatTimestamp(const struct stat& st) {
  // Some users (Flatpak) set mtime to 0, this should be harmless
  // and avoids conflicting with our return value of 0 meaning
  // that it doesn't exist.
  if (st.st_mtime == 0)
    return 1;
  return (int64_t)st.st_mtim.tv_sec * 1000000000LL + st.st_mtim.tv_nsec;
}

bool RemoveEmptyDir(DiskInterface* disk, const string& path, string* err) {
  if (disk->RemoveDir(path) < 0) {
    *err = "failed to remove " + path;
    return false;
  }
  return true;
}

/// Symlinks found inside |path| are removed, never followed.
bool RemoveDirContents(DiskInterface* disk, const string& path, string* err) {
  vector<DirEntry> entries;
  if (!disk->ReadDir(path, &entries, err))
    return false;
  for (const DirEntry& entry : entries) {
    string child = JoinPath(path, entry.name);
    if (entry.is_dir) {
      if (!RemoveDirContents(disk, child, err) ||
          !RemoveEmptyDir(disk, child, err))
        return false;
    } else if (disk->RemoveFile(child) < 0) {
      *err = "failed to remove " + child;
      return false;
    }
  }
  return true;
}

}  // namespace

// DiskInterface ---------------------------------------------------------------

bool DiskInterface::MakeDirs(const string& path) {
  string dir = DirName(path);
  if (dir.empty())
    return true;  // Reached root; assume it's there.
  string err;
  FileInfo info;
  TimeStamp mtime = Stat(dir, &info, &err);
  if (mtime < 0) {
    Error("%s", err.c_str());
    return false;
  }
  if (mtime > 0)
    return info.is_dir;  // Exists already; we're done.

  // Directory doesn't exist.  Try creating its parent first.
  bool success = MakeDirs(dir);
  if (!success)
    return false;
  return MakeDir(dir);
}

bool DiskInterface::ListFilesRecursively(const string& root,
                                         vector<string>* files, string* err) {
  METRIC_RECORD("list input files");
  files->clear();

  FileInfo info;
  TimeStamp mtime = Stat(root, &info, err);
  if (mtime < 0)
    return false;
  if (mtime == 0)
    return true;
  if (!info.is_dir) {
    *err = root + ": not a directory";
    return false;
  }

  // Depth-first walk over directories relative to |root|.
  vector<string> pending;
  pending.push_back(string());
  while (!pending.empty()) {
    string relative_dir = pending.back();
    pending.pop_back();

    vector<DirEntry> entries;
    if (!ReadDir(JoinPath(root, relative_dir), &entries, err))
      return false;
    for (const DirEntry& entry : entries) {
      string relative = relative_dir.empty()
          ? entry.name : relative_dir + "/" + entry.name;
      if (entry.is_dir)
        pending.push_back(relative);
      else
        files->push_back(relative);
    }
  }

  sort(files->begin(), files->end());
  return true;
}

bool DiskInterface::RemoveTree(const string& path, string* err) {
  FileInfo info;
  TimeStamp mtime = Stat(path, &info, err);
  if (mtime < 0)
    return false;
  if (mtime == 0)
    return true;
  if (!info.is_dir) {
    if (RemoveFile(path) < 0) {
      *err = "failed to remove " + path;
      return false;
    }
    return true;
  }
  return RemoveDirContents(this, path, err) && RemoveEmptyDir(this, path, err);
}

bool DiskInterface::CleanDir(const string& path, string* err) {
  METRIC_RECORD("clean output dir");
  if (!RemoveTree(path, err))
    return false;
  if (!MakeDirs(path) || !MakeDir(path)) {
    *err = "mkdir(" + path + "): " + strerror(errno);
    return false;
  }
  return true;
}

// RealDiskInterface -----------------------------------------------------------

TimeStamp RealDiskInterface::Stat(const string& path, FileInfo* info,
                                  string* err) const {
  METRIC_RECORD("node stat");
  struct stat st;
  if (stat(path.c_str(), &st) < 0) {
    if (errno == ENOENT || errno == ENOTDIR)
      return 0;
    *err = "stat(" + path + "): " + strerror(errno);
    return -1;
  }
  if (info) {
    info->size = st.st_size;
    info->is_dir = S_ISDIR(st.st_mode);
  }
  return StatTimestamp(st);
}

bool RealDiskInterface::WriteFile(const string& path, const string& contents) {
  FILE* fp = fopen(path.c_str(), "wb");
  if (fp == NULL) {
    Error("WriteFile(%s): Unable to create file. %s",
          path.c_str(), strerror(errno));
    return false;
  }

  if (!contents.empty() &&
      fwrite(contents.data(), 1, contents.length(), fp) < contents.length())  {
    Error("WriteFile(%s): Unable to write to the file. %s",
          path.c_str(), strerror(errno));
    fclose(fp);
    return false;
  }

  if (fclose(fp) == EOF) {
    Error("WriteFile(%s): Unable to close the file. %s",
          path.c_str(), strerror(errno));
    return false;
  }

  return true;
}

bool RealDiskInterface::MakeDir(const string& path) {
  if (mkdir(path.c_str(), 0777) < 0) {
    if (errno == EEXIST) {
      return true;
    }
    Error("mkdir(%s): %s", path.c_str(), strerror(errno));
    return false;
  }
  return true;
}

FileReader::Status RealDiskInterface::ReadFile(const string& path,
                                               string* contents,
                                               string* err) {
  switch (::ReadFile(path, contents, err)) {
  case 0:       return Okay;
  case -ENOENT: return NotFound;
  default:      return OtherError;
  }
}

int RealDiskInterface::RemoveFile(const string& path) {
  if (unlink(path.c_str()) < 0) {
    switch (errno) {
      case ENOENT:
        return 1;
      default:
        Error("remove(%s): %s", path.c_str(), strerror(errno));
        return -1;
    }
  }
  return 0;
}

int RealDiskInterface::RemoveDir(const string& path) {
  if (rmdir(path.c_str()) < 0) {
    switch (errno) {
      case ENOENT:
        return 1;
      default:
        Error("rmdir(%s): %s", path.c_str(), strerror(errno));
        return -1;
    }
  }
  return 0;
}

bool RealDiskInterface::RenameFile(const string& from, const string& to,
                                   string* err) {
  if (rename(from.c_str(), to.c_str()) < 0) {
    *err = "rename(" + from + ", " + to + "): " + strerror(errno);
    return false;
  }
  return true;
}

bool RealDiskInterface::ReadDir(const string& path, vector<DirEntry>* entries,
                                string* err) {
  DIR* dir = opendir(path.c_str());
  if (!dir) {
    *err = "opendir(" + path + "): " + strerror(errno);
    return false;
  }

  entries->clear();
  errno = 0;
  while (struct dirent* ent = readdir(dir)) {
    if (strcmp(ent->d_name, ".") == 0 || strcmp(ent->d_name, "..") == 0)
      continue;
    DirEntry entry;
    entry.name = ent->d_name;
    if (ent->d_type == DT_DIR) {
      entry.is_dir = true;
    } else if (ent->d_type == DT_UNKNOWN) {
      // Some file systems don't fill in d_type. Symlinks are never followed.
      struct stat st;
      if (lstat(JoinPath(path, entry.name).c_str(), &st) == 0)
        entry.is_dir = S_ISDIR(st.st_mode);
    }
    entries->push_back(entry);
    errno = 0;  // readdir() only reports errors through errno.
  }
  int read_errno = errno;
  closedir(dir);
  if (read_errno != 0) {
    *err = "readdir(" + path + "): " + strerror(read_errno);
    return false;
  }
  return true;
}
