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

#include "test.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <algorithm>

#include "class_file.h"
#include "util.h"

namespace {

string GetSystemTempDir() {
  const char* tempdir = getenv("TMPDIR");
  if (tempdir)
    return tempdir;
  return "/tmp";
}

void PutU1(string* out, uint8_t value) {
  out->push_back(static_cast<char>(value));
}

void PutU2(string* out, uint16_t value) {
  PutU1(out, value >> 8);
  PutU1(out, value & 0xff);
}

void PutU4(string* out, uint32_t value) {
  PutU2(out, value >> 16);
  PutU2(out, value & 0xffff);
}

/// Builds a constant pool, handing out indices as entries are added.
struct ConstantPoolBuilder {
  uint16_t Utf8(const string& text) {
    PutU1(&bytes, CONSTANT_Utf8);
    PutU2(&bytes, static_cast<uint16_t>(text.size()));
    bytes += text;
    return next_index++;
  }

  uint16_t Class(const string& name) {
    uint16_t name_index = Utf8(name);
    PutU1(&bytes, CONSTANT_Class);
    PutU2(&bytes, name_index);
    return next_index++;
  }

  uint16_t NameAndType(const string& name, const string& descriptor) {
    uint16_t name_index = Utf8(name);
    uint16_t descriptor_index = Utf8(descriptor);
    PutU1(&bytes, CONSTANT_NameAndType);
    PutU2(&bytes, name_index);
    PutU2(&bytes, descriptor_index);
    return next_index++;
  }

  uint16_t InvokeDynamic(uint16_t bootstrap_method, uint16_t name_and_type) {
    PutU1(&bytes, CONSTANT_InvokeDynamic);
    PutU2(&bytes, bootstrap_method);
    PutU2(&bytes, name_and_type);
    return next_index++;
  }

  uint16_t Long(uint64_t value) {
    PutU1(&bytes, CONSTANT_Long);
    PutU4(&bytes, static_cast<uint32_t>(value >> 32));
    PutU4(&bytes, static_cast<uint32_t>(value));
    uint16_t index = next_index;
    next_index += 2;
    return index;
  }

  string bytes;
  uint16_t next_index = 1;
};

}  // anonymous namespace

string MakeClassFile(const string& this_class, const string& super_class,
                     const vector<string>& interfaces,
                     const vector<string>& lambda_interfaces) {
  ConstantPoolBuilder pool;
  pool.Long(0x123456789abcdefULL);
  uint16_t this_index = pool.Class(this_class);
  uint16_t super_index = super_class.empty() ? 0 : pool.Class(super_class);
  vector<uint16_t> interface_indices;
  for (const string& name : interfaces)
    interface_indices.push_back(pool.Class(name));
  for (size_t i = 0; i < lambda_interfaces.size(); ++i) {
    uint16_t name_and_type = pool.NameAndType(
        "lambda", "(I)L" + lambda_interfaces[i] + ";");
    pool.InvokeDynamic(static_cast<uint16_t>(i), name_and_type);
  }

  string out;
  PutU4(&out, 0xCAFEBABE);
  PutU2(&out, 0);   // minor
  PutU2(&out, 52);  // major, Java 8
  PutU2(&out, pool.next_index);
  out += pool.bytes;
  PutU2(&out, 0x0021);  // ACC_PUBLIC | ACC_SUPER
  PutU2(&out, this_index);
  PutU2(&out, super_index);
  PutU2(&out, static_cast<uint16_t>(interface_indices.size()));
  for (uint16_t index : interface_indices)
    PutU2(&out, index);
  PutU2(&out, 0);  // fields
  PutU2(&out, 0);  // methods
  PutU2(&out, 0);  // attributes
  return out;
}

void VirtualFileSystem::Create(const string& path, const string& contents) {
  for (string dir = DirName(path); !dir.empty() && dir != "/";
       dir = DirName(dir)) {
    if (!dirs_.count(dir))
      dirs_[dir] = now_;
  }
  files_[path].mtime = now_;
  files_[path].contents = contents;
  files_created_.insert(path);
}

const string& VirtualFileSystem::Contents(const string& path) const {
  FileMap::const_iterator i = files_.find(path);
  EXPECT_TRUE(i != files_.end()) << path;
  static const string kEmpty;
  return i != files_.end() ? i->second.contents : kEmpty;
}

vector<string> VirtualFileSystem::FilesUnder(const string& dir) const {
  vector<string> result;
  string prefix = dir + "/";
  for (const auto& file : files_) {
    if (file.first.compare(0, prefix.size(), prefix) == 0)
      result.push_back(file.first);
  }
  return result;
}

bool VirtualFileSystem::HasChildren(const string& dir) const {
  string prefix = dir + "/";
  FileMap::const_iterator f = files_.lower_bound(prefix);
  if (f != files_.end() && f->first.compare(0, prefix.size(), prefix) == 0)
    return true;
  DirMap::const_iterator d = dirs_.lower_bound(prefix);
  return d != dirs_.end() && d->first.compare(0, prefix.size(), prefix) == 0;
}

TimeStamp VirtualFileSystem::Stat(const string& path, FileInfo* info,
                                  string* err) const {
  DirMap::const_iterator d = dirs_.find(path);
  if (d != dirs_.end()) {
    if (info) {
      info->size = 0;
      info->is_dir = true;
    }
    return d->second;
  }
  FileMap::const_iterator i = files_.find(path);
  if (i != files_.end()) {
    if (info) {
      info->size = i->second.contents.size();
      info->is_dir = false;
    }
    return i->second.mtime;
  }
  return 0;
}

bool VirtualFileSystem::WriteFile(const string& path, const string& contents) {
  if (dirs_.count(path))
    return false;
  string dir = DirName(path);
  if (!dir.empty() && !dirs_.count(dir))
    return false;
  Create(path, contents);
  return true;
}

bool VirtualFileSystem::MakeDir(const string& path) {
  if (dirs_.count(path))
    return true;
  if (files_.count(path))
    return false;
  string dir = DirName(path);
  if (!dir.empty() && !dirs_.count(dir))
    return false;
  dirs_[path] = now_;
  directories_made_.push_back(path);
  return true;  // success
}

FileReader::Status VirtualFileSystem::ReadFile(const string& path,
                                               string* contents,
                                               string* err) {
  files_read_.push_back(path);
  FileMap::iterator i = files_.find(path);
  if (i == files_.end()) {
    *err = strerror(ENOENT);
    return NotFound;
  }
  *contents = i->second.contents;
  return Okay;
}

int VirtualFileSystem::RemoveFile(const string& path) {
  if (dirs_.find(path) != dirs_.end())
    return -1;
  FileMap::iterator i = files_.find(path);
  if (i != files_.end()) {
    files_.erase(i);
    files_removed_.insert(path);
    return 0;
  } else {
    return 1;
  }
}

int VirtualFileSystem::RemoveDir(const string& path) {
  DirMap::iterator d = dirs_.find(path);
  if (d == dirs_.end())
    return files_.count(path) ? -1 : 1;
  if (HasChildren(path))
    return -1;
  dirs_.erase(d);
  return 0;
}

bool VirtualFileSystem::RenameFile(const string& from, const string& to,
                                   string* err) {
  FileMap::iterator i = files_.find(from);
  if (i == files_.end()) {
    *err = "rename(" + from + ", " + to + "): " + strerror(ENOENT);
    return false;
  }
  Entry entry = i->second;
  files_.erase(i);
  files_[to] = entry;
  return true;
}

bool VirtualFileSystem::ReadDir(const string& path, vector<DirEntry>* entries,
                                string* err) {
  if (!dirs_.count(path)) {
    *err = "opendir(" + path + "): " + strerror(ENOENT);
    return false;
  }
  entries->clear();
  string prefix = path + "/";
  for (const auto& dir : dirs_) {
    if (dir.first.compare(0, prefix.size(), prefix) == 0 &&
        dir.first.find('/', prefix.size()) == string::npos) {
      DirEntry entry;
      entry.name = dir.first.substr(prefix.size());
      entry.is_dir = true;
      entries->push_back(entry);
    }
  }
  for (const auto& file : files_) {
    if (file.first.compare(0, prefix.size(), prefix) == 0 &&
        file.first.find('/', prefix.size()) == string::npos) {
      DirEntry entry;
      entry.name = file.first.substr(prefix.size());
      entries->push_back(entry);
    }
  }
  return true;
}

void ScopedTempDir::CreateAndEnter(const string& name) {
  // First change into the system temp dir and save it for cleanup.
  start_dir_ = GetSystemTempDir();
  if (start_dir_.empty())
    Fatal("couldn't get system temp dir");
  if (chdir(start_dir_.c_str()) < 0)
    Fatal("chdir: %s", strerror(errno));

  // Create a temporary subdirectory of that.
  char name_template[1024];
  strcpy(name_template, name.c_str());
  strcat(name_template, "-XXXXXX");
  char* tempname = mkdtemp(name_template);
  if (!tempname)
    Fatal("mkdtemp: %s", strerror(errno));
  temp_dir_name_ = tempname;

  // chdir into the new temporary directory.
  if (chdir(temp_dir_name_.c_str()) < 0)
    Fatal("chdir: %s", strerror(errno));
}

void ScopedTempDir::Cleanup() {
  if (temp_dir_name_.empty())
    return;  // Something went wrong earlier.

  // Move out of the directory we're about to clobber.
  if (chdir(start_dir_.c_str()) < 0)
    Fatal("chdir: %s", strerror(errno));

  string command = "rm -rf " + temp_dir_name_;
  if (system(command.c_str()) < 0)
    Fatal("system: %s", strerror(errno));

  temp_dir_name_.clear();
}
