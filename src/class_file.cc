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

#include "class_file.h"

#include <stdio.h>

#include <algorithm>
#include <set>

#include "metrics.h"

namespace {

const uint32_t kClassFileMagic = 0xCAFEBABE;

/// Big-endian reader over the class file bytes. Every read is bounds
/// checked; once a read fails all following reads fail too.
struct ByteReader {
  explicit ByteReader(StringPiece data) : data_(data) {}

  bool u1(uint8_t* value) {
    if (!Require(1))
      return false;
    *value = static_cast<uint8_t>(data_[pos_]);
    pos_ += 1;
    return true;
  }

  bool u2(uint16_t* value) {
    if (!Require(2))
      return false;
    *value = static_cast<uint16_t>(
        (static_cast<uint8_t>(data_[pos_]) << 8) |
        static_cast<uint8_t>(data_[pos_ + 1]));
    pos_ += 2;
    return true;
  }

  bool u4(uint32_t* value) {
    uint16_t high, low;
    if (!u2(&high) || !u2(&low))
      return false;
    *value = (static_cast<uint32_t>(high) << 16) | low;
    return true;
  }

  bool Bytes(size_t count, StringPiece* out) {
    if (!Require(count))
      return false;
    *out = data_.substr(pos_, count);
    pos_ += count;
    return true;
  }

  bool Skip(size_t count) {
    StringPiece ignored;
    return Bytes(count, &ignored);
  }

  size_t pos() const { return pos_; }

 private:
  bool Require(size_t count) {
    if (failed_ || data_.size() - pos_ < count) {
      failed_ = true;
      return false;
    }
    return true;
  }

  StringPiece data_;
  size_t pos_ = 0;
  bool failed_ = false;
};

struct Constant {
  uint8_t tag = 0;  // 0 for the unusable slots.
  uint16_t first = 0;
  uint16_t second = 0;
  StringPiece utf8;
};

struct ConstantPool {
  bool Read(ByteReader* reader, string* err);

  /// The Utf8 entry at |index|.
  bool Utf8(uint16_t index, string* out, string* err) const;

  /// The name of the Class entry at |index|.
  bool ClassName(uint16_t index, string* out, string* err) const;

  const Constant* Get(uint16_t index, uint8_t tag, string* err) const;

  vector<Constant> entries;
};

bool ConstantPool::Read(ByteReader* reader, string* err) {
  uint16_t count;
  if (!reader->u2(&count)) {
    *err = "truncated constant pool";
    return false;
  }

  entries.clear();
  entries.resize(count > 0 ? count : 1);  // Slot 0 is never used.
  for (int i = 1; i < count; ++i) {
    Constant& constant = entries[i];
    if (!reader->u1(&constant.tag)) {
      *err = "truncated constant pool";
      return false;
    }

    bool ok = true;
    switch (constant.tag) {
      case CONSTANT_Utf8: {
        uint16_t length;
        ok = reader->u2(&length) && reader->Bytes(length, &constant.utf8);
        break;
      }
      case CONSTANT_Integer:
      case CONSTANT_Float:
        ok = reader->Skip(4);
        break;
      case CONSTANT_Long:
      case CONSTANT_Double:
        // Longs and doubles occupy two constant pool slots.
        ok = reader->Skip(8);
        ++i;
        break;
      case CONSTANT_Class:
      case CONSTANT_String:
      case CONSTANT_MethodType:
      case CONSTANT_Module:
      case CONSTANT_Package:
        ok = reader->u2(&constant.first);
        break;
      case CONSTANT_Fieldref:
      case CONSTANT_Methodref:
      case CONSTANT_InterfaceMethodref:
      case CONSTANT_NameAndType:
      case CONSTANT_Dynamic:
      case CONSTANT_InvokeDynamic:
        ok = reader->u2(&constant.first) && reader->u2(&constant.second);
        break;
      case CONSTANT_MethodHandle: {
        uint8_t reference_kind;
        ok = reader->u1(&reference_kind) && reader->u2(&constant.second);
        constant.first = reference_kind;
        break;
      }
      default: {
        char buf[64];
        snprintf(buf, sizeof(buf), "unknown constant pool tag %d at index %d",
                 constant.tag, i);
        *err = buf;
        return false;
      }
    }
    if (!ok) {
      *err = "truncated constant pool";
      return false;
    }
  }
  return true;
}

const Constant* ConstantPool::Get(uint16_t index, uint8_t tag,
                                  string* err) const {
  if (index == 0 || index >= entries.size() || entries[index].tag != tag) {
    *err = "illegal constant pool index " + to_string(index);
    return nullptr;
  }
  return &entries[index];
}

bool ConstantPool::Utf8(uint16_t index, string* out, string* err) const {
  const Constant* constant = Get(index, CONSTANT_Utf8, err);
  if (!constant)
    return false;
  *out = constant->utf8.AsString();
  return true;
}

bool ConstantPool::ClassName(uint16_t index, string* out, string* err) const {
  const Constant* constant = Get(index, CONSTANT_Class, err);
  return constant && Utf8(constant->first, out, err);
}

/// The class named by the return type of a method descriptor such as
/// "(I)Ljava/lang/Runnable;". Empty for primitive and array return types.
string ReturnTypeClass(const string& descriptor) {
  string::size_type close = descriptor.rfind(')');
  if (close == string::npos)
    return string();
  string return_type = descriptor.substr(close + 1);
  if (return_type.size() < 3 || return_type[0] != 'L' ||
      return_type[return_type.size() - 1] != ';')
    return string();
  return return_type.substr(1, return_type.size() - 2);
}

}  // anonymous namespace

bool ClassFile::Parse(StringPiece data, string* err) {
  METRIC_RECORD("class file parse");
  ByteReader reader(data);

  uint32_t magic;
  if (!reader.u4(&magic) || magic != kClassFileMagic) {
    *err = "bad class file magic";
    return false;
  }
  if (!reader.u2(&minor_version) || !reader.u2(&major_version)) {
    *err = "truncated class file header";
    return false;
  }

  ConstantPool pool;
  if (!pool.Read(&reader, err))
    return false;

  uint16_t this_index, super_index, interfaces_count;
  if (!reader.u2(&access_flags) || !reader.u2(&this_index) ||
      !reader.u2(&super_index) || !reader.u2(&interfaces_count)) {
    *err = "truncated class file header";
    return false;
  }
  if (!pool.ClassName(this_index, &this_class, err))
    return false;
  super_class.clear();
  if (super_index != 0 && !pool.ClassName(super_index, &super_class, err))
    return false;

  interfaces.clear();
  for (int i = 0; i < interfaces_count; ++i) {
    uint16_t index;
    string name;
    if (!reader.u2(&index)) {
      *err = "truncated interfaces table";
      return false;
    }
    if (!pool.ClassName(index, &name, err))
      return false;
    interfaces.push_back(name);
  }

  lambda_interfaces.clear();
  for (const Constant& constant : pool.entries) {
    if (constant.tag != CONSTANT_InvokeDynamic)
      continue;
    const Constant* name_and_type =
        pool.Get(constant.second, CONSTANT_NameAndType, err);
    string descriptor;
    if (!name_and_type || !pool.Utf8(name_and_type->second, &descriptor, err))
      return false;
    string lambda_interface = ReturnTypeClass(descriptor);
    if (!lambda_interface.empty() &&
        find(lambda_interfaces.begin(), lambda_interfaces.end(),
             lambda_interface) == lambda_interfaces.end()) {
      lambda_interfaces.push_back(lambda_interface);
    }
  }

  return true;
}

vector<string> ClassFile::DesugarDependencies() const {
  set<string> dependencies;
  if (!super_class.empty())
    dependencies.insert(super_class);
  dependencies.insert(interfaces.begin(), interfaces.end());
  dependencies.insert(lambda_interfaces.begin(), lambda_interfaces.end());
  dependencies.erase(this_class);
  return vector<string>(dependencies.begin(), dependencies.end());
}

string ClassNameToPath(const string& class_name) {
  return class_name + ".class";
}
