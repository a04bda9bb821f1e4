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

#ifndef INCDEX_CLASS_FILE_H_
#define INCDEX_CLASS_FILE_H_

#include <stdint.h>

#include <string>
#include <vector>
using namespace std;

#include "string_piece.h"

/// Constant pool tags (JVMS 4.4).
enum ConstantTag {
  CONSTANT_Utf8 = 1,
  CONSTANT_Integer = 3,
  CONSTANT_Float = 4,
  CONSTANT_Long = 5,
  CONSTANT_Double = 6,
  CONSTANT_Class = 7,
  CONSTANT_String = 8,
  CONSTANT_Fieldref = 9,
  CONSTANT_Methodref = 10,
  CONSTANT_InterfaceMethodref = 11,
  CONSTANT_NameAndType = 12,
  CONSTANT_MethodHandle = 15,
  CONSTANT_MethodType = 16,
  CONSTANT_Dynamic = 17,
  CONSTANT_InvokeDynamic = 18,
  CONSTANT_Module = 19,
  CONSTANT_Package = 20,
};

/// The parts of a JVM class file that desugaring depends on. Class names are
/// in internal form, e.g. "java/lang/Runnable".
///
/// Only the header up to the interfaces table is read; fields, methods and
/// attributes are ignored.
struct ClassFile {
  uint16_t major_version = 0;
  uint16_t minor_version = 0;
  uint16_t access_flags = 0;
  string this_class;
  /// Empty for java/lang/Object, the only class without a super class.
  string super_class;
  vector<string> interfaces;
  /// Functional interfaces implemented by lambdas and method references in
  /// this class: the return type of every invokedynamic call site.
  vector<string> lambda_interfaces;

  /// Decode |data|. Malformed or truncated input fails with |err| set.
  bool Parse(StringPiece data, string* err);

  /// The classes whose bytecode desugaring of this class reads: the super
  /// class, the interfaces and the lambda interfaces. Sorted, without
  /// duplicates and without this class itself.
  vector<string> DesugarDependencies() const;
};

/// "a/b/C" -> "a/b/C.class".
string ClassNameToPath(const string& class_name);

#endif  // INCDEX_CLASS_FILE_H_
