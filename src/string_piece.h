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

#ifndef INCDEX_STRING_PIECE_H_
#define INCDEX_STRING_PIECE_H_

#include <string.h>

#include <algorithm>
#include <string>

using namespace std;

/// A read-only view of bytes owned elsewhere, typically a file loaded into
/// memory. Class files and the desugar graph are binary, so the bytes may
/// contain NULs.
struct StringPiece {
  static constexpr size_t npos = static_cast<size_t>(-1);

  constexpr StringPiece() : str_(nullptr), len_(0) {}
  constexpr StringPiece(const char* str, size_t len) : str_(str), len_(len) {}

  /// Implicit on purpose, so that strings and literals can be passed
  /// wherever a StringPiece is expected.
  StringPiece(const string& str) : str_(str.data()), len_(str.size()) {}
  StringPiece(const char* str) : str_(str), len_(strlen(str)) {}

  string AsString() const {
    return len_ ? string(str_, len_) : string();
  }

  constexpr const char* data() const { return str_; }
  constexpr size_t size() const { return len_; }
  constexpr bool empty() const { return len_ == 0; }
  constexpr char operator[](size_t pos) const { return str_[pos]; }

  void remove_prefix(size_t n) { str_ += n; len_ -= n; }
  void remove_suffix(size_t n) { len_ -= n; }

  /// The bytes starting at |pos|, at most |count| of them. |pos| must not be
  /// past the end.
  StringPiece substr(size_t pos, size_t count = npos) const {
    return StringPiece(str_ + pos, std::min(count, len_ - pos));
  }

  /// Offset of the first |c| at or after |pos|, or npos.
  size_t find(char c, size_t pos = 0) const {
    if (pos >= len_)
      return npos;
    const void* found = memchr(str_ + pos, c, len_ - pos);
    return found ? static_cast<const char*>(found) - str_ : npos;
  }

 private:
  const char* str_;
  size_t len_;
};

inline bool operator==(StringPiece x, StringPiece y) {
  if (x.size() != y.size())
    return false;
  if (x.empty())  // memcmp(NULL, NULL, 0) has undefined behavior.
    return true;
  return memcmp(x.data(), y.data(), x.size()) == 0;
}

inline bool operator!=(StringPiece x, StringPiece y) {
  return !(x == y);
}

#endif  // INCDEX_STRING_PIECE_H_
