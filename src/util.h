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

#ifndef INCDEX_UTIL_H_
#define INCDEX_UTIL_H_

#include <limits.h>
#include <stdarg.h>
#include <stdint.h>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>
using namespace std;

#define NORETURN __attribute__((noreturn))

// Diagnostics, printed as "incdex: <level>: <message>". Warnings and errors
// go to stderr, informational messages to stdout. Code that runs during a
// transform reports through Status instead.

/// Print a fatal message and exit immediately. Only call this from the main
/// thread, before or after the conversion workers run.
NORETURN void Fatal(const char* msg, ...);

void Warning(const char* msg, ...);
void Warning(const char* msg, va_list ap);

void Error(const char* msg, ...);
void Error(const char* msg, va_list ap);

void Info(const char* msg, ...);
void Info(const char* msg, va_list ap);

/// Canonicalize a path like "foo/../bar.class" into just "bar.class".
/// Leading "/" is preserved. Returns false and fills |err| for an empty path.
bool CanonicalizePath(string* path, string* err);

/// Express |path| relative to the directory |root|. Both are canonicalized
/// first. Returns false (and fills |err|) when |path| is not strictly inside
/// |root|.
bool RelativizePath(const string& root, const string& path, string* relative,
                    string* err);

/// Join a directory and a relative path with a single '/'.
string JoinPath(const string& dir, const string& relative);

/// Return the directory part of |path|, or "" if it has none.
string DirName(const string& path);

/// True if |str| ends with |suffix|.
bool EndsWith(const string& str, const string& suffix);

/// Append |input| to |result|, single-quoted for /bin/sh unless every
/// character is known to be safe. Inner class files ("Foo$1.class") always
/// need quoting.
void GetShellEscapedString(const string& input, string* result);

/// Read a whole file from the real disk. Returns 0, or -errno with a
/// message in |err|.
int ReadFile(const string& path, string* contents, string* err);

/// The entry of |words| closest to the misspelled |text|, or NULL if none is
/// within a few edits.
const char* SpellcheckStringV(const string& text,
                              const vector<const char*>& words);

/// Like SpellcheckStringV, but takes a NULL-terminated list.
const char* SpellcheckString(const char* text, ...);

/// Number of online processors, or 0 if it can't be determined.
int GetProcessorCount();

/// 64 bit MurmurHash2 of |len| bytes at |key|. Stable across runs, so it can
/// be persisted.
uint64_t MurmurHash64A(const void* key, size_t len);

/// Split [0, total) into at most |count| contiguous ranges of equal size,
/// the last one possibly shorter.
template <typename T, typename C>
std::vector<std::pair<T, T>> SplitByCount(T total, C count) {
  std::vector<std::pair<T, T>> ranges;
  if (total == 0 || count <= 0)
    return ranges;
  T chunk_size = (total + count - 1) / count;
  for (T start = 0; start < total; start += chunk_size)
    ranges.emplace_back(start, std::min<T>(start + chunk_size, total));
  return ranges;
}

/// Copy the first non-empty entry of |subtask_err| to |err| and return false,
/// or return true if every subtask succeeded.
bool PropagateError(std::string* err,
                    const std::vector<std::string>& subtask_err);

#endif  // INCDEX_UTIL_H_
