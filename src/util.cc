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

#include "util.h"

#include <assert.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <vector>

#include "edit_distance.h"

namespace {

void LogMessage(FILE* stream, const char* prefix, const char* msg,
                va_list ap) {
  fprintf(stream, "incdex: %s", prefix);
  vfprintf(stream, msg, ap);
  fputc('\n', stream);
}

}  // anonymous namespace

void Fatal(const char* msg, ...) {
  va_list ap;
  va_start(ap, msg);
  LogMessage(stderr, "fatal: ", msg, ap);
  va_end(ap);
  // Worker threads may hold locks that exit() would wait for.
  fflush(stderr);
  fflush(stdout);
  _exit(1);
}

void Warning(const char* msg, va_list ap) {
  LogMessage(stderr, "warning: ", msg, ap);
}

void Warning(const char* msg, ...) {
  va_list ap;
  va_start(ap, msg);
  Warning(msg, ap);
  va_end(ap);
}

void Error(const char* msg, va_list ap) {
  LogMessage(stderr, "error: ", msg, ap);
}

void Error(const char* msg, ...) {
  va_list ap;
  va_start(ap, msg);
  Error(msg, ap);
  va_end(ap);
}

void Info(const char* msg, va_list ap) {
  LogMessage(stdout, "", msg, ap);
}

void Info(const char* msg, ...) {
  va_list ap;
  va_start(ap, msg);
  Info(msg, ap);
  va_end(ap);
}

bool CanonicalizePath(string* path, string* err) {
  if (path->empty()) {
    *err = "empty path";
    return false;
  }

  const bool absolute = (*path)[0] == '/';
  vector<string> components;
  size_t start = 0;
  while (start <= path->size()) {
    size_t end = path->find('/', start);
    if (end == string::npos)
      end = path->size();
    string component = path->substr(start, end - start);
    start = end + 1;

    if (component.empty() || component == ".")
      continue;
    if (component == "..") {
      if (!components.empty() && components.back() != "..") {
        components.pop_back();
        continue;
      }
      // ".." above the root of an absolute path stays at the root.
      if (absolute)
        continue;
    }
    components.push_back(component);
  }

  string result = absolute ? "/" : "";
  for (size_t i = 0; i < components.size(); ++i) {
    if (i > 0)
      result += '/';
    result += components[i];
  }
  if (result.empty())
    result = ".";
  path->swap(result);
  return true;
}

bool RelativizePath(const string& root, const string& path, string* relative,
                    string* err) {
  string canonical_root = root;
  string canonical_path = path;
  if (!CanonicalizePath(&canonical_root, err) ||
      !CanonicalizePath(&canonical_path, err))
    return false;

  string prefix = canonical_root;
  if (prefix == ".") {
    prefix.clear();
  } else if (prefix != "/") {
    prefix += '/';
  }

  if (prefix.empty()) {
    // A relative root of "." contains every relative path that stays below it.
    if (canonical_path[0] == '/' || canonical_path == "." ||
        canonical_path.compare(0, 3, "../") == 0 || canonical_path == "..") {
      *err = "'" + path + "' is not under '" + root + "'";
      return false;
    }
    *relative = canonical_path;
    return true;
  }

  if (canonical_path.size() <= prefix.size() ||
      canonical_path.compare(0, prefix.size(), prefix) != 0) {
    *err = "'" + path + "' is not under '" + root + "'";
    return false;
  }
  *relative = canonical_path.substr(prefix.size());
  return true;
}

string JoinPath(const string& dir, const string& relative) {
  if (dir.empty() || dir == ".")
    return relative;
  if (relative.empty())
    return dir;
  if (dir[dir.size() - 1] == '/')
    return dir + relative;
  return dir + "/" + relative;
}

string DirName(const string& path) {
  string::size_type slash_pos = path.find_last_of('/');
  if (slash_pos == string::npos)
    return string();  // Nothing to do.
  while (slash_pos > 0 && path[slash_pos - 1] == '/')
    --slash_pos;
  if (slash_pos == 0)
    return "/";
  return path.substr(0, slash_pos);
}

bool EndsWith(const string& str, const string& suffix) {
  return str.size() >= suffix.size() &&
      str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static inline bool IsKnownShellSafeCharacter(char ch) {
  if ('A' <= ch && ch <= 'Z') return true;
  if ('a' <= ch && ch <= 'z') return true;
  if ('0' <= ch && ch <= '9') return true;

  switch (ch) {
    case '_':
    case '+':
    case '-':
    case '.':
    case '/':
      return true;
    default:
      return false;
  }
}

static inline bool StringNeedsShellEscaping(const string& input) {
  for (size_t i = 0; i < input.size(); ++i) {
    if (!IsKnownShellSafeCharacter(input[i])) return true;
  }
  return false;
}

void GetShellEscapedString(const string& input, string* result) {
  assert(result);

  if (!StringNeedsShellEscaping(input)) {
    result->append(input);
    return;
  }

  const char kQuote = '\'';
  const char kEscapeSequence[] = "'\\'";

  result->push_back(kQuote);

  string::const_iterator span_begin = input.begin();
  for (string::const_iterator it = input.begin(), end = input.end(); it != end;
       ++it) {
    if (*it == kQuote) {
      result->append(span_begin, it);
      result->append(kEscapeSequence);
      span_begin = it;
    }
  }
  result->append(span_begin, input.end());
  result->push_back(kQuote);
}

int ReadFile(const string& path, string* contents, string* err) {
  FILE* f = fopen(path.c_str(), "rb");
  if (!f) {
    err->assign(strerror(errno));
    return -errno;
  }

  struct stat st;
  if (fstat(fileno(f), &st) < 0) {
    err->assign(strerror(errno));
    fclose(f);
    return -errno;
  }

  contents->reserve(st.st_size);

  char buf[64 << 10];
  size_t len;
  while (!feof(f) && (len = fread(buf, 1, sizeof(buf), f)) > 0) {
    contents->append(buf, len);
  }
  if (ferror(f)) {
    err->assign(strerror(errno));
    contents->clear();
    fclose(f);
    return -errno;
  }
  fclose(f);
  return 0;
}

const char* SpellcheckStringV(const string& text,
                              const vector<const char*>& words) {
  const int kMaxValidEditDistance = 3;

  int min_distance = kMaxValidEditDistance + 1;
  const char* result = NULL;
  for (const char* word : words) {
    int distance = EditDistance(word, text, kMaxValidEditDistance);
    if (distance < min_distance) {
      min_distance = distance;
      result = word;
    }
  }
  return result;
}

const char* SpellcheckString(const char* text, ...) {
  // Note: This takes a const char* instead of a string& because using
  // va_start() with a reference parameter is undefined behavior.
  va_list ap;
  va_start(ap, text);
  vector<const char*> words;
  const char* word;
  while ((word = va_arg(ap, const char*)))
    words.push_back(word);
  va_end(ap);
  return SpellcheckStringV(text, words);
}

// 64bit MurmurHash2, by Austin Appleby
uint64_t MurmurHash64A(const void* key, size_t len) {
  const uint64_t seed = 0xDECAFBADDECAFBADull;
  const uint64_t m = 0xc6a4a7935bd1e995ull;
  const int r = 47;
  uint64_t h = seed ^ (len * m);
  const unsigned char* data = static_cast<const unsigned char*>(key);
  for (; len >= 8; data += 8, len -= 8) {
    uint64_t k;
    memcpy(&k, data, sizeof(k));
    k *= m;
    k ^= k >> r;
    k *= m;
    h ^= k;
    h *= m;
  }
  if (len > 0) {
    for (size_t i = len; i > 0; --i)
      h ^= uint64_t(data[i - 1]) << (8 * (i - 1));
    h *= m;
  }
  h ^= h >> r;
  h *= m;
  h ^= h >> r;
  return h;
}

int GetProcessorCount() {
  long count = sysconf(_SC_NPROCESSORS_ONLN);
  return count > 0 ? static_cast<int>(count) : 0;
}

bool PropagateError(std::string* err,
                    const std::vector<std::string>& subtask_err) {
  for (const std::string& e : subtask_err) {
    if (!e.empty()) {
      *err = e;
      return false;
    }
  }
  return true;
}
