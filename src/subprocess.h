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

#ifndef INCDEX_SUBPROCESS_H_
#define INCDEX_SUBPROCESS_H_

#include <sys/types.h>

#include <string>
using namespace std;

#include "exit_status.h"

/// Subprocess wraps a single async subprocess.  Its stdout and stderr are
/// captured together into one buffer; stdin is /dev/null.
struct Subprocess {
  Subprocess() {}
  ~Subprocess();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  /// Run |command| through /bin/sh. Returns false and fills |err| if the
  /// process could not be spawned.
  bool Start(const string& command, string* err);

  /// Read the child's output until it closes it, then reap the child.
  ExitStatus Finish();

  const string& GetOutput() const { return buf_; }

 private:
  string buf_;
  int fd_ = -1;
  pid_t pid_ = -1;
};

/// Convenience wrapper: run |command| to completion, storing its combined
/// output in |output|.
ExitStatus RunCommand(const string& command, string* output);

#endif  // INCDEX_SUBPROCESS_H_
