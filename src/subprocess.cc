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

#include "subprocess.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include "util.h"

extern char** environ;

Subprocess::~Subprocess() {
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
  // Reap child if forgotten.
  if (pid_ != -1)
    Finish();
}

bool Subprocess::Start(const string& command, string* err) {
  // Both ends are close-on-exec so that children spawned concurrently from
  // other worker threads don't hold this pipe open.
  int output_pipe[2];
  if (pipe2(output_pipe, O_CLOEXEC) < 0) {
    *err = string("pipe: ") + strerror(errno);
    return false;
  }
  fd_ = output_pipe[0];

  posix_spawn_file_actions_t action;
  int result = posix_spawn_file_actions_init(&action);
  if (result != 0)
    Fatal("posix_spawn_file_actions_init: %s", strerror(result));

  result = posix_spawn_file_actions_addclose(&action, output_pipe[0]);
  if (result != 0)
    Fatal("posix_spawn_file_actions_addclose: %s", strerror(result));

  posix_spawnattr_t attr;
  result = posix_spawnattr_init(&attr);
  if (result != 0)
    Fatal("posix_spawnattr_init: %s", strerror(result));

  short flags = 0;
  sigset_t set;
  sigemptyset(&set);
  result = posix_spawnattr_setsigmask(&attr, &set);
  if (result != 0)
    Fatal("posix_spawnattr_setsigmask: %s", strerror(result));
  flags |= POSIX_SPAWN_SETSIGMASK;

  // Open /dev/null over stdin.
  result = posix_spawn_file_actions_addopen(&action, 0, "/dev/null", O_RDONLY,
                                            0);
  if (result != 0)
    Fatal("posix_spawn_file_actions_addopen: %s", strerror(result));

  result = posix_spawn_file_actions_adddup2(&action, output_pipe[1], 1);
  if (result != 0)
    Fatal("posix_spawn_file_actions_adddup2: %s", strerror(result));
  result = posix_spawn_file_actions_adddup2(&action, output_pipe[1], 2);
  if (result != 0)
    Fatal("posix_spawn_file_actions_adddup2: %s", strerror(result));
  result = posix_spawn_file_actions_addclose(&action, output_pipe[1]);
  if (result != 0)
    Fatal("posix_spawn_file_actions_addclose: %s", strerror(result));

  result = posix_spawnattr_setflags(&attr, flags);
  if (result != 0)
    Fatal("posix_spawnattr_setflags: %s", strerror(result));

  const char* spawned_args[] = { "/bin/sh", "-c", command.c_str(), NULL };
  result = posix_spawn(&pid_, "/bin/sh", &action, &attr,
                       const_cast<char**>(spawned_args), environ);
  posix_spawnattr_destroy(&attr);
  posix_spawn_file_actions_destroy(&action);
  close(output_pipe[1]);

  if (result != 0) {
    pid_ = -1;
    *err = string("posix_spawn: ") + strerror(result);
    return false;
  }
  return true;
}

ExitStatus Subprocess::Finish() {
  if (fd_ >= 0) {
    char buf[4 << 10];
    while (true) {
      ssize_t len = read(fd_, buf, sizeof(buf));
      if (len > 0) {
        buf_.append(buf, len);
      } else if (len < 0 && errno == EINTR) {
        continue;
      } else {
        break;
      }
    }
    close(fd_);
    fd_ = -1;
  }

  if (pid_ == -1)
    return ExitFailure;

  int status;
  while (waitpid(pid_, &status, 0) < 0) {
    if (errno != EINTR)
      Fatal("waitpid(%d): %s", pid_, strerror(errno));
  }
  pid_ = -1;

  if (WIFEXITED(status)) {
    int exit = WEXITSTATUS(status);
    if (exit == 0)
      return ExitSuccess;
  } else if (WIFSIGNALED(status)) {
    if (WTERMSIG(status) == SIGINT || WTERMSIG(status) == SIGTERM
        || WTERMSIG(status) == SIGHUP)
      return ExitInterrupted;
  }
  return ExitFailure;
}

ExitStatus RunCommand(const string& command, string* output) {
  Subprocess subprocess;
  string err;
  if (!subprocess.Start(command, &err)) {
    *output = err;
    return ExitFailure;
  }
  ExitStatus status = subprocess.Finish();
  *output = subprocess.GetOutput();
  return status;
}
