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

#include "test.h"

namespace {

TEST(Subprocess, CapturesOutput) {
  string output;
  EXPECT_EQ(ExitSuccess, RunCommand("echo hello", &output));
  EXPECT_EQ("hello\n", output);
}

TEST(Subprocess, MergesStderr) {
  string output;
  EXPECT_EQ(ExitSuccess, RunCommand("echo out; echo err 1>&2", &output));
  EXPECT_EQ("out\nerr\n", output);
}

TEST(Subprocess, BadCommand) {
  string output;
  EXPECT_EQ(ExitFailure, RunCommand("cmd_that_does_not_exist", &output));
  EXPECT_NE("", output);
}

TEST(Subprocess, NonZeroExit) {
  string output;
  EXPECT_EQ(ExitFailure, RunCommand("exit 3", &output));
  EXPECT_EQ("", output);
}

TEST(Subprocess, InterruptChild) {
  string output;
  EXPECT_EQ(ExitInterrupted, RunCommand("kill -INT $$", &output));
}

TEST(Subprocess, InterruptChildWithSigTerm) {
  string output;
  EXPECT_EQ(ExitInterrupted, RunCommand("kill -TERM $$", &output));
}

TEST(Subprocess, ReadStdin) {
  // stdin is /dev/null, so a command waiting for input finishes right away.
  string output;
  EXPECT_EQ(ExitSuccess, RunCommand("cat - && echo done", &output));
  EXPECT_EQ("done\n", output);
}

TEST(Subprocess, LargeOutput) {
  string output;
  EXPECT_EQ(ExitSuccess,
            RunCommand("head -c 100000 /dev/zero | tr '\\0' x", &output));
  EXPECT_EQ(string(100000, 'x'), output);
}

TEST(Subprocess, StartAndFinish) {
  Subprocess subprocess;
  string err;
  ASSERT_TRUE(subprocess.Start("printf abc", &err)) << err;
  EXPECT_EQ(ExitSuccess, subprocess.Finish());
  EXPECT_EQ("abc", subprocess.GetOutput());
}

}  // anonymous namespace
