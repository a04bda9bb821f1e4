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

#include "test.h"

namespace {

string Canonical(string path) {
  string err;
  EXPECT_TRUE(CanonicalizePath(&path, &err)) << err;
  return path;
}

}  // anonymous namespace

TEST(CanonicalizePath, PathSamples) {
  EXPECT_EQ("foo/bar.class", Canonical("foo/./bar.class"));
  EXPECT_EQ("bar.class", Canonical("foo/../bar.class"));
  EXPECT_EQ("a/B.class", Canonical("./a/B.class"));
  EXPECT_EQ("a/b", Canonical("a//b/"));
  EXPECT_EQ(".", Canonical("a/.."));
  EXPECT_EQ(".", Canonical("./"));
  EXPECT_EQ("../a", Canonical("../a"));
  EXPECT_EQ("../../a", Canonical("x/../../../a"));
}

TEST(CanonicalizePath, AbsolutePaths) {
  EXPECT_EQ("/", Canonical("/"));
  EXPECT_EQ("/usr/lib", Canonical("/usr//lib/."));
  EXPECT_EQ("/", Canonical("/a/../.."));
  EXPECT_EQ("/b", Canonical("/../b"));
}

TEST(CanonicalizePath, EmptyPath) {
  string path, err;
  EXPECT_FALSE(CanonicalizePath(&path, &err));
  EXPECT_EQ("empty path", err);
}

TEST(RelativizePath, InsideRoot) {
  string relative, err;
  EXPECT_TRUE(RelativizePath("in", "in/a/B.class", &relative, &err));
  EXPECT_EQ("a/B.class", relative);
  EXPECT_TRUE(RelativizePath("in/", "./in/x/../C.class", &relative, &err));
  EXPECT_EQ("C.class", relative);
  EXPECT_TRUE(RelativizePath("/", "/tmp/D.class", &relative, &err));
  EXPECT_EQ("tmp/D.class", relative);
  EXPECT_TRUE(RelativizePath(".", "a/b", &relative, &err));
  EXPECT_EQ("a/b", relative);
}

TEST(RelativizePath, OutsideRoot) {
  string relative, err;
  EXPECT_FALSE(RelativizePath("in", "in", &relative, &err));
  EXPECT_FALSE(RelativizePath("in", "inner/A.class", &relative, &err));
  EXPECT_EQ("'inner/A.class' is not under 'in'", err);
  EXPECT_FALSE(RelativizePath("in", "in/../out/A.class", &relative, &err));
  EXPECT_FALSE(RelativizePath(".", "../A.class", &relative, &err));
  EXPECT_FALSE(RelativizePath(".", "/A.class", &relative, &err));
  EXPECT_FALSE(RelativizePath("/in", "in/A.class", &relative, &err));
}

TEST(JoinPath, Basic) {
  EXPECT_EQ("a", JoinPath("", "a"));
  EXPECT_EQ("a", JoinPath(".", "a"));
  EXPECT_EQ("d/a", JoinPath("d", "a"));
  EXPECT_EQ("d/a", JoinPath("d/", "a"));
  EXPECT_EQ("d", JoinPath("d", ""));
  EXPECT_EQ("/a", JoinPath("/", "a"));
}

TEST(DirName, Basic) {
  EXPECT_EQ("a/b", DirName("a/b/C.class"));
  EXPECT_EQ("", DirName("C.class"));
  EXPECT_EQ("/", DirName("/C.class"));
  EXPECT_EQ("a", DirName("a//C.class"));
}

TEST(EndsWith, Basic) {
  EXPECT_TRUE(EndsWith("A.class", ".class"));
  EXPECT_TRUE(EndsWith(".class", ".class"));
  EXPECT_FALSE(EndsWith("class", ".class"));
  EXPECT_FALSE(EndsWith("A.clas", ".class"));
}

TEST(ShellEscapedString, Safe) {
  string result;
  GetShellEscapedString("out/dex/a/B_1.dex", &result);
  EXPECT_EQ("out/dex/a/B_1.dex", result);
}

TEST(ShellEscapedString, Spaces) {
  string result;
  GetShellEscapedString("my dir/A.class", &result);
  EXPECT_EQ("'my dir/A.class'", result);
}

TEST(ShellEscapedString, InnerClass) {
  string result;
  GetShellEscapedString("a/B$1.class", &result);
  EXPECT_EQ("'a/B$1.class'", result);
}

TEST(ShellEscapedString, Quotes) {
  string result = "x ";
  GetShellEscapedString("it's", &result);
  EXPECT_EQ("x 'it'\\''s'", result);
}

TEST(Spellcheck, ClosestMatch) {
  EXPECT_STREQ("graph",
               SpellcheckString("grpah", "graph", "dependents", NULL));
  EXPECT_STREQ("dependents",
               SpellcheckString("dependent", "graph", "dependents", NULL));
  EXPECT_TRUE(SpellcheckString("recompact-everything", "graph", NULL) ==
              NULL);
}

TEST(SplitByCount, Basic) {
  vector<pair<size_t, size_t> > expected = {
    { 0, 4 }, { 4, 8 }, { 8, 10 },
  };
  EXPECT_EQ(expected, SplitByCount<size_t>(10, 3));
  EXPECT_TRUE(SplitByCount<size_t>(0, 3).empty());
  EXPECT_EQ(5u, SplitByCount<size_t>(5, 8).size());
}

TEST(PropagateError, FirstError) {
  string err;
  EXPECT_TRUE(PropagateError(&err, { "", "" }));
  EXPECT_EQ("", err);
  EXPECT_FALSE(PropagateError(&err, { "", "first", "second" }));
  EXPECT_EQ("first", err);
}

TEST(MurmurHash64A, KnownValues) {
  // The hash is persisted, so it must never change.
  EXPECT_EQ(0x87c2bc0beaf1d91dull, MurmurHash64A("", 0));
  EXPECT_EQ(0x90fcb1aca689663eull, MurmurHash64A("a", 1));
  EXPECT_EQ(0xdaa5376fbfb6534full, MurmurHash64A("incdex", 6));
  EXPECT_EQ(0xae2973882d089065ull, MurmurHash64A("0123456789abcdef!", 17));
}
