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

#include "edit_distance.h"

#include "test.h"

TEST(EditDistance, TestEmpty) {
  EXPECT_EQ(5, EditDistance("", "graph"));
  EXPECT_EQ(5, EditDistance("graph", ""));
  EXPECT_EQ(0, EditDistance("", ""));
}

TEST(EditDistance, TestMaxDistance) {
  const int kMaxDistance = 3;
  EXPECT_EQ(kMaxDistance + 1,
            EditDistance("abcdefghijklmnop", "ponmlkjihgfedcba", kMaxDistance));
}

TEST(EditDistance, TestTypos) {
  EXPECT_EQ(0, EditDistance("dependents", "dependents"));
  EXPECT_EQ(1, EditDistance("dependent", "dependents"));
  // Swapped letters count as two edits.
  EXPECT_EQ(2, EditDistance("grpah", "graph"));
  EXPECT_EQ(2, EditDistance("chnages", "changes"));
  EXPECT_EQ(1, EditDistance("lisr", "list"));
  EXPECT_EQ(3, EditDistance("kitten", "sitting"));
}

TEST(EditDistance, BinaryData) {
  EXPECT_EQ(1, EditDistance(StringPiece("a\0b", 3), StringPiece("a\0c", 3)));
}
