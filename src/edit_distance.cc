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

#include <algorithm>
#include <vector>

using namespace std;

int EditDistance(StringPiece from, StringPiece to, int max_distance) {
  // Row |i| holds the distance between the first i characters of |from| and
  // every prefix of |to|. Only the previous row is needed for the next one.
  const int m = static_cast<int>(from.size());
  const int n = static_cast<int>(to.size());
  vector<int> previous(n + 1), current(n + 1);
  for (int j = 0; j <= n; ++j)
    previous[j] = j;

  for (int i = 1; i <= m; ++i) {
    current[0] = i;
    int row_best = current[0];
    for (int j = 1; j <= n; ++j) {
      int substitution =
          previous[j - 1] + (from[i - 1] == to[j - 1] ? 0 : 1);
      current[j] = min(substitution, min(previous[j], current[j - 1]) + 1);
      row_best = min(row_best, current[j]);
    }
    if (max_distance && row_best > max_distance)
      return max_distance + 1;
    previous.swap(current);
  }
  return previous[n];
}
