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

#ifndef INCDEX_EDIT_DISTANCE_H_
#define INCDEX_EDIT_DISTANCE_H_

#include "string_piece.h"

/// Levenshtein distance between |from| and |to|, used to suggest a tool or
/// debug mode when the user misspells one. Once every partial alignment is
/// worse than |max_distance| (if non-zero) the search stops and
/// |max_distance| + 1 is returned.
int EditDistance(StringPiece from, StringPiece to, int max_distance = 0);

#endif  // INCDEX_EDIT_DISTANCE_H_
