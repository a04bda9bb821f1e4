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

#ifndef INCDEX_TIMESTAMP_H_
#define INCDEX_TIMESTAMP_H_

#include <stdint.h>

// When considering file modification times we only care to compare
// them against one another -- we never convert them to an absolute
// real time.  We use nanoseconds since the epoch, which fits in an int64.
// Use an int64 so that we can use 0 to mean "does not exist" and -1 to
// mean "could not stat".
typedef int64_t TimeStamp;

#endif  // INCDEX_TIMESTAMP_H_
