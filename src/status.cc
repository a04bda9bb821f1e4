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

#include "status.h"

#include <stdarg.h>
#include <stdio.h>

#include "dexing_transform.h"
#include "util.h"

StatusPrinter::StatusPrinter(const DexingConfig& config)
    : config_(config) {}

void StatusPrinter::PlanHasTotalFiles(int total) {
  std::lock_guard<std::mutex> lock(mutex_);
  total_files_ = total;
}

void StatusPrinter::TransformStarted(bool incremental, const string& input) {
  if (config_.verbosity == DexingConfig::QUIET)
    return;
  printf("incdex: dexing '%s' %s\n", input.c_str(),
         incremental ? "incrementally" : "non-incrementally");
  fflush(stdout);
}

void StatusPrinter::FileStarted(const string& relative_path,
                                const string& command) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++started_files_;
  if (config_.verbosity == DexingConfig::VERBOSE && !command.empty()) {
    printf("%s\n", command.c_str());
    fflush(stdout);
  }
}

void StatusPrinter::FileFinished(const string& relative_path, bool success,
                                 const string& output) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++finished_files_;
  if (!success)
    ++failed_files_;

  if (config_.verbosity != DexingConfig::QUIET || !success) {
    FILE* stream = success ? stdout : stderr;
    fprintf(stream, "[%d/%d] %sDEX %s\n", finished_files_, total_files_,
            success ? "" : "FAILED: ", relative_path.c_str());
  }
  if (!output.empty()) {
    fwrite(output.data(), 1, output.size(), success ? stdout : stderr);
    if (output[output.size() - 1] != '\n')
      fputc('\n', success ? stdout : stderr);
  }
  fflush(stdout);
}

void StatusPrinter::TransformFinished() {
  if (config_.verbosity == DexingConfig::QUIET)
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (finished_files_ == 0)
    printf("incdex: no work to do.\n");
  fflush(stdout);
}

void StatusPrinter::Info(const char* msg, ...) {
  if (config_.verbosity == DexingConfig::QUIET)
    return;
  va_list ap;
  va_start(ap, msg);
  ::Info(msg, ap);
  va_end(ap);
}

void StatusPrinter::Warning(const char* msg, ...) {
  va_list ap;
  va_start(ap, msg);
  ::Warning(msg, ap);
  va_end(ap);
}

void StatusPrinter::Error(const char* msg, ...) {
  va_list ap;
  va_start(ap, msg);
  ::Error(msg, ap);
  va_end(ap);
}

void StatusPrinter::Debug(const char* msg, ...) {
  va_list ap;
  va_start(ap, msg);
  vfprintf(stdout, msg, ap);
  va_end(ap);
  fputc('\n', stdout);
}
