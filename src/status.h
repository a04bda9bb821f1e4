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

#ifndef INCDEX_STATUS_H_
#define INCDEX_STATUS_H_

#include <stdarg.h>

#include <mutex>
#include <string>
using namespace std;

struct DexingConfig;

/// Abstract interface to object that tracks the status of a dexing run:
/// progress of class file conversion and diagnostic messages.
struct Status {
  virtual void PlanHasTotalFiles(int total) = 0;
  virtual void TransformStarted(bool incremental, const string& input) = 0;
  virtual void FileStarted(const string& relative_path,
                           const string& command) = 0;
  virtual void FileFinished(const string& relative_path, bool success,
                            const string& output) = 0;
  virtual void TransformFinished() = 0;

  virtual void Info(const char* msg, ...) = 0;
  virtual void Warning(const char* msg, ...) = 0;
  virtual void Error(const char* msg, ...) = 0;
  virtual void Debug(const char* msg, ...) = 0;

  virtual ~Status() { }
};

/// Implementation of the Status interface that prints the status as
/// human-readable lines to the terminal. FileStarted and FileFinished may be
/// called from worker threads.
struct StatusPrinter : Status {
  explicit StatusPrinter(const DexingConfig& config);

  virtual void PlanHasTotalFiles(int total);
  virtual void TransformStarted(bool incremental, const string& input);
  virtual void FileStarted(const string& relative_path, const string& command);
  virtual void FileFinished(const string& relative_path, bool success,
                            const string& output);
  virtual void TransformFinished();

  virtual void Info(const char* msg, ...);
  virtual void Warning(const char* msg, ...);
  virtual void Error(const char* msg, ...);
  virtual void Debug(const char* msg, ...);

  virtual ~StatusPrinter() { }

  int started_files() const { return started_files_; }
  int finished_files() const { return finished_files_; }
  int failed_files() const { return failed_files_; }

 private:
  const DexingConfig& config_;

  std::mutex mutex_;
  int started_files_ = 0;
  int finished_files_ = 0;
  int failed_files_ = 0;
  int total_files_ = 0;
};

#endif  // INCDEX_STATUS_H_
