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

#ifndef INCDEX_DEXING_TRANSFORM_H_
#define INCDEX_DEXING_TRANSFORM_H_

#include <stdint.h>

#include <memory>
#include <string>
#include <vector>
using namespace std;

#include "dex_builder.h"

struct DesugarGraph;
struct DiskInterface;
struct InputSnapshot;
struct Status;
struct ThreadPool;

/// Options influencing the behavior of a dexing run.
struct DexingConfig {
  enum Verbosity {
    QUIET,  // No output -- used when testing.
    NORMAL,
    VERBOSE
  };
  Verbosity verbosity = NORMAL;
  bool dry_run = false;
  /// Number of class files converted at once. 0 picks a default.
  int parallelism = 0;
  /// Ignore the state of the previous run.
  bool force_full = false;
  DexParameters dex_parameters;
  /// Desugaring classpath. Dependencies on it cannot be tracked, so a non
  /// empty classpath disables incremental runs.
  string classpath;
  /// Command template for CommandDexArchiveBuilder.
  string command;
  string input_dir;
  string output_dir;
};

/// Name of the persisted graph inside the output directory.
extern const char kDesugarGraphFileName[];
/// Name of the input snapshot inside the output directory.
extern const char kInputSnapshotFileName[];

/// Converts a directory of class files to one dex file per class, reusing
/// the outputs of the previous run where the desugaring dependency graph
/// proves them up to date.
///
/// Layout of the output directory:
///   dex/                 one .dex per class file
///   global_synthetics/   one .globals per class file, if enabled
///   desugar_graph.bin    the graph, see DesugarGraphLog
///   inputs.log           the input snapshot, see InputSnapshot
struct DexingTransform {
  DexingTransform(const DexingConfig& config, DiskInterface* disk_interface,
                  DexArchiveBuilder* builder, Status* status);
  ~DexingTransform();

  /// Bring the output directory up to date with the input directory.
  bool Run(string* err);

  /// Incremental runs need every node to be relative to the input directory,
  /// which only holds without a classpath.
  bool IsIncrementalSupported() const { return config_.classpath.empty(); }

  /// Hash of every setting that changes the content of the outputs. Outputs
  /// built under a different hash cannot be reused.
  uint64_t ParametersHash() const;

  /// Whether the last Run() was incremental.
  bool ran_incrementally() const { return ran_incrementally_; }

  /// Class files converted by the last Run(), sorted.
  const vector<string>& processed_files() const { return processed_files_; }

  string dex_output_dir() const;
  string globals_output_dir() const;
  string graph_path() const;
  string snapshot_path() const;

 private:
  bool ProcessIncrementally(const InputSnapshot& previous,
                            const InputSnapshot& current, DesugarGraph* graph,
                            string* err);
  bool ProcessNonIncrementally(const InputSnapshot& current,
                               DesugarGraph* graph, string* err);

  /// Convert |files| (relative to the input directory) in parallel.
  bool ConvertFiles(const vector<string>& files,
                    DependencyGraphUpdater* graph_updater, string* err);

  /// Delete the dex and global synthetics outputs of one class file.
  bool RemoveOutputs(const string& class_file, string* err);

  /// Write the graph and the snapshot for the next run.
  bool SaveState(DesugarGraph* graph, InputSnapshot* current, string* err);

  /// Make sure the next run is non-incremental.
  void DiscardState();

  DexRequest MakeRequest(const string& class_file) const;

  const DexingConfig& config_;
  DiskInterface* disk_interface_;
  DexArchiveBuilder* builder_;
  Status* status_;
  std::unique_ptr<ThreadPool> thread_pool_;

  bool ran_incrementally_ = false;
  vector<string> processed_files_;
};

#endif  // INCDEX_DEXING_TRANSFORM_H_
