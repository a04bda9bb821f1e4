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

#include "dexing_transform.h"

#include <inttypes.h>
#include <stdio.h>

#include <algorithm>
#include <set>

#include "debug_flags.h"
#include "desugar_graph.h"
#include "disk_interface.h"
#include "input_snapshot.h"
#include "metrics.h"
#include "parallel_map.h"
#include "status.h"
#include "thread_pool.h"
#include "util.h"

const char kDesugarGraphFileName[] = "desugar_graph.bin";
const char kInputSnapshotFileName[] = "inputs.log";

DexingTransform::DexingTransform(const DexingConfig& config,
                                 DiskInterface* disk_interface,
                                 DexArchiveBuilder* builder, Status* status)
    : config_(config), disk_interface_(disk_interface), builder_(builder),
      status_(status) {
  thread_pool_ = CreateThreadPool(config.parallelism > 0
                                      ? config.parallelism
                                      : GetOptimalThreadPoolJobCount());
}

DexingTransform::~DexingTransform() {}

string DexingTransform::dex_output_dir() const {
  return JoinPath(config_.output_dir, "dex");
}

string DexingTransform::globals_output_dir() const {
  return JoinPath(config_.output_dir, "global_synthetics");
}

string DexingTransform::graph_path() const {
  return JoinPath(config_.output_dir, kDesugarGraphFileName);
}

string DexingTransform::snapshot_path() const {
  return JoinPath(config_.output_dir, kInputSnapshotFileName);
}

uint64_t DexingTransform::ParametersHash() const {
  const DexParameters& parameters = config_.dex_parameters;
  char flags[96];
  snprintf(flags, sizeof(flags), "%d %d %d %d", parameters.min_sdk_version,
           parameters.debuggable, parameters.with_desugaring,
           parameters.enable_global_synthetics);
  // The command and classpath may hold any byte but NUL.
  string key = flags;
  key += '\0';
  key += config_.command;
  key += '\0';
  key += config_.classpath;
  return MurmurHash64A(key.data(), key.size());
}

bool DexingTransform::Run(string* err) {
  METRIC_RECORD("dexing transform");
  ran_incrementally_ = false;
  processed_files_.clear();

  FileInfo info;
  TimeStamp mtime = disk_interface_->Stat(config_.input_dir, &info, err);
  if (mtime < 0)
    return false;
  if (mtime == 0 || !info.is_dir) {
    *err = "input directory '" + config_.input_dir + "' " +
        (mtime == 0 ? "does not exist" : "is not a directory");
    return false;
  }

  InputSnapshot current;
  if (!current.Capture(disk_interface_, thread_pool_.get(), config_.input_dir,
                       err))
    return false;
  current.set_parameters_hash(ParametersHash());

  // Decide whether the state of the previous run can be trusted.
  DesugarGraph graph(config_.input_dir);
  InputSnapshot previous;
  bool incremental = false;
  if (!IsIncrementalSupported()) {
    EXPLAIN("%s", "desugaring classpath is set, incremental dexing disabled");
  } else if (config_.force_full) {
    EXPLAIN("%s", "full run requested");
  } else {
    string load_err;
    LoadStatus status = previous.Load(disk_interface_, snapshot_path(),
                                      &load_err);
    if (status == LOAD_ERROR) {
      status_->Warning("%s; starting over", load_err.c_str());
    } else if (status == LOAD_NOT_FOUND) {
      EXPLAIN("no input snapshot at %s", snapshot_path().c_str());
    } else if (previous.parameters_hash() != current.parameters_hash()) {
      EXPLAIN("dexing parameters changed (%016" PRIx64 " vs %016" PRIx64 ")",
              previous.parameters_hash(), current.parameters_hash());
    } else {
      status = graph.Read(disk_interface_, graph_path(), &load_err);
      if (status == LOAD_ERROR) {
        status_->Warning("%s; starting over", load_err.c_str());
      } else if (status == LOAD_NOT_FOUND) {
        EXPLAIN("no desugar graph at %s", graph_path().c_str());
      } else {
        incremental = true;
      }
    }
  }

  status_->TransformStarted(incremental, config_.input_dir);
  bool success = incremental
      ? ProcessIncrementally(previous, current, &graph, err)
      : ProcessNonIncrementally(current, &graph, err);
  ran_incrementally_ = incremental;
  if (success && !config_.dry_run)
    success = SaveState(&graph, &current, err);
  if (!success && !config_.dry_run)
    DiscardState();
  status_->TransformFinished();
  return success;
}

bool DexingTransform::ProcessIncrementally(const InputSnapshot& previous,
                                           const InputSnapshot& current,
                                           DesugarGraph* graph, string* err) {
  METRIC_RECORD("process incrementally");
  FileChanges changes = InputSnapshot::ComputeChanges(previous, current);

  vector<string> changed_paths;
  for (const string& file : changes.removed) {
    EXPLAIN("%s was removed", file.c_str());
    changed_paths.push_back(JoinPath(config_.input_dir, file));
  }
  for (const string& file : changes.modified) {
    EXPLAIN("%s was modified", file.c_str());
    changed_paths.push_back(JoinPath(config_.input_dir, file));
  }
  for (const string& file : changes.added)
    EXPLAIN("%s was added", file.c_str());

  vector<string> impacted_paths;
  if (!graph->GetAllDependents(changed_paths, &impacted_paths, err))
    return false;
  set<string> impacted;
  for (const string& path : impacted_paths) {
    string relative;
    if (!RelativizePath(config_.input_dir, path, &relative, err))
      return false;
    EXPLAIN("%s depends on a changed class", relative.c_str());
    impacted.insert(relative);
  }

  // Outputs and edges of everything that changed or was impacted are stale.
  // Dependencies of the reprocessed files are rediscovered during conversion.
  set<string> stale(impacted);
  stale.insert(changes.removed.begin(), changes.removed.end());
  stale.insert(changes.modified.begin(), changes.modified.end());
  for (const string& file : stale) {
    if (!config_.dry_run && !RemoveOutputs(file, err))
      return false;
    if (!graph->RemoveNode(JoinPath(config_.input_dir, file), err))
      return false;
  }

  set<string> to_process(impacted);
  to_process.insert(changes.modified.begin(), changes.modified.end());
  to_process.insert(changes.added.begin(), changes.added.end());
  vector<string> files;
  for (const string& file : to_process) {
    if (current.entries().count(file))
      files.push_back(file);
  }
  return ConvertFiles(files, graph, err);
}

bool DexingTransform::ProcessNonIncrementally(const InputSnapshot& current,
                                              DesugarGraph* graph,
                                              string* err) {
  METRIC_RECORD("process non-incrementally");
  if (!config_.dry_run) {
    if (!disk_interface_->CleanDir(dex_output_dir(), err))
      return false;
    if (config_.dex_parameters.enable_global_synthetics) {
      if (!disk_interface_->CleanDir(globals_output_dir(), err))
        return false;
    } else if (!disk_interface_->RemoveTree(globals_output_dir(), err)) {
      return false;
    }
    if (disk_interface_->RemoveFile(graph_path()) < 0) {
      *err = "failed to remove " + graph_path();
      return false;
    }
  }
  graph->graph()->Clear();

  vector<string> files;
  files.reserve(current.entries().size());
  for (const auto& entry : current.entries())
    files.push_back(entry.first);
  return ConvertFiles(files, IsIncrementalSupported() ? graph : nullptr, err);
}

DexRequest DexingTransform::MakeRequest(const string& class_file) const {
  DexRequest request;
  request.input_root = config_.input_dir;
  request.relative_path = class_file;
  request.input = JoinPath(config_.input_dir, class_file);
  request.dex_output = JoinPath(
      dex_output_dir(),
      DexFilePerClassFile::GetDexOutputRelativePath(class_file));
  if (config_.dex_parameters.enable_global_synthetics) {
    request.globals_output = JoinPath(
        globals_output_dir(),
        DexFilePerClassFile::GetGlobalSyntheticOutputRelativePath(class_file));
  }
  return request;
}

bool DexingTransform::ConvertFiles(const vector<string>& files,
                                   DependencyGraphUpdater* graph_updater,
                                   string* err) {
  METRIC_RECORD("convert files");
  processed_files_ = files;
  METRIC_COUNT("class files converted", static_cast<int64_t>(files.size()));
  status_->PlanHasTotalFiles(static_cast<int>(files.size()));

  vector<string> errors = ParallelMap(thread_pool_.get(), files,
      [this, graph_updater](const string& file) {
    DexRequest request = MakeRequest(file);
    status_->FileStarted(file, builder_->Describe(request));
    string output, convert_err;
    bool success = builder_->Convert(request, graph_updater, &output,
                                     &convert_err);
    if (!success) {
      if (!output.empty() && output[output.size() - 1] != '\n')
        output += '\n';
      output += convert_err;
    }
    status_->FileFinished(file, success, output);
    return success ? string() : file + ": " + convert_err;
  });

  if (PropagateError(err, errors))
    return true;
  size_t failures = count_if(errors.begin(), errors.end(),
                             [](const string& e) { return !e.empty(); });
  if (failures > 1)
    *err += " (and " + to_string(failures - 1) + " more failures)";
  return false;
}

bool DexingTransform::RemoveOutputs(const string& class_file, string* err) {
  string dex_output = JoinPath(
      dex_output_dir(),
      DexFilePerClassFile::GetDexOutputRelativePath(class_file));
  if (disk_interface_->RemoveFile(dex_output) < 0) {
    *err = "failed to remove " + dex_output;
    return false;
  }
  string globals_output = JoinPath(
      globals_output_dir(),
      DexFilePerClassFile::GetGlobalSyntheticOutputRelativePath(class_file));
  if (disk_interface_->RemoveFile(globals_output) < 0) {
    *err = "failed to remove " + globals_output;
    return false;
  }
  return true;
}

bool DexingTransform::SaveState(DesugarGraph* graph, InputSnapshot* current,
                                string* err) {
  METRIC_RECORD("save state");
  if (!IsIncrementalSupported())
    return true;
  return graph->Write(disk_interface_, graph_path(), err) &&
      current->Write(disk_interface_, snapshot_path(), err);
}

void DexingTransform::DiscardState() {
  if (disk_interface_->RemoveFile(graph_path()) < 0)
    status_->Warning("failed to remove %s", graph_path().c_str());
  if (disk_interface_->RemoveFile(snapshot_path()) < 0)
    status_->Warning("failed to remove %s", snapshot_path().c_str());
}
