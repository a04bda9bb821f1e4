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

#include "dex_builder.h"

#include <string.h>

#include "class_file.h"
#include "debug_flags.h"
#include "desugar_graph.h"
#include "disk_interface.h"
#include "metrics.h"
#include "subprocess.h"
#include "util.h"

namespace {

const char kClassExtension[] = ".class";

string ReplaceClassExtension(const string& class_file, const char* extension) {
  string base = class_file;
  if (EndsWith(base, kClassExtension))
    base.resize(base.size() - strlen(kClassExtension));
  return base + extension;
}

bool IsVariableChar(char c) {
  return (c >= 'a' && c <= 'z') || c == '_';
}

}  // anonymous namespace

// static
string DexFilePerClassFile::GetDexOutputRelativePath(const string& class_file) {
  return ReplaceClassExtension(class_file, ".dex");
}

// static
string DexFilePerClassFile::GetGlobalSyntheticOutputRelativePath(
    const string& class_file) {
  return ReplaceClassExtension(class_file, ".globals");
}

bool DexArchiveBuilder::Convert(const DexRequest& request,
                                DependencyGraphUpdater* graph_updater,
                                string* output, string* err) {
  if (parameters_.with_desugaring && graph_updater &&
      !ReportDesugarDependencies(request, graph_updater, err))
    return false;
  return RunConversion(request, output, err);
}

bool DexArchiveBuilder::ReportDesugarDependencies(
    const DexRequest& request, DependencyGraphUpdater* graph_updater,
    string* err) {
  METRIC_RECORD("desugar dependencies");
  string content;
  string read_err;
  if (disk_interface_->ReadFile(request.input, &content, &read_err) !=
      FileReader::Okay) {
    *err = "reading '" + request.input + "': " + read_err;
    return false;
  }

  ClassFile class_file;
  if (!class_file.Parse(content, err)) {
    *err = request.input + ": " + *err;
    return false;
  }

  for (const string& dependency : class_file.DesugarDependencies()) {
    // Classes outside the input root (the platform, libraries) never change
    // between runs, so they are not tracked.
    string dependency_path =
        JoinPath(request.input_root, ClassNameToPath(dependency));
    string stat_err;
    TimeStamp mtime = disk_interface_->Stat(dependency_path, nullptr,
                                            &stat_err);
    if (mtime < 0) {
      *err = stat_err;
      return false;
    }
    if (mtime == 0)
      continue;
    EXPLAIN("%s depends on %s for desugaring", request.relative_path.c_str(),
            ClassNameToPath(dependency).c_str());
    if (!graph_updater->AddEdge(request.input, dependency_path, err))
      return false;
    METRIC_COUNT("desugar edges reported", 1);
  }
  return true;
}

string CommandDexArchiveBuilder::EvaluateCommand(
    const DexRequest& request) const {
  string result;
  for (size_t i = 0; i < command_template_.size(); ++i) {
    char c = command_template_[i];
    if (c != '$') {
      result.push_back(c);
      continue;
    }
    if (i + 1 < command_template_.size() && command_template_[i + 1] == '$') {
      result.push_back('$');
      ++i;
      continue;
    }

    size_t end = i + 1;
    while (end < command_template_.size() &&
           IsVariableChar(command_template_[end]))
      ++end;
    string name = command_template_.substr(i + 1, end - i - 1);
    i = end - 1;

    if (name == "in") {
      GetShellEscapedString(request.input, &result);
    } else if (name == "out") {
      GetShellEscapedString(request.dex_output, &result);
    } else if (name == "out_dir") {
      string dir = DirName(request.dex_output);
      GetShellEscapedString(dir.empty() ? "." : dir, &result);
    } else if (name == "globals") {
      if (!request.globals_output.empty())
        GetShellEscapedString(request.globals_output, &result);
    } else if (name == "min_api") {
      result += to_string(parameters_.min_sdk_version);
    } else if (name == "mode") {
      result += parameters_.debuggable ? "--debug" : "--release";
    }
    // Unknown variables expand to nothing, as in a shell.
  }
  return result;
}

string CommandDexArchiveBuilder::Describe(const DexRequest& request) const {
  return EvaluateCommand(request);
}

bool CommandDexArchiveBuilder::RunConversion(const DexRequest& request,
                                             string* output, string* err) {
  METRIC_RECORD("dex conversion");
  if (dry_run_)
    return true;

  if (!disk_interface_->MakeDirs(request.dex_output) ||
      (!request.globals_output.empty() &&
       !disk_interface_->MakeDirs(request.globals_output))) {
    *err = "failed to create output directory for " + request.relative_path;
    return false;
  }

  string command = EvaluateCommand(request);
  ExitStatus status = RunCommand(command, output);
  if (status != ExitSuccess) {
    *err = (status == ExitInterrupted ? "interrupted: " : "command failed: ") +
        command;
    return false;
  }
  return true;
}
