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

#ifndef INCDEX_DEX_BUILDER_H_
#define INCDEX_DEX_BUILDER_H_

#include <string>
#include <vector>
using namespace std;

struct DependencyGraphUpdater;
struct DiskInterface;

/// Options that affect the content of every dex file.
struct DexParameters {
  int min_sdk_version = 21;
  bool debuggable = false;
  bool with_desugaring = true;
  bool enable_global_synthetics = false;
};

/// Where the outputs of one class file go. Every class file is converted to
/// its own dex file, so outputs can be deleted one class at a time.
struct DexFilePerClassFile {
  /// "a/B.class" -> "a/B.dex"
  static string GetDexOutputRelativePath(const string& class_file);

  /// "a/B.class" -> "a/B.globals"
  static string GetGlobalSyntheticOutputRelativePath(const string& class_file);
};

/// One class file to convert, with every path already resolved.
struct DexRequest {
  string input_root;
  /// The class file, relative to |input_root|.
  string relative_path;
  /// Absolute (or cwd-relative) paths.
  string input;
  string dex_output;
  /// Empty when global synthetics are disabled.
  string globals_output;
};

/// Converts single class files to dex files.
///
/// Subclasses implement RunConversion; Convert wraps it with the discovery of
/// desugaring dependencies.
struct DexArchiveBuilder {
  DexArchiveBuilder(DiskInterface* disk_interface,
                    const DexParameters& parameters)
      : disk_interface_(disk_interface), parameters_(parameters) {}
  virtual ~DexArchiveBuilder() {}

  /// Convert |request|. When desugaring is enabled and |graph_updater| is
  /// not null, report an edge from the class to every desugaring dependency
  /// that is itself a class file under the input root. Tool output goes to
  /// |output|.
  bool Convert(const DexRequest& request, DependencyGraphUpdater* graph_updater,
               string* output, string* err);

  /// The command that converts |request|, for verbose output. Empty if
  /// there is nothing to show.
  virtual string Describe(const DexRequest& request) const { return string(); }

  const DexParameters& parameters() const { return parameters_; }

 protected:
  virtual bool RunConversion(const DexRequest& request, string* output,
                             string* err) = 0;

  bool ReportDesugarDependencies(const DexRequest& request,
                                 DependencyGraphUpdater* graph_updater,
                                 string* err);

  DiskInterface* disk_interface_;
  DexParameters parameters_;
};

/// Runs an external converter such as d8 once per class file. The command
/// template may refer to:
///   $in       the class file
///   $out      the dex file to produce
///   $out_dir  the directory of $out
///   $globals  the global synthetics file to produce (may be empty)
///   $min_api  the minimum sdk version
///   $mode     --debug or --release
///   $$        a literal '$'
/// Substituted paths are shell-escaped.
struct CommandDexArchiveBuilder : public DexArchiveBuilder {
  CommandDexArchiveBuilder(DiskInterface* disk_interface,
                           const DexParameters& parameters,
                           const string& command_template, bool dry_run)
      : DexArchiveBuilder(disk_interface, parameters),
        command_template_(command_template), dry_run_(dry_run) {}

  virtual string Describe(const DexRequest& request) const;

  /// Expand the command template for |request|.
  string EvaluateCommand(const DexRequest& request) const;

 protected:
  virtual bool RunConversion(const DexRequest& request, string* output,
                             string* err);

 private:
  string command_template_;
  bool dry_run_;
};

#endif  // INCDEX_DEX_BUILDER_H_
