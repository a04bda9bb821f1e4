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

#ifndef INCDEX_DESUGAR_GRAPH_H_
#define INCDEX_DESUGAR_GRAPH_H_

#include <mutex>
#include <string>
#include <vector>
using namespace std;

#include "dependency_graph.h"
#include "load_status.h"

struct DiskInterface;

/// Receives the desugaring dependencies discovered while converting class
/// files. Implementations must accept calls from several threads at once.
struct DependencyGraphUpdater {
  virtual ~DependencyGraphUpdater() {}

  /// Record that the output of |dependent| depends on |dependency|.
  virtual bool AddEdge(const string& dependent, const string& dependency,
                       string* err) = 0;
};

/// A DependencyGraph whose nodes all live below one root directory.
///
/// Callers pass and receive paths under |root_dir|; the graph itself only
/// stores paths relative to the root, so the persisted graph stays valid when
/// the project directory moves.
struct DesugarGraph : public DependencyGraphUpdater {
  explicit DesugarGraph(const string& root_dir);

  const string& root_dir() const { return root_dir_; }

  /// |path| itself if absolute, otherwise |path| taken relative to the root.
  string ResolvePath(const string& path) const;

  /// Fails when either path is not inside the root directory.
  virtual bool AddEdge(const string& dependent, const string& dependency,
                       string* err);

  /// Forget |path| and its edges. Unknown paths are ignored.
  bool RemoveNode(const string& path, string* err);

  /// Every file that transitively depends on any of |paths|, sorted.
  bool GetAllDependents(const vector<string>& paths, vector<string>* result,
                        string* err);

  /// Persist the graph to |file|.
  bool Write(DiskInterface* disk_interface, const string& file, string* err);

  /// Replace the graph with the one stored in |file|.
  LoadStatus Read(DiskInterface* disk_interface, const string& file,
                  string* err);

  /// The underlying root-relative graph. Not locked.
  DependencyGraph* graph() { return &graph_; }

 private:
  bool ToRelative(const string& path, string* relative, string* err) const;

  string root_dir_;
  std::mutex mutex_;
  DependencyGraph graph_;
};

#endif  // INCDEX_DESUGAR_GRAPH_H_
