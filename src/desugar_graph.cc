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

#include "desugar_graph.h"

#include "desugar_graph_log.h"
#include "util.h"

DesugarGraph::DesugarGraph(const string& root_dir) : root_dir_(root_dir) {
  // Only an empty path fails to canonicalize; it means the current directory.
  string err;
  if (!CanonicalizePath(&root_dir_, &err))
    root_dir_ = ".";
}

string DesugarGraph::ResolvePath(const string& path) const {
  if (!path.empty() && path[0] == '/')
    return path;
  return JoinPath(root_dir_, path);
}

bool DesugarGraph::ToRelative(const string& path, string* relative,
                              string* err) const {
  return RelativizePath(root_dir_, path, relative, err);
}

bool DesugarGraph::AddEdge(const string& dependent, const string& dependency,
                           string* err) {
  string relative_dependent, relative_dependency;
  if (!ToRelative(dependent, &relative_dependent, err) ||
      !ToRelative(dependency, &relative_dependency, err))
    return false;

  std::lock_guard<std::mutex> lock(mutex_);
  graph_.AddEdge(relative_dependent, relative_dependency);
  return true;
}

bool DesugarGraph::RemoveNode(const string& path, string* err) {
  string relative;
  if (!ToRelative(path, &relative, err))
    return false;

  std::lock_guard<std::mutex> lock(mutex_);
  graph_.RemoveNode(relative);
  return true;
}

bool DesugarGraph::GetAllDependents(const vector<string>& paths,
                                    vector<string>* result, string* err) {
  vector<string> relative_paths;
  relative_paths.reserve(paths.size());
  for (const string& path : paths) {
    string relative;
    if (!ToRelative(path, &relative, err))
      return false;
    relative_paths.push_back(relative);
  }

  set<string> dependents;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dependents = graph_.GetAllDependents(relative_paths);
  }

  result->clear();
  for (const string& dependent : dependents)
    result->push_back(JoinPath(root_dir_, dependent));
  return true;
}

bool DesugarGraph::Write(DiskInterface* disk_interface, const string& file,
                         string* err) {
  std::lock_guard<std::mutex> lock(mutex_);
  DesugarGraphLog log(disk_interface);
  return log.Write(file, &graph_, err);
}

LoadStatus DesugarGraph::Read(DiskInterface* disk_interface,
                              const string& file, string* err) {
  std::lock_guard<std::mutex> lock(mutex_);
  DesugarGraphLog log(disk_interface);
  return log.Load(file, &graph_, err);
}
