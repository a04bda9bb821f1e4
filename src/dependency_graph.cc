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

#include "dependency_graph.h"

#include <assert.h>

#include <deque>

#include "metrics.h"

bool GraphNodeCmp::operator()(const GraphNode* a, const GraphNode* b) const {
  return a->path() < b->path();
}

DependencyGraph::~DependencyGraph() {
  Clear();
}

GraphNode* DependencyGraph::GetNode(const string& path) {
  Paths::iterator i = nodes_.find(path);
  if (i != nodes_.end())
    return i->second;
  GraphNode* node = new GraphNode(path);
  nodes_.insert(make_pair(path, node));
  return node;
}

GraphNode* DependencyGraph::LookupNode(const string& path) const {
  Paths::const_iterator i = nodes_.find(path);
  if (i != nodes_.end())
    return i->second;
  return nullptr;
}

bool DependencyGraph::AddEdge(const string& dependent,
                              const string& dependency) {
  return AddEdge(GetNode(dependent), GetNode(dependency));
}

bool DependencyGraph::AddEdge(GraphNode* dependent, GraphNode* dependency) {
  if (!dependent->dependencies_.insert(dependency).second)
    return false;
  bool inserted = dependency->dependents_.insert(dependent).second;
  assert(inserted && "forward and reverse edges out of sync");
  (void)inserted;
  ++edge_count_;
  return true;
}

bool DependencyGraph::RemoveNode(const string& path) {
  Paths::iterator i = nodes_.find(path);
  if (i == nodes_.end())
    return false;
  GraphNode* node = i->second;

  // Detach the node from its neighbours. A self edge shows up in both sets,
  // so only count it once.
  for (GraphNode* dependency : node->dependencies_) {
    if (dependency != node)
      dependency->dependents_.erase(node);
    --edge_count_;
  }
  for (GraphNode* dependent : node->dependents_) {
    if (dependent != node) {
      dependent->dependencies_.erase(node);
      --edge_count_;
    }
  }

  nodes_.erase(i);
  delete node;
  return true;
}

vector<string> DependencyGraph::GetDependents(const string& path) const {
  vector<string> result;
  if (GraphNode* node = LookupNode(path)) {
    for (GraphNode* dependent : node->dependents())
      result.push_back(dependent->path());
  }
  return result;
}

vector<string> DependencyGraph::GetDependencies(const string& path) const {
  vector<string> result;
  if (GraphNode* node = LookupNode(path)) {
    for (GraphNode* dependency : node->dependencies())
      result.push_back(dependency->path());
  }
  return result;
}

set<string> DependencyGraph::GetAllDependents(
    const vector<string>& paths) const {
  METRIC_RECORD("all dependents");

  set<GraphNode*> visited;
  deque<GraphNode*> queue;
  for (const string& path : paths) {
    if (GraphNode* node = LookupNode(path))
      queue.push_back(node);
  }

  // Breadth-first walk over reverse edges. The start nodes are not marked
  // visited so that a cycle leading back to them reports them too.
  while (!queue.empty()) {
    GraphNode* node = queue.front();
    queue.pop_front();
    for (GraphNode* dependent : node->dependents()) {
      if (visited.insert(dependent).second)
        queue.push_back(dependent);
    }
  }

  set<string> result;
  for (GraphNode* node : visited)
    result.insert(node->path());
  return result;
}

vector<pair<string, string> > DependencyGraph::GetEdges() const {
  vector<pair<string, string> > edges;
  edges.reserve(edge_count_);
  for (const auto& entry : nodes_) {
    for (GraphNode* dependency : entry.second->dependencies())
      edges.push_back(make_pair(entry.first, dependency->path()));
  }
  return edges;
}

void DependencyGraph::Clear() {
  for (auto& entry : nodes_)
    delete entry.second;
  nodes_.clear();
  edge_count_ = 0;
}
