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

#ifndef INCDEX_DEPENDENCY_GRAPH_H_
#define INCDEX_DEPENDENCY_GRAPH_H_

#include <map>
#include <set>
#include <string>
#include <vector>
using namespace std;

struct GraphNode;

/// Orders nodes by path so that dumps and the on-disk graph are stable.
struct GraphNodeCmp {
  bool operator()(const GraphNode* a, const GraphNode* b) const;
};

typedef set<GraphNode*, GraphNodeCmp> NodeSet;

/// A class file in the dependency graph, identified by its path.
struct GraphNode {
  explicit GraphNode(const string& path) : path_(path) {}

  const string& path() const { return path_; }

  /// Nodes whose output depends on this node (reverse edges).
  const NodeSet& dependents() const { return dependents_; }

  /// Nodes this node's output depends on (forward edges).
  const NodeSet& dependencies() const { return dependencies_; }

  /// Index of the node in the on-disk log, or -1 if not assigned yet.
  int id() const { return id_; }
  void set_id(int id) { id_ = id; }

 private:
  friend struct DependencyGraph;

  string path_;
  NodeSet dependents_;
  NodeSet dependencies_;
  int id_ = -1;
};

/// A directed graph over class files. An edge (dependent, dependency) means
/// that the desugared output of |dependent| depends on the bytecode of
/// |dependency|, so a change to |dependency| requires |dependent| to be
/// reprocessed.
///
/// The graph owns its nodes. It is not thread-safe; DesugarGraph adds the
/// locking needed when edges are reported from worker threads.
struct DependencyGraph {
  DependencyGraph() {}
  ~DependencyGraph();

  DependencyGraph(const DependencyGraph&) = delete;
  DependencyGraph& operator=(const DependencyGraph&) = delete;

  /// Creates the node if it doesn't exist. Never returns nullptr.
  GraphNode* GetNode(const string& path);

  /// Finds the existing node, returns nullptr if it doesn't exist.
  GraphNode* LookupNode(const string& path) const;

  /// Record that |dependent| requires |dependency|. Adding an edge that
  /// already exists is a no-op. Returns true if the edge is new.
  bool AddEdge(const string& dependent, const string& dependency);
  bool AddEdge(GraphNode* dependent, GraphNode* dependency);

  /// Delete a node and every edge that mentions it. Returns false if there
  /// was no such node.
  bool RemoveNode(const string& path);

  /// Direct dependents of |path|, sorted. Empty for unknown paths.
  vector<string> GetDependents(const string& path) const;

  /// Direct dependencies of |path|, sorted. Empty for unknown paths.
  vector<string> GetDependencies(const string& path) const;

  /// Every node that depends, directly or transitively, on any of |paths|.
  /// A path from |paths| is part of the result only if it is reachable from
  /// one of them through at least one edge, e.g. on a cycle.
  set<string> GetAllDependents(const vector<string>& paths) const;

  /// All (dependent, dependency) pairs, sorted.
  vector<pair<string, string> > GetEdges() const;

  size_t node_count() const { return nodes_.size(); }
  size_t edge_count() const { return edge_count_; }
  bool empty() const { return nodes_.empty(); }

  /// Delete every node and edge.
  void Clear();

  /// Mapping of path -> node, ordered by path.
  typedef map<string, GraphNode*> Paths;
  const Paths& paths() const { return nodes_; }

 private:
  Paths nodes_;
  size_t edge_count_ = 0;
};

#endif  // INCDEX_DEPENDENCY_GRAPH_H_
