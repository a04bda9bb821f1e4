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

#include "desugar_graph_log.h"

#include "dependency_graph.h"
#include "test.h"
#include "util.h"

namespace {

const char kTestFilename[] = "out/desugar_graph.bin";

void AppendWord(string* out, uint32_t word) {
  out->append(reinterpret_cast<const char*>(&word), sizeof(word));
}

string Header() {
  string out = "# desugar graph\n";
  AppendWord(&out, 1);
  return out;
}

string PathRecord(const string& path, uint32_t id) {
  string padded = path;
  while (padded.size() % 4 != 0)
    padded.push_back('\0');
  string out;
  AppendWord(&out, static_cast<uint32_t>(padded.size() + 4));
  out += padded;
  AppendWord(&out, ~id);
  return out;
}

string EdgesRecord(uint32_t dependent, const vector<uint32_t>& dependencies) {
  string out;
  AppendWord(&out, static_cast<uint32_t>(4 * (1 + dependencies.size())) |
                   0x80000000);
  AppendWord(&out, dependent);
  for (uint32_t id : dependencies)
    AppendWord(&out, id);
  return out;
}

struct DesugarGraphLogTest : public testing::Test {
  virtual void SetUp() {
    fs_.MakeDir("out");
  }

  LoadStatus LoadContent(const string& content, DependencyGraph* graph,
                         string* err) {
    fs_.Create(kTestFilename, content);
    DesugarGraphLog log(&fs_);
    return log.Load(kTestFilename, graph, err);
  }

  VirtualFileSystem fs_;
};

TEST_F(DesugarGraphLogTest, WriteRead) {
  DependencyGraph graph1;
  graph1.AddEdge("com/example/B.class", "com/example/A.class");
  graph1.AddEdge("com/example/C.class", "com/example/B.class");
  graph1.AddEdge("com/example/C.class", "com/example/I.class");
  graph1.AddEdge("Self.class", "Self.class");
  graph1.GetNode("Isolated.class");

  DesugarGraphLog log(&fs_);
  string err;
  ASSERT_TRUE(log.Write(kTestFilename, &graph1, &err)) << err;
  EXPECT_FALSE(fs_.Exists(string(kTestFilename) + ".tmp"));

  DependencyGraph graph2;
  EXPECT_EQ(LOAD_SUCCESS, log.Load(kTestFilename, &graph2, &err));
  ASSERT_EQ("", err);

  EXPECT_EQ(graph1.GetEdges(), graph2.GetEdges());
  ASSERT_EQ(graph1.node_count(), graph2.node_count());
  for (const auto& entry : graph1.paths())
    EXPECT_TRUE(graph2.LookupNode(entry.first)) << entry.first;
  EXPECT_TRUE(graph2.LookupNode("Isolated.class"));
}

TEST_F(DesugarGraphLogTest, EmptyGraph) {
  DependencyGraph graph1;
  DesugarGraphLog log(&fs_);
  string err;
  ASSERT_TRUE(log.Write(kTestFilename, &graph1, &err));
  EXPECT_EQ(Header(), fs_.Contents(kTestFilename));

  DependencyGraph graph2;
  EXPECT_EQ(LOAD_SUCCESS, log.Load(kTestFilename, &graph2, &err));
  EXPECT_TRUE(graph2.empty());
}

TEST_F(DesugarGraphLogTest, Format) {
  DependencyGraph graph;
  graph.AddEdge("B.class", "A.class");

  string expected = Header();
  expected += PathRecord("A.class", 0);
  expected += PathRecord("B.class", 1);
  expected += EdgesRecord(1, { 0 });

  string actual, err;
  ASSERT_TRUE(DesugarGraphLog::Serialize(&graph, &actual, &err)) << err;
  EXPECT_EQ(expected, actual);
}

TEST_F(DesugarGraphLogTest, Overwrite) {
  DesugarGraphLog log(&fs_);
  string err;
  DependencyGraph graph1;
  graph1.AddEdge("B.class", "A.class");
  ASSERT_TRUE(log.Write(kTestFilename, &graph1, &err));

  DependencyGraph graph2;
  graph2.AddEdge("D.class", "C.class");
  ASSERT_TRUE(log.Write(kTestFilename, &graph2, &err));

  DependencyGraph graph3;
  EXPECT_EQ(LOAD_SUCCESS, log.Load(kTestFilename, &graph3, &err));
  EXPECT_EQ(graph2.GetEdges(), graph3.GetEdges());
  EXPECT_FALSE(graph3.LookupNode("A.class"));
}

TEST_F(DesugarGraphLogTest, LotsOfDependencies) {
  // More dependencies than fit in one record.
  const int kNumDeps = 131080;
  DependencyGraph graph1;
  for (int i = 0; i < kNumDeps; ++i)
    graph1.AddEdge("Wide.class", "dep/C" + to_string(i) + ".class");

  DesugarGraphLog log(&fs_);
  string err;
  ASSERT_TRUE(log.Write(kTestFilename, &graph1, &err));

  DependencyGraph graph2;
  EXPECT_EQ(LOAD_SUCCESS, log.Load(kTestFilename, &graph2, &err));
  EXPECT_EQ(static_cast<size_t>(kNumDeps), graph2.edge_count());
  EXPECT_EQ(static_cast<size_t>(kNumDeps),
            graph2.GetDependencies("Wide.class").size());
}

TEST_F(DesugarGraphLogTest, NotFound) {
  DesugarGraphLog log(&fs_);
  DependencyGraph graph;
  string err;
  EXPECT_EQ(LOAD_NOT_FOUND, log.Load("out/missing.bin", &graph, &err));
  EXPECT_EQ("", err);
}

TEST_F(DesugarGraphLogTest, InvalidHeader) {
  const string kInvalidHeaders[] = {
    "",                                   // Empty file.
    "# desugar gr",                       // Truncated signature.
    "# desugar graph\n",                  // No version int.
    string("# desugar graph\n\001\000", 18),  // Truncated version int.
    string("# desugar graph\n\002\000\000\000", 20),  // Unknown version.
    string("# incdex inputs v2\n", 19),  // The input snapshot.
  };
  for (const string& header : kInvalidHeaders) {
    DependencyGraph graph;
    string err;
    EXPECT_EQ(LOAD_ERROR, LoadContent(header, &graph, &err));
    EXPECT_NE("", err);
    EXPECT_TRUE(graph.empty());
  }
}

TEST_F(DesugarGraphLogTest, Truncated) {
  DependencyGraph graph1;
  graph1.AddEdge("B.class", "A.class");
  graph1.AddEdge("C.class", "B.class");
  graph1.AddEdge("C.class", "A.class");
  string content, serialize_err;
  ASSERT_TRUE(DesugarGraphLog::Serialize(&graph1, &content, &serialize_err));

  // A cut inside a record is always detected. A cut on a record boundary
  // yields a consistent subgraph.
  for (size_t size = content.size() - 1; size > 0; --size) {
    DependencyGraph graph;
    string err;
    LoadStatus status = LoadContent(content.substr(0, size), &graph, &err);
    if (status == LOAD_ERROR) {
      EXPECT_TRUE(graph.empty());
      continue;
    }
    ASSERT_EQ(LOAD_SUCCESS, status);
    EXPECT_LT(graph.edge_count(), graph1.edge_count());
  }
}

TEST_F(DesugarGraphLogTest, BadChecksum) {
  string content = Header();
  content += PathRecord("A.class", 0);
  content += PathRecord("B.class", 5);
  DependencyGraph graph;
  string err;
  EXPECT_EQ(LOAD_ERROR, LoadContent(content, &graph, &err));
  EXPECT_EQ(string(kTestFilename) + ": bad checksum for path record 'B.class'",
            err);
  EXPECT_TRUE(graph.empty());
}

TEST_F(DesugarGraphLogTest, UnknownId) {
  string content = Header();
  content += PathRecord("A.class", 0);
  content += PathRecord("B.class", 1);
  content += EdgesRecord(1, { 2 });
  DependencyGraph graph;
  string err;
  EXPECT_EQ(LOAD_ERROR, LoadContent(content, &graph, &err));
  EXPECT_TRUE(graph.empty());

  // Ids must refer to earlier path records.
  content = Header();
  content += PathRecord("A.class", 0);
  content += EdgesRecord(1, { 0 });
  content += PathRecord("B.class", 1);
  EXPECT_EQ(LOAD_ERROR, LoadContent(content, &graph, &err));
  EXPECT_TRUE(graph.empty());
}

TEST_F(DesugarGraphLogTest, EdgesRecordWithoutDependencies) {
  string content = Header();
  content += PathRecord("A.class", 0);
  content += EdgesRecord(0, {});
  DependencyGraph graph;
  string err;
  EXPECT_EQ(LOAD_ERROR, LoadContent(content, &graph, &err));
}

TEST_F(DesugarGraphLogTest, RejectsPathsOutsideRoot) {
  const char* kBadPaths[] = {
    "/abs/A.class",
    "../A.class",
    "a/../../A.class",
    "a//A.class",
    "./A.class",
  };
  for (const char* path : kBadPaths) {
    string content = Header() + PathRecord(path, 0);
    DependencyGraph graph;
    string err;
    EXPECT_EQ(LOAD_ERROR, LoadContent(content, &graph, &err)) << path;
    EXPECT_TRUE(graph.empty());
  }
}

TEST_F(DesugarGraphLogTest, DuplicatePath) {
  string content = Header();
  content += PathRecord("A.class", 0);
  content += PathRecord("A.class", 1);
  DependencyGraph graph;
  string err;
  EXPECT_EQ(LOAD_ERROR, LoadContent(content, &graph, &err));
}

TEST_F(DesugarGraphLogTest, HugeRecordSize) {
  string content = Header();
  AppendWord(&content, 0x7ffffffc);
  content += string("A.class\0", 8);
  DependencyGraph graph;
  string err;
  EXPECT_EQ(LOAD_ERROR, LoadContent(content, &graph, &err));
}

TEST_F(DesugarGraphLogTest, PathTooLong) {
  // The longest path that still fits in a path record round trips.
  const size_t kMaxPathSize = (1 << 19) - 1 - 3 - 4;
  string longest = string(kMaxPathSize - 6, 'a') + ".class";
  DependencyGraph graph1;
  graph1.AddEdge(longest, "A.class");
  DesugarGraphLog log(&fs_);
  string err;
  ASSERT_TRUE(log.Write(kTestFilename, &graph1, &err)) << err;
  DependencyGraph graph2;
  EXPECT_EQ(LOAD_SUCCESS, log.Load(kTestFilename, &graph2, &err)) << err;
  EXPECT_EQ(graph1.GetEdges(), graph2.GetEdges());

  // One more byte is refused up front and leaves the old file in place.
  DependencyGraph graph3;
  graph3.AddEdge(string(kMaxPathSize - 5, 'a') + ".class", "A.class");
  EXPECT_FALSE(log.Write(kTestFilename, &graph3, &err));
  EXPECT_NE(string::npos, err.find("path too long")) << err;
  EXPECT_FALSE(fs_.Exists(string(kTestFilename) + ".tmp"));
  DependencyGraph graph4;
  EXPECT_EQ(LOAD_SUCCESS, log.Load(kTestFilename, &graph4, &err)) << err;
  EXPECT_EQ(graph1.GetEdges(), graph4.GetEdges());
}

TEST_F(DesugarGraphLogTest, LoadReplacesGraph) {
  DependencyGraph graph1;
  graph1.AddEdge("B.class", "A.class");
  DesugarGraphLog log(&fs_);
  string err;
  ASSERT_TRUE(log.Write(kTestFilename, &graph1, &err));

  DependencyGraph graph2;
  graph2.AddEdge("X.class", "Y.class");
  EXPECT_EQ(LOAD_SUCCESS, log.Load(kTestFilename, &graph2, &err));
  EXPECT_EQ(graph1.GetEdges(), graph2.GetEdges());
}

}  // anonymous namespace
