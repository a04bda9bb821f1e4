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

#include <map>
#include <set>

#include "class_file.h"
#include "desugar_graph.h"
#include "disk_interface.h"
#include "input_snapshot.h"
#include "status.h"
#include "test.h"
#include "util.h"

namespace {

/// Stands in for d8: the "dex" file of a class is made from its own bytes
/// and the bytes of every desugaring dependency found under the input root,
/// the way desugaring copies default methods and lambda bridges.
struct FakeDexer : public DexArchiveBuilder {
  FakeDexer(DiskInterface* disk_interface, const DexParameters& parameters)
      : DexArchiveBuilder(disk_interface, parameters) {}

  virtual bool RunConversion(const DexRequest& request, string* output,
                             string* err) {
    if (fail.count(request.relative_path)) {
      *err = "injected failure";
      return false;
    }

    string content;
    if (disk_interface_->ReadFile(request.input, &content, err) !=
        FileReader::Okay)
      return false;
    ClassFile class_file;
    if (!class_file.Parse(content, err))
      return false;

    string dex = "dex(" + request.relative_path + ":" + content;
    for (const string& dependency : class_file.DesugarDependencies()) {
      string dependency_content;
      string read_err;
      string path = JoinPath(request.input_root, ClassNameToPath(dependency));
      if (disk_interface_->ReadFile(path, &dependency_content, &read_err) ==
          FileReader::Okay) {
        dex += "+" + dependency + ":" + dependency_content;
      }
    }
    dex += ")";

    if (!disk_interface_->MakeDirs(request.dex_output) ||
        !disk_interface_->WriteFile(request.dex_output, dex)) {
      *err = "failed to write " + request.dex_output;
      return false;
    }
    if (!request.globals_output.empty() &&
        (!disk_interface_->MakeDirs(request.globals_output) ||
         !disk_interface_->WriteFile(request.globals_output,
                                     "globals(" + request.relative_path +
                                     ")"))) {
      *err = "failed to write " + request.globals_output;
      return false;
    }
    return true;
  }

  set<string> fail;
};

struct DexingTransformTest : public testing::Test {
  DexingTransformTest() {
    config_.verbosity = DexingConfig::QUIET;
    config_.parallelism = 1;
    config_.input_dir = "in";
    config_.output_dir = "out";
  }

  /// Run the transform over |fs|, expecting success.
  void Run(VirtualFileSystem* fs) {
    string err;
    EXPECT_TRUE(RunWithError(fs, &err)) << err;
  }
  void Run() { Run(&fs_); }

  bool RunWithError(VirtualFileSystem* fs, string* err) {
    FakeDexer dexer(fs, config_.dex_parameters);
    dexer.fail = fail_;
    StatusPrinter status(config_);
    DexingTransform transform(config_, fs, &dexer, &status);
    bool success = transform.Run(err);
    ran_incrementally_ = transform.ran_incrementally();
    processed_ = transform.processed_files();
    return success;
  }

  /// Every dex file and its content.
  map<string, string> Outputs(const VirtualFileSystem& fs,
                              const string& dir = "out/dex") const {
    map<string, string> outputs;
    for (const string& path : fs.FilesUnder(dir))
      outputs[path] = fs.Contents(path);
    return outputs;
  }

  /// The outputs of a full run over a copy of the inputs of |fs_|.
  map<string, string> FullRunOutputs() {
    VirtualFileSystem fresh;
    for (const string& path : fs_.FilesUnder("in"))
      fresh.Create(path, fs_.Contents(path));
    Run(&fresh);
    EXPECT_FALSE(ran_incrementally_);
    return Outputs(fresh);
  }

  void Modify(const string& path, const string& content) {
    fs_.Tick();
    fs_.Create(path, content);
  }

  /// Run after a configuration change: every class is converted again, and
  /// the run after that is incremental with nothing to do.
  void ExpectFullRerun() {
    Run();
    EXPECT_FALSE(ran_incrementally_);
    EXPECT_EQ(6u, processed_.size());
    Run();
    EXPECT_TRUE(ran_incrementally_);
    EXPECT_TRUE(processed_.empty());
  }

  VirtualFileSystem fs_;
  DexingConfig config_;
  set<string> fail_;
  bool ran_incrementally_ = false;
  vector<string> processed_;
};

/// A -> nothing, B extends A, C extends B, I an interface used by L through a
/// lambda, and an unrelated class U.
void CreateProject(VirtualFileSystem* fs) {
  fs->Create("in/p/A.class", MakeClassFile("p/A", "java/lang/Object"));
  fs->Create("in/p/B.class", MakeClassFile("p/B", "p/A"));
  fs->Create("in/p/C.class", MakeClassFile("p/C", "p/B"));
  fs->Create("in/p/I.class", MakeClassFile("p/I", "java/lang/Object"));
  fs->Create("in/p/L.class",
             MakeClassFile("p/L", "java/lang/Object", {}, { "p/I" }));
  fs->Create("in/p/U.class", MakeClassFile("p/U", "java/lang/Object"));
}

TEST_F(DexingTransformTest, FirstRunIsNonIncremental) {
  CreateProject(&fs_);
  Run();
  EXPECT_FALSE(ran_incrementally_);
  EXPECT_EQ(6u, processed_.size());
  EXPECT_TRUE(fs_.Exists("out/dex/p/A.dex"));
  EXPECT_TRUE(fs_.Exists("out/dex/p/U.dex"));
  EXPECT_TRUE(fs_.Exists("out/desugar_graph.bin"));
  EXPECT_TRUE(fs_.Exists("out/inputs.log"));
  EXPECT_FALSE(fs_.Exists("out/global_synthetics/p/A.globals"));

  DesugarGraph graph("in");
  string err;
  ASSERT_EQ(LOAD_SUCCESS, graph.Read(&fs_, "out/desugar_graph.bin", &err));
  vector<pair<string, string> > expected = {
    { "p/B.class", "p/A.class" },
    { "p/C.class", "p/B.class" },
    { "p/L.class", "p/I.class" },
  };
  EXPECT_EQ(expected, graph.graph()->GetEdges());
}

TEST_F(DexingTransformTest, NoChanges) {
  CreateProject(&fs_);
  Run();
  map<string, string> before = Outputs(fs_);

  Run();
  EXPECT_TRUE(ran_incrementally_);
  EXPECT_TRUE(processed_.empty());
  EXPECT_EQ(before, Outputs(fs_));
}

TEST_F(DexingTransformTest, ModifiedSuperClass) {
  CreateProject(&fs_);
  Run();

  Modify("in/p/A.class", MakeClassFile("p/A", "java/lang/Object") + "v2");
  Run();
  EXPECT_TRUE(ran_incrementally_);
  EXPECT_EQ(vector<string>({ "p/A.class", "p/B.class", "p/C.class" }),
            processed_);
  EXPECT_EQ(FullRunOutputs(), Outputs(fs_));
}

TEST_F(DexingTransformTest, ModifiedLeafClass) {
  CreateProject(&fs_);
  Run();

  Modify("in/p/C.class", MakeClassFile("p/C", "p/A"));
  Run();
  EXPECT_TRUE(ran_incrementally_);
  EXPECT_EQ(vector<string>({ "p/C.class" }), processed_);
  EXPECT_EQ(FullRunOutputs(), Outputs(fs_));

  // C now extends A directly, so a change to B no longer touches it.
  Modify("in/p/B.class", MakeClassFile("p/B", "p/A") + "v2");
  Run();
  EXPECT_EQ(vector<string>({ "p/B.class" }), processed_);
  EXPECT_EQ(FullRunOutputs(), Outputs(fs_));
}

TEST_F(DexingTransformTest, ModifiedLambdaInterface) {
  CreateProject(&fs_);
  Run();

  Modify("in/p/I.class", MakeClassFile("p/I", "java/lang/Object") + "v2");
  Run();
  EXPECT_EQ(vector<string>({ "p/I.class", "p/L.class" }), processed_);
  EXPECT_EQ(FullRunOutputs(), Outputs(fs_));
}

TEST_F(DexingTransformTest, RemovedClass) {
  CreateProject(&fs_);
  Run();

  fs_.Tick();
  fs_.RemoveFile("in/p/A.class");
  Run();
  EXPECT_TRUE(ran_incrementally_);
  EXPECT_EQ(vector<string>({ "p/B.class", "p/C.class" }), processed_);
  EXPECT_FALSE(fs_.Exists("out/dex/p/A.dex"));
  EXPECT_EQ(FullRunOutputs(), Outputs(fs_));

  DesugarGraph graph("in");
  string err;
  ASSERT_EQ(LOAD_SUCCESS, graph.Read(&fs_, "out/desugar_graph.bin", &err));
  EXPECT_TRUE(graph.graph()->LookupNode("p/A.class") == nullptr);
}

TEST_F(DexingTransformTest, AddedClass) {
  CreateProject(&fs_);
  Run();

  fs_.Tick();
  fs_.Create("in/p/D.class", MakeClassFile("p/D", "p/C"));
  Run();
  EXPECT_TRUE(ran_incrementally_);
  EXPECT_EQ(vector<string>({ "p/D.class" }), processed_);
  EXPECT_EQ(FullRunOutputs(), Outputs(fs_));

  // The new class is tracked from now on.
  Modify("in/p/A.class", MakeClassFile("p/A", "java/lang/Object") + "v2");
  Run();
  EXPECT_EQ(vector<string>({ "p/A.class", "p/B.class", "p/C.class",
                             "p/D.class" }),
            processed_);
  EXPECT_EQ(FullRunOutputs(), Outputs(fs_));
}

TEST_F(DexingTransformTest, CorruptGraphFallsBackToFullRun) {
  CreateProject(&fs_);
  Run();

  fs_.Create("out/desugar_graph.bin", "garbage");
  Modify("in/p/U.class", MakeClassFile("p/U", "java/lang/Object") + "v2");
  Run();
  EXPECT_FALSE(ran_incrementally_);
  EXPECT_EQ(6u, processed_.size());

  // The rewritten graph makes the next run incremental again.
  Run();
  EXPECT_TRUE(ran_incrementally_);
  EXPECT_TRUE(processed_.empty());
}

TEST_F(DexingTransformTest, MissingSnapshotFallsBackToFullRun) {
  CreateProject(&fs_);
  Run();

  fs_.RemoveFile("out/inputs.log");
  Run();
  EXPECT_FALSE(ran_incrementally_);
  EXPECT_EQ(6u, processed_.size());
}

TEST_F(DexingTransformTest, FullRunRemovesStaleOutputs) {
  CreateProject(&fs_);
  fs_.Create("out/dex/p/Stale.dex", "stale");
  Run();
  EXPECT_FALSE(fs_.Exists("out/dex/p/Stale.dex"));

  config_.force_full = true;
  fs_.Create("out/dex/p/Stale.dex", "stale");
  Run();
  EXPECT_FALSE(ran_incrementally_);
  EXPECT_FALSE(fs_.Exists("out/dex/p/Stale.dex"));
}

TEST_F(DexingTransformTest, ClasspathDisablesIncrementalRuns) {
  config_.classpath = "android.jar";
  CreateProject(&fs_);
  Run();
  EXPECT_FALSE(ran_incrementally_);
  EXPECT_FALSE(fs_.Exists("out/desugar_graph.bin"));

  Run();
  EXPECT_FALSE(ran_incrementally_);
  EXPECT_EQ(6u, processed_.size());
}

TEST_F(DexingTransformTest, FailureDiscardsState) {
  CreateProject(&fs_);
  Run();

  Modify("in/p/B.class", MakeClassFile("p/B", "p/A") + "v2");
  fail_.insert("p/C.class");
  string err;
  EXPECT_FALSE(RunWithError(&fs_, &err));
  EXPECT_EQ("p/C.class: injected failure", err);
  EXPECT_FALSE(fs_.Exists("out/desugar_graph.bin"));
  EXPECT_FALSE(fs_.Exists("out/inputs.log"));

  fail_.clear();
  Run();
  EXPECT_FALSE(ran_incrementally_);
  EXPECT_EQ(FullRunOutputs(), Outputs(fs_));
}

TEST_F(DexingTransformTest, SeveralFailures) {
  CreateProject(&fs_);
  fail_.insert("p/A.class");
  fail_.insert("p/B.class");
  string err;
  EXPECT_FALSE(RunWithError(&fs_, &err));
  EXPECT_EQ("p/A.class: injected failure (and 1 more failures)", err);
}

TEST_F(DexingTransformTest, GlobalSynthetics) {
  config_.dex_parameters.enable_global_synthetics = true;
  CreateProject(&fs_);
  Run();
  EXPECT_EQ("globals(p/A.class)",
            fs_.Contents("out/global_synthetics/p/A.globals"));

  fs_.Tick();
  fs_.RemoveFile("in/p/U.class");
  Run();
  EXPECT_FALSE(fs_.Exists("out/global_synthetics/p/U.globals"));
  EXPECT_FALSE(fs_.Exists("out/dex/p/U.dex"));

  // Turning the feature off drops the directory.
  config_.dex_parameters.enable_global_synthetics = false;
  Run();
  EXPECT_FALSE(ran_incrementally_);
  EXPECT_TRUE(fs_.FilesUnder("out/global_synthetics").empty());
}

TEST_F(DexingTransformTest, EnablingGlobalSyntheticsConvertsEverything) {
  CreateProject(&fs_);
  Run();
  EXPECT_TRUE(fs_.FilesUnder("out/global_synthetics").empty());

  config_.dex_parameters.enable_global_synthetics = true;
  ExpectFullRerun();
  EXPECT_EQ(6u, fs_.FilesUnder("out/global_synthetics").size());
}

TEST_F(DexingTransformTest, MinSdkVersionChangeConvertsEverything) {
  CreateProject(&fs_);
  Run();
  config_.dex_parameters.min_sdk_version = 26;
  ExpectFullRerun();
}

TEST_F(DexingTransformTest, DebuggableChangeConvertsEverything) {
  CreateProject(&fs_);
  Run();
  config_.dex_parameters.debuggable = true;
  ExpectFullRerun();
  config_.dex_parameters.debuggable = false;
  ExpectFullRerun();
}

TEST_F(DexingTransformTest, CommandChangeConvertsEverything) {
  config_.command = "d8 $in --output $out_dir";
  CreateProject(&fs_);
  Run();
  config_.command = "d8 $mode $in --output $out_dir";
  ExpectFullRerun();
}

TEST_F(DexingTransformTest, ClasspathChangeConvertsEverything) {
  CreateProject(&fs_);
  Run();

  config_.classpath = "android.jar";
  Run();
  EXPECT_FALSE(ran_incrementally_);

  // Outputs built against the classpath are not reused once it is dropped.
  config_.classpath.clear();
  ExpectFullRerun();
}

TEST_F(DexingTransformTest, EnablingDesugaringConvertsEverything) {
  // Without desugaring no dependencies are recorded.
  config_.dex_parameters.with_desugaring = false;
  CreateProject(&fs_);
  Run();
  DesugarGraph graph("in");
  string err;
  ASSERT_EQ(LOAD_SUCCESS, graph.Read(&fs_, "out/desugar_graph.bin", &err));
  EXPECT_TRUE(graph.graph()->empty());

  config_.dex_parameters.with_desugaring = true;
  Modify("in/p/A.class", MakeClassFile("p/A", "java/lang/Object") + "v2");
  Run();
  EXPECT_FALSE(ran_incrementally_);
  EXPECT_EQ(6u, processed_.size());
  EXPECT_EQ(FullRunOutputs(), Outputs(fs_));

  // The graph is complete again, so the next change reaches the subclasses.
  Modify("in/p/A.class", MakeClassFile("p/A", "java/lang/Object") + "v3");
  Run();
  EXPECT_TRUE(ran_incrementally_);
  EXPECT_EQ(vector<string>({ "p/A.class", "p/B.class", "p/C.class" }),
            processed_);
  EXPECT_EQ(FullRunOutputs(), Outputs(fs_));
}

TEST_F(DexingTransformTest, ParametersHash) {
  CreateProject(&fs_);
  FakeDexer dexer(&fs_, config_.dex_parameters);
  StatusPrinter status(config_);
  DexingTransform transform(config_, &fs_, &dexer, &status);
  uint64_t hash = transform.ParametersHash();
  string err;
  ASSERT_TRUE(transform.Run(&err)) << err;

  InputSnapshot snapshot;
  ASSERT_EQ(LOAD_SUCCESS, snapshot.Load(&fs_, "out/inputs.log", &err));
  EXPECT_EQ(hash, snapshot.parameters_hash());

  // Settings that do not affect the outputs keep the hash.
  DexingConfig other = config_;
  other.parallelism = 4;
  other.verbosity = DexingConfig::VERBOSE;
  other.force_full = true;
  DexingTransform same(other, &fs_, &dexer, &status);
  EXPECT_EQ(hash, same.ParametersHash());

  other.command = "d8";
  DexingTransform different(other, &fs_, &dexer, &status);
  EXPECT_NE(hash, different.ParametersHash());
}

TEST_F(DexingTransformTest, DryRun) {
  CreateProject(&fs_);
  config_.dry_run = true;
  Run();
  EXPECT_EQ(6u, processed_.size());
  EXPECT_FALSE(fs_.Exists("out/desugar_graph.bin"));
  EXPECT_FALSE(fs_.Exists("out/inputs.log"));

  // Nothing was saved, so the next real run starts from scratch.
  config_.dry_run = false;
  Run();
  EXPECT_FALSE(ran_incrementally_);
}

TEST_F(DexingTransformTest, MissingInputDirectory) {
  string err;
  EXPECT_FALSE(RunWithError(&fs_, &err));
  EXPECT_EQ("input directory 'in' does not exist", err);
}

TEST_F(DexingTransformTest, IncrementalMatchesFullRun) {
  // Random edits, checking after each run that the outputs are what a full
  // run would produce. Classes only ever refer to classes that exist, and
  // removed names are never reused.
  CreateProject(&fs_);
  vector<string> live = { "p/A", "p/B", "p/C", "p/I", "p/L", "p/U" };
  Run();

  unsigned seed = 42;
  auto next = [&seed](size_t bound) {
    seed = seed * 1103515245 + 12345;
    return static_cast<size_t>((seed >> 16) & 0x7fff) % bound;
  };
  auto random_class = [&](const string& name, int version) {
    string super_class = "java/lang/Object";
    vector<string> interfaces, lambdas;
    for (const string& other : live) {
      if (other == name)
        continue;
      switch (next(6)) {
        case 0: super_class = other; break;
        case 1: interfaces.push_back(other); break;
        case 2: lambdas.push_back(other); break;
        default: break;
      }
    }
    return MakeClassFile(name, super_class, interfaces, lambdas) + "v" +
        to_string(version);
  };

  int next_name = 0;
  for (int round = 0; round < 30; ++round) {
    fs_.Tick();
    for (int edit = 0, edits = 1 + next(3); edit < edits; ++edit) {
      switch (next(3)) {
        case 0: {
          string name = "q/N" + to_string(next_name++);
          fs_.Create("in/" + name + ".class", random_class(name, round));
          live.push_back(name);
          break;
        }
        case 1: {
          if (live.size() <= 2)
            break;
          size_t index = next(live.size());
          fs_.RemoveFile("in/" + live[index] + ".class");
          live.erase(live.begin() + index);
          break;
        }
        default: {
          const string name = live[next(live.size())];
          fs_.Create("in/" + name + ".class", random_class(name, round));
          break;
        }
      }
    }
    Run();
    EXPECT_TRUE(ran_incrementally_);
    ASSERT_EQ(FullRunOutputs(), Outputs(fs_)) << "round " << round;
  }
}

}  // anonymous namespace
