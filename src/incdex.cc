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

#include <errno.h>
#include <getopt.h>
#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <memory>

#include "debug_flags.h"
#include "desugar_graph.h"
#include "dex_builder.h"
#include "dexing_transform.h"
#include "disk_interface.h"
#include "input_snapshot.h"
#include "metrics.h"
#include "status.h"
#include "thread_pool.h"
#include "util.h"
#include "version.h"

namespace {

struct IncdexMain;

/// Command-line options.
struct Options {
  /// Tool to run rather than dexing.
  const struct Tool* tool = nullptr;
};

/// The type of functions that are the entry points to tools (subcommands).
typedef int (IncdexMain::*ToolFunc)(const Options*, int, char**);

/// Subtools, accessible via "-t foo".
struct Tool {
  /// Short name of the tool.
  const char* name;

  /// Description (shown in "-t list").
  const char* desc;

  /// Implementation of the tool.
  ToolFunc func;
};

/// The state of one incdex invocation.
struct IncdexMain {
  explicit IncdexMain(const DexingConfig& config) : config_(config) {}

  const DexingConfig& config_;
  RealDiskInterface disk_interface_;

  // The various subcommands, run via "-t XXX".
  int ToolGraph(const Options* options, int argc, char* argv[]);
  int ToolDependents(const Options* options, int argc, char* argv[]);
  int ToolChanges(const Options* options, int argc, char* argv[]);
  int ToolRecompact(const Options* options, int argc, char* argv[]);
  int ToolList(const Options* options, int argc, char* argv[]);

  /// Dex the input directory.
  /// @return an exit code.
  int RunTransform(Status* status);

  /// Dump the output requested by '-d stats'.
  void DumpMetrics(Status* status);

 private:
  /// Load the graph of the previous run. Prints an error and returns false
  /// when there is no usable graph.
  bool LoadGraph(DesugarGraph* graph);

  string GraphPath() const {
    return JoinPath(config_.output_dir, kDesugarGraphFileName);
  }
};

void Usage(const DexingConfig& config) {
  fprintf(stderr,
"usage: incdex [options] -i INPUT_DIR -o OUTPUT_DIR\n"
"\n"
"Converts every class file under INPUT_DIR to its own dex file under\n"
"OUTPUT_DIR, reprocessing only what changed since the previous run.\n"
"\n"
"options:\n"
"  --version      print incdex version (\"%s\")\n"
"  -v, --verbose  show all command lines while converting\n"
"  --quiet        don't show progress status, just command output\n"
"\n"
"  -i DIR         directory of class files to convert\n"
"  -o DIR         output directory (dex files and incremental state)\n"
"  -c COMMAND     command converting one class file; may use $in, $out,\n"
"                 $out_dir, $globals, $min_api and $mode\n"
"\n"
"  -j N           convert N class files in parallel [default=%d on this system]\n"
"  -n             dry run (don't run commands and don't touch the outputs)\n"
"  --full         ignore the previous run and convert everything\n"
"\n"
"  --min-api N    minimum sdk version [default=%d]\n"
"  --debuggable   produce debuggable dex files\n"
"  --no-desugaring      don't track desugaring dependencies\n"
"  --global-synthetics  write global synthetics separately\n"
"  --classpath PATH     desugaring classpath (disables incremental runs)\n"
"\n"
"  -d MODE        enable debugging (use '-d list' to list modes)\n"
"  -t TOOL        run a subtool (use '-t list' to list subtools)\n"
"    terminates toplevel options; further flags are passed to the tool\n",
          kIncdexVersion, GetOptimalThreadPoolJobCount(),
          config.dex_parameters.min_sdk_version);
}

bool IncdexMain::LoadGraph(DesugarGraph* graph) {
  string err;
  switch (graph->Read(&disk_interface_, GraphPath(), &err)) {
  case LOAD_SUCCESS:
    return true;
  case LOAD_NOT_FOUND:
    Error("no desugar graph at %s", GraphPath().c_str());
    return false;
  default:
    Error("%s", err.c_str());
    return false;
  }
}

int IncdexMain::ToolGraph(const Options* options, int argc, char* argv[]) {
  DesugarGraph graph(config_.input_dir);
  if (!LoadGraph(&graph))
    return 1;
  for (const auto& edge : graph.graph()->GetEdges())
    printf("%s -> %s\n", edge.first.c_str(), edge.second.c_str());
  return 0;
}

int IncdexMain::ToolDependents(const Options* options, int argc,
                               char* argv[]) {
  if (argc == 0) {
    Error("expected one or more class files");
    return 1;
  }
  DesugarGraph graph(config_.input_dir);
  if (!LoadGraph(&graph))
    return 1;

  // Class files may be given relative to the input directory.
  vector<string> paths;
  for (int i = 0; i < argc; ++i)
    paths.push_back(graph.ResolvePath(argv[i]));

  vector<string> dependents;
  string err;
  if (!graph.GetAllDependents(paths, &dependents, &err)) {
    Error("%s", err.c_str());
    return 1;
  }
  for (const string& dependent : dependents)
    printf("%s\n", dependent.c_str());
  return 0;
}

int IncdexMain::ToolChanges(const Options* options, int argc, char* argv[]) {
  string err;
  InputSnapshot previous;
  string snapshot_path = JoinPath(config_.output_dir, kInputSnapshotFileName);
  switch (previous.Load(&disk_interface_, snapshot_path, &err)) {
  case LOAD_SUCCESS:
    break;
  case LOAD_NOT_FOUND:
    Error("no input snapshot at %s", snapshot_path.c_str());
    return 1;
  default:
    Error("%s", err.c_str());
    return 1;
  }

  std::unique_ptr<ThreadPool> thread_pool = CreateThreadPool();
  InputSnapshot current;
  if (!current.Capture(&disk_interface_, thread_pool.get(), config_.input_dir,
                       &err)) {
    Error("%s", err.c_str());
    return 1;
  }

  FileChanges changes = InputSnapshot::ComputeChanges(previous, current);
  for (const string& file : changes.added)
    printf("added %s\n", file.c_str());
  for (const string& file : changes.removed)
    printf("removed %s\n", file.c_str());
  for (const string& file : changes.modified)
    printf("modified %s\n", file.c_str());
  return 0;
}

int IncdexMain::ToolRecompact(const Options* options, int argc,
                              char* argv[]) {
  DesugarGraph graph(config_.input_dir);
  if (!LoadGraph(&graph))
    return 1;
  string err;
  if (!graph.Write(&disk_interface_, GraphPath(), &err)) {
    Error("%s", err.c_str());
    return 1;
  }
  return 0;
}

const Tool kTools[] = {
  { "graph", "dump the edges of the desugar graph",
    &IncdexMain::ToolGraph },
  { "dependents", "list the class files that transitively depend on the "
    "given ones", &IncdexMain::ToolDependents },
  { "changes", "list class files changed since the previous run",
    &IncdexMain::ToolChanges },
  { "recompact", "rewrite the desugar graph file",
    &IncdexMain::ToolRecompact },
  { "list", "list subtools", &IncdexMain::ToolList },
  { NULL, NULL, NULL }
};

int IncdexMain::ToolList(const Options* options, int argc, char* argv[]) {
  printf("incdex subtools:\n");
  for (const Tool* tool = &kTools[0]; tool->name; ++tool) {
    if (tool->desc)
      printf("%11s  %s\n", tool->name, tool->desc);
  }
  return 0;
}

/// Find the function to execute for \a tool_name and return it via \a func.
/// Returns a Tool, or NULL if incdex should exit.
const Tool* ChooseTool(const string& tool_name) {
  for (const Tool* tool = &kTools[0]; tool->name; ++tool) {
    if (tool->name == tool_name)
      return tool;
  }

  vector<const char*> words;
  for (const Tool* tool = &kTools[0]; tool->name; ++tool)
    words.push_back(tool->name);
  const char* suggestion = SpellcheckStringV(tool_name, words);
  if (suggestion) {
    Fatal("unknown tool '%s', did you mean '%s'?",
          tool_name.c_str(), suggestion);
  } else {
    Fatal("unknown tool '%s'", tool_name.c_str());
  }
  return NULL;  // Not reached.
}

/// Enable a debugging mode.  Returns false if incdex should exit instead
/// of continuing.
bool DebugEnable(const string& name) {
  if (name == "list") {
    printf("debugging modes:\n"
"  stats        print operation counts/timing info\n"
"  explain      explain why each class file is converted\n"
"multiple modes can be enabled via -d FOO -d BAR\n");
    return false;
  } else if (name == "stats") {
    g_metrics = new Metrics;
    return true;
  } else if (name == "explain") {
    g_explaining = true;
    return true;
  } else {
    const char* suggestion =
        SpellcheckString(name.c_str(), "stats", "explain", NULL);
    if (suggestion) {
      Error("unknown debug setting '%s', did you mean '%s'?",
            name.c_str(), suggestion);
    } else {
      Error("unknown debug setting '%s'", name.c_str());
    }
    return false;
  }
}

int IncdexMain::RunTransform(Status* status) {
  if (config_.command.empty() && !config_.dry_run) {
    Error("no conversion command given (use -c)");
    return 1;
  }
  CommandDexArchiveBuilder builder(&disk_interface_, config_.dex_parameters,
                                   config_.command, config_.dry_run);
  DexingTransform transform(config_, &disk_interface_, &builder, status);
  string err;
  if (!transform.Run(&err)) {
    status->Error("dexing failed: %s", err.c_str());
    return 1;
  }
  return 0;
}

void IncdexMain::DumpMetrics(Status* status) {
  g_metrics->Report(status);
  DumpMemoryUsage(status);
}

/// Parse a non-negative integer flag value, exiting on garbage.
int ParseIntFlag(const char* flag, const char* value) {
  char* end;
  errno = 0;
  long result = strtol(value, &end, 10);
  if (errno != 0 || *end != '\0' || end == value || result < 0 ||
      result > INT_MAX)
    Fatal("invalid %s parameter '%s'", flag, value);
  return static_cast<int>(result);
}

/// Parse argv for command-line options.
/// Returns an exit code, or -1 if incdex should continue.
int ReadFlags(int* argc, char*** argv, Options* options,
              DexingConfig* config) {
  enum {
    OPT_VERSION = 1,
    OPT_QUIET,
    OPT_FULL,
    OPT_MIN_API,
    OPT_DEBUGGABLE,
    OPT_NO_DESUGARING,
    OPT_GLOBAL_SYNTHETICS,
    OPT_CLASSPATH,
  };
  const option kLongOptions[] = {
    { "help", no_argument, NULL, 'h' },
    { "version", no_argument, NULL, OPT_VERSION },
    { "verbose", no_argument, NULL, 'v' },
    { "quiet", no_argument, NULL, OPT_QUIET },
    { "full", no_argument, NULL, OPT_FULL },
    { "min-api", required_argument, NULL, OPT_MIN_API },
    { "debuggable", no_argument, NULL, OPT_DEBUGGABLE },
    { "no-desugaring", no_argument, NULL, OPT_NO_DESUGARING },
    { "global-synthetics", no_argument, NULL, OPT_GLOBAL_SYNTHETICS },
    { "classpath", required_argument, NULL, OPT_CLASSPATH },
    { NULL, 0, NULL, 0 }
  };

  int opt;
  while (!options->tool &&
         (opt = getopt_long(*argc, *argv, "c:d:i:j:no:t:vh", kLongOptions,
                            NULL)) != -1) {
    switch (opt) {
      case 'c':
        config->command = optarg;
        break;
      case 'd':
        if (!DebugEnable(optarg))
          return 1;
        break;
      case 'i':
        config->input_dir = optarg;
        break;
      case 'j': {
        int value = ParseIntFlag("-j", optarg);
        if (value == 0)
          Fatal("invalid -j parameter '%s'", optarg);
        config->parallelism = value;
        break;
      }
      case 'n':
        config->dry_run = true;
        break;
      case 'o':
        config->output_dir = optarg;
        break;
      case 't':
        options->tool = ChooseTool(optarg);
        break;
      case 'v':
        config->verbosity = DexingConfig::VERBOSE;
        break;
      case OPT_QUIET:
        config->verbosity = DexingConfig::QUIET;
        break;
      case OPT_FULL:
        config->force_full = true;
        break;
      case OPT_MIN_API:
        config->dex_parameters.min_sdk_version =
            ParseIntFlag("--min-api", optarg);
        break;
      case OPT_DEBUGGABLE:
        config->dex_parameters.debuggable = true;
        break;
      case OPT_NO_DESUGARING:
        config->dex_parameters.with_desugaring = false;
        break;
      case OPT_GLOBAL_SYNTHETICS:
        config->dex_parameters.enable_global_synthetics = true;
        break;
      case OPT_CLASSPATH:
        config->classpath = optarg;
        break;
      case OPT_VERSION:
        printf("%s\n", kIncdexVersion);
        return 0;
      case 'h':
      default:
        Usage(*config);
        return 1;
    }
  }
  *argv += optind;
  *argc -= optind;

  return -1;
}

NORETURN void real_main(int argc, char** argv) {
  DexingConfig config;
  Options options = {};

  setvbuf(stdout, NULL, _IOLBF, BUFSIZ);
  const char* incdex_command = argv[0];

  int exit_code = ReadFlags(&argc, &argv, &options, &config);
  if (exit_code >= 0)
    exit(exit_code);

  if (options.tool && strcmp(options.tool->name, "list") == 0) {
    IncdexMain incdex(config);
    exit((incdex.*options.tool->func)(&options, argc, argv));
  }

  if (config.input_dir.empty() || config.output_dir.empty()) {
    Error("%s: -i INPUT_DIR and -o OUTPUT_DIR are required", incdex_command);
    Usage(config);
    exit(1);
  }
  string err;
  if (!CanonicalizePath(&config.input_dir, &err) ||
      !CanonicalizePath(&config.output_dir, &err))
    Fatal("%s", err.c_str());

  IncdexMain incdex(config);
  if (options.tool)
    exit((incdex.*options.tool->func)(&options, argc, argv));

  if (argc > 0) {
    Error("unexpected argument '%s'", argv[0]);
    exit(1);
  }

  StatusPrinter status(config);
  int result = incdex.RunTransform(&status);
  if (g_metrics)
    incdex.DumpMetrics(&status);
  exit(result);
}

}  // anonymous namespace

int main(int argc, char** argv) {
  real_main(argc, argv);
}
