#include <signal.h>
#include <unistd.h>
#include <iostream>
#include <fstream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <qjsbox/logger.h>
#include <qjsbox/module.h>
#include <qjsbox/paths.h>
#include <qjsbox/execution.h>
#include "server_io.h"

namespace {

const char kDefaultConfig[] = "/etc/qjsbox.conf";

fs::path module_path;

// relative paths are taken relative to the directory of the running program
fs::path ResolveModulePath(const std::string& path) {
  fs::path ret = path;
  if (ret.is_absolute()) return ret;
  std::error_code ec;
  fs::path exe = fs::read_symlink("/proc/self/exe", ec);
  if (ec) return fs::absolute(ret);
  return exe.parent_path() / ret;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  std::string module = ini[""]["module_path"] | "";
  std::string script_flag = ini[""]["script_flag"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  if (module.size()) module_path = ResolveModulePath(module);
  if (script_flag.size()) kScriptFlag = script_flag;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kTimeLimit = (ini[""]["time_limit_ms"] | (kTimeLimit / 1000)) * 1000;
  kMaxRSS = (ini[""]["max_rss_mb"] | (kMaxRSS / 1024)) * 1024;
  kMaxOutput = ini[""]["max_output_kb"] | kMaxOutput;
  kMaxProcesses = ini[""]["max_processes"] | kMaxProcesses;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "qjsbox");
  parser.add_argument("-c", "--config")
    .default_value(std::string(kDefaultConfig))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel executions");
  parser.add_argument("-m", "--module")
    .help("Path of the sandbox binary (qjs)");
  parser.add_argument("-t", "--time-limit")
    .scan<'d', long>()
    .help("Wall-clock time limit of each execution, in milliseconds");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  module_path = DefaultModulePath();
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    if (parser.is_used("--config")) {
      spdlog::error("Failed to parse configuration file {}", std::string(config_file));
      exit(1);
    }
    spdlog::info("No configuration file at {}; using defaults", std::string(config_file));
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present<std::string>("--module")) {
    module_path = ResolveModulePath(val.value());
  }
  if (auto val = parser.present<long>("--time-limit")) {
    kTimeLimit = val.value() * 1000;
  }
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  ParseArgs(argc, argv);
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  // a helper that dies early must not take the server down with it
  signal(SIGPIPE, SIG_IGN);
  if (!PrepareBoxRoot()) {
    spdlog::critical("Fatal error: box root {} is not usable", kBoxRoot.c_str());
    return 1;
  }
  std::shared_ptr<const CompiledModule> module;
  try {
    module = LoadModule(module_path);
  } catch (const ModuleLoadError& err) {
    spdlog::critical("Fatal error: could not load the sandbox binary: {}", err.what());
    spdlog::critical("Please ensure a qjs executable exists at {}", module_path.c_str());
    return 1;
  }
  if (!SandboxHelperUsable()) {
    spdlog::critical("Fatal error: sandbox helper not found at {}", SandboxExecPath().c_str());
    return 1;
  }
  spdlog::info("Tool '{}' registered", kToolName);
  int ret = ServeLoop(std::cin, std::cout, [module](const std::string& code) {
    return RunScript(code, *module);
  });
  spdlog::info("MCP server stopped");
  return ret;
}
