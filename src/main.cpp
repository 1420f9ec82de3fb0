#include <cstdio>
#include <cstdlib>
#include <string>
#include <algorithm>
#include <vector>
#include <sstream>
#include <fstream>
#include <iostream>
#include <iterator>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <runbox/logger.h>
#include <runbox/executor.h>
#include "runbox/outcome_json.h"

namespace fs = std::filesystem;

namespace {

ExecutorOptions options;
long timeout = kDefaultTimeout;
std::vector<std::string> files;

std::vector<std::string> SplitList(const std::string& str) {
  std::vector<std::string> ret;
  std::stringstream ss(str);
  for (std::string item; std::getline(ss, item, ',');) {
    size_t l = item.find_first_not_of(" \t"), r = item.find_last_not_of(" \t");
    if (l == std::string::npos) continue;
    ret.push_back(item.substr(l, r - l + 1));
  }
  return ret;
}

// false if seconds is not a usable timeout
bool TimeoutFromSeconds(double seconds, long& us) {
  if (!(seconds > 0 && seconds <= kMaxTimeout / 1e6)) return false;
  us = std::max(1L, (long)(seconds * 1e6));
  return true;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  options.interpreter = ini[""]["interpreter"] | options.interpreter;
  double timeout_seconds = ini[""]["timeout"] | (timeout / 1e6);
  if (!TimeoutFromSeconds(timeout_seconds, timeout)) {
    spdlog::error("Invalid timeout in configuration: {}", timeout_seconds);
    return false;
  }
  options.max_output = (ini[""]["max_output_kib"] | (options.max_output / 1024)) * 1024;
  options.vss = (ini[""]["max_vss_mb"] | (options.vss / 1024)) * 1024;
  options.fsize = ini[""]["max_fsize_kib"] | options.fsize;
  options.file_num = ini[""]["max_files"] | options.file_num;
  std::string denylist = ini[""]["denylist"] | "";
  std::string allowed_builtins = ini[""]["allowed_builtins"] | "";
  if (denylist.size()) options.denylist = SplitList(denylist);
  if (allowed_builtins.size()) options.allowed_builtins = SplitList(allowed_builtins);
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "runbox");
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/runbox.conf"))
    .help("Path of configuration file; skipped if it does not exist");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-t", "--timeout")
    .scan<'g', double>()
    .help("Wall-clock limit per submission in seconds");
  parser.add_argument("--interpreter")
    .help("Path of the interpreter running the submissions");
  parser.add_argument("files")
    .remaining()
    .help("Source files to execute; - for stdin");

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
  fs::path config_file = parser.get<std::string>("--config");
  if (fs::exists(config_file) && !ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<double>("--timeout")) {
    if (!TimeoutFromSeconds(val.value(), timeout)) {
      std::cerr << "Timeout must be positive and at most " << kMaxTimeout / 1e6 << " seconds" << std::endl;
      exit(1);
    }
  }
  if (auto val = parser.present("--interpreter")) {
    options.interpreter = val.value();
  }
  try {
    files = parser.get<std::vector<std::string>>("files");
  } catch (const std::logic_error&) {
    // no positional arguments given
  }
  if (files.empty()) {
    std::cerr << "No source file given" << std::endl;
    std::cerr << parser;
    exit(1);
  }
}

bool ReadSource(const std::string& file, std::string& source) {
  if (file == "-") {
    source.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream fin(file, std::ios::binary);
  if (!fin) return false;
  source.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  ParseArgs(argc, argv);

  SandboxExecutor executor(options);
  bool all_completed = true;
  for (auto& file : files) {
    std::string source;
    if (!ReadSource(file, source)) {
      spdlog::error("Failed to read source file {}", file);
      all_completed = false;
      continue;
    }
    ExecutionOutcome outcome = executor.Execute(source, timeout);
    if (outcome.status != ExecStatus::COMPLETED) all_completed = false;
    nlohmann::json json = OutcomeToJson(outcome);
    json["file"] = file;
    std::cout << json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  }
  return all_completed ? 0 : 1;
}
