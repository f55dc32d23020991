/*
 *   Copyright (c) 2025 Riverside Research.
 *   LGPL-3; See LICENSE.txt in the repo root for details.
 */

// ipq: replay a script of operations against an indexed priority queue

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "workload.hpp"

using namespace std;
namespace fs = filesystem;
using json = nlohmann::json;

// Load config from input file if it was given, then allow any
// explicitly given command line arguments to override the input file.
conf::config load_config(const argparse::ArgumentParser& program) {
  try {
    const optional<string> in_path = program.present<string>("input");
    conf::config conf;
    if (in_path.has_value()) {
      const auto conf_opt = conf::load_config_from_file(in_path.value());
      if (!conf_opt.has_value()) {
        throw runtime_error("can't open " + in_path.value());
      }
      conf = conf_opt.value();
    }
    if (program.present<string>("pairs-file")) {
      conf.pairs_path = program.get<string>("pairs-file");
    }
    if (program.present<string>("order")) {
      conf.order = program.get<string>("order");
    } else if (conf.order == "") {
      conf.order = "minmax";
    }
    if (program.present<string>("output")) {
      conf.out_path = program.get<string>("output");
    }
    if (const auto ops = program.present<vector<string>>("op")) {
      for (const auto& s : ops.value()) {
        conf.script.push_back(workload::operation_from_string(s));
      }
    }
    conf.drain = program.get<bool>("drain") || conf.drain;
    conf.validate = program.get<bool>("validate") || conf.validate;
    conf.verbose = program.get<bool>("verbose") || conf.verbose;
    return conf;
  }
  catch (exception &e) {
    throw runtime_error("argparse error: " + string(e.what()));
  }
}

// Initial contents: --pairs wins over the pairs file, which wins over
// the config's inline pairs.
nlohmann::ordered_json load_pairs(const argparse::ArgumentParser& program,
                                  const conf::config& conf) {
  if (program.present<string>("pairs")) {
    return workload::pairs_from_string(program.get<string>("pairs"));
  }
  if (conf.pairs_path != "") {
    const auto pairs = conf::load_pairs_from_file(conf.pairs_path);
    if (!pairs.has_value()) {
      throw runtime_error("can't open " + conf.pairs_path);
    }
    return pairs.value();
  }
  return nlohmann::ordered_json(conf.pairs);
}

void validate_config(const conf::config& conf) {
  if (!workload::known_order(conf.order)) {
    cerr << "CONFIG ERROR: unknown order '" << conf.order
         << "' (expected min, max or minmax)" << endl;
    exit(1);
  }
  if (conf.pairs_path != "" && !fs::exists(conf.pairs_path)) {
    cerr << "CONFIG ERROR: pairs_path "
         << conf.pairs_path << " doesn't exist." << endl;
    exit(1);
  }
}

void print_config(const conf::config &conf) {
  const json j = conf;
  cout << setw(4) << j << endl;
}

int main(int argc, char* argv[]) {
  argparse::ArgumentParser program("ipq");

  program.add_argument("-i", "--input")
    .help("JSON config path");
  program.add_argument("-p", "--pairs")
    .help("initial contents as key:priority,key:priority,...");
  program.add_argument("-P", "--pairs-file")
    .help("JSON file with the initial contents");
  program.add_argument("-r", "--order")
    .help("queue ordering (\"min\", \"max\" or \"minmax\"). Default \"minmax\"");
  program.add_argument("-x", "--op")
    .help("operation name[:key[:priority]] appended to the script; repeatable")
    .append();
  program.add_argument("-o", "--output")
    .help("JSON output path");
  program.add_argument("--drain")
    .help("pop everything left once the script is done")
    .flag();
  program.add_argument("--validate")
    .help("check queue invariants after every operation")
    .flag();
  program.add_argument("--verbose")
    .help("print misc information to stdout")
    .flag();

  try {
    program.parse_args(argc, argv);
  }
  catch (const std::exception& err) {
    cerr << err.what() << endl;
    cerr << program;
    exit(1);
  }

  conf::config conf;
  nlohmann::ordered_json pairs;
  try {
    conf = load_config(program);
    validate_config(conf);
    pairs = load_pairs(program, conf);
  }
  catch (const std::exception& err) {
    cerr << err.what() << endl;
    exit(1);
  }
  if (conf.verbose) {
    cout << "Loaded config:" << endl;
    print_config(conf);
  }
  if (conf.drain) {
    conf.script.push_back(workload::drain_operation(conf.order));
  }

  workload::results res;
  try {
    res = workload::run(conf.order, pairs, conf.script, conf.validate);
  }
  catch (const std::exception& err) {
    cerr << "ERROR: " << err.what() << endl;
    exit(1);
  }

  if (conf.verbose) {
    size_t failed = 0;
    for (const auto& r : res.op_results) {
      if (!r.error.empty()) {
        ++failed;
      }
    }
    cout << "Built " << res.order << " in " << res.build_time
         << " seconds; ran " << res.op_results.size() << " operations ("
         << failed << " failed)" << endl;
  }
  if (!res.well_formed) {
    cerr << "WARNING: queue not well-formed" << endl;
  }

  // Dump results object to out_path if it exists, else to stdout.
  const json j = res;
  if (conf.out_path != "") {
    ofstream f(conf.out_path);
    f << setw(4) << j << endl;
  } else {
    cout << setw(4) << j << endl;
  }

  return res.well_formed ? 0 : 2;
}
