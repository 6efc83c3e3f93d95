#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>
#include <unistd.h>
#include <libgen.h>

#include "common/config_t.h"
#include "common/utils.h"
#include "hash_table/linear_probe_table.h"

enum class OpType : uint8_t {
  Put = 0,
  Remove = 1,
  Get = 2
};

struct OpData {
  std::string key;
  int val;
  OpType type;
};

struct RunStats {
  uint64_t puts_inserted = 0;
  uint64_t puts_updated = 0;
  uint64_t removes_done = 0;
  uint64_t removes_missing = 0;
  uint64_t gets_found = 0;
  uint64_t gets_missing = 0;
  uint64_t mismatches = 0; // disagreements with the reference map
};

/** Print a message to inform the user of how to use this program */
void usage(char *progname) {
  printf("%s: Run a random put/remove/get workload against a linear probe "
         "table and check it against std::unordered_map.\n",
         basename(progname));
  printf("  -c [file]   Property file with workload parameters\n");
  printf("  -s [int]    Initial table size\n");
  printf("  -k [int]    Keys are drawn from [0, key_max)\n");
  printf("  -n [int]    Number of operations\n");
  printf("  -v          Print the table after the run\n");
  printf("  -h          Print help (this message)\n");
}

/**
 * Parse the command-line arguments into cfg. A config file given with -c is
 * loaded first, the other flags override its values.
 *
 * @return false if the user asked for help or passed an unknown flag
 */
bool parse_args(int argc, char **argv, config_t &cfg) {
  std::string config_file;
  int table_size = -1, key_max = -1, iters = -1;
  bool verbose = false;

  long opt;
  while ((opt = getopt(argc, argv, "c:s:k:n:vh")) != -1) {
    switch (opt) {
    case 'c':
      config_file = optarg;
      break;
    case 's':
      table_size = std::stoi(optarg);
      break;
    case 'k':
      key_max = std::stoi(optarg);
      break;
    case 'n':
      iters = std::stoi(optarg);
      break;
    case 'v':
      verbose = true;
      break;
    default:
      return false;
    }
  }

  if (!config_file.empty()) {
    cfg = load_config(config_file);
  }
  if (table_size != -1) cfg.table_size = table_size;
  if (key_max != -1) cfg.key_max = key_max;
  if (iters != -1) cfg.iters = iters;
  if (verbose) cfg.verbose = true;

  cfg.validate();
  return true;
}

std::vector<OpData> generate_operations(const config_t &cfg) {
  std::vector<OpData> operations;
  operations.reserve(cfg.iters);

  std::mt19937 rng(cfg.seed);
  std::uniform_int_distribution<int> key_dist(0, cfg.key_max - 1);
  std::uniform_int_distribution<int> val_dist(1, 10000);
  std::uniform_int_distribution<int> op_dist(1, 100);

  for (int i = 0; i < cfg.iters; ++i) {
    OpData op;
    op.key = std::to_string(key_dist(rng));
    op.val = 0;

    int roll = op_dist(rng);
    if (roll <= cfg.put_prob) {
      op.type = OpType::Put;
      op.val = val_dist(rng);
    } else if (roll <= cfg.put_prob + cfg.remove_prob) {
      op.type = OpType::Remove;
    } else {
      op.type = OpType::Get;
    }
    operations.push_back(std::move(op));
  }

  return operations;
}

void run_operations(LinearProbeTable<int> &table, std::unordered_map<std::string, int> &reference,
                    const std::vector<OpData> &operations, RunStats &stats) {
  for (const OpData &op : operations) {
    switch (op.type) {
    case OpType::Put: {
      bool existed = reference.count(op.key) != 0;
      table.set(op.key, op.val);
      reference[op.key] = op.val;
      if (existed) {
        stats.puts_updated++;
      } else {
        stats.puts_inserted++;
      }
      break;
    }
    case OpType::Remove:
      try {
        table.remove(op.key);
        stats.removes_done++;
        if (reference.erase(op.key) == 0) stats.mismatches++;
      } catch (const KeyNotFoundError &) {
        stats.removes_missing++;
        if (reference.count(op.key) != 0) stats.mismatches++;
      }
      break;
    case OpType::Get: {
      std::optional<int> res = table.search(op.key);
      auto it = reference.find(op.key);
      if (res.has_value()) {
        stats.gets_found++;
        if (it == reference.end() || it->second != res.value()) stats.mismatches++;
      } else {
        stats.gets_missing++;
        if (it != reference.end()) stats.mismatches++;
      }
      break;
    }
    }
  }
}

int main(int argc, char** argv) {
  config_t cfg;

  try {
    if (!parse_args(argc, argv, cfg)) {
      usage(argv[0]);
      return 1;
    }

    cfg.dump();
    std::vector<OpData> operations = generate_operations(cfg);
    log_info("Benchmark", "Generated " + std::to_string(operations.size()) + " operations");

    LinearProbeTable<int> table(cfg.table_size);
    std::unordered_map<std::string, int> reference;
    RunStats stats;
    size_t start_prime = table.get_next_prime_index();
    size_t start_capacity = table.get_capacity();

    auto start = std::chrono::high_resolution_clock::now();
    run_operations(table, reference, operations, stats);
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double> wall_time = end - start;
    double ops_sec = operations.size() / wall_time.count();

    // the final state must agree entry by entry
    if (table.get_count() != reference.size()) stats.mismatches++;
    for (const auto &[key, value] : reference) {
      std::optional<int> res = table.search(key);
      if (!res.has_value() || res.value() != value) stats.mismatches++;
    }

    std::cout << "\nBenchmark RESULTS\n";
    std::cout << "Puts (inserted/updated):    " << stats.puts_inserted << " / " << stats.puts_updated << "\n";
    std::cout << "Removes (done/missing):     " << stats.removes_done << " / " << stats.removes_missing << "\n";
    std::cout << "Gets (found/missing):       " << stats.gets_found << " / " << stats.gets_missing << "\n";
    std::cout << "Final count:                " << table.get_count() << "\n";
    std::cout << "Capacity (start -> end):    " << start_capacity << " -> " << table.get_capacity() << "\n";
    std::cout << "Growths:                    " << table.get_next_prime_index() - start_prime << "\n";
    std::cout << "Throughput:                 " << std::fixed << std::setprecision(2) << ops_sec << " ops/sec\n";
    std::cout << "Total Wall Time:            " << wall_time.count() << " s\n";
    std::cout << "Mismatches:                 " << stats.mismatches << "\n";
    std::cout << std::endl;

    if (cfg.verbose) {
      table.print_table();
    }

    if (stats.mismatches != 0) {
      log_fatal("Table disagreed with the reference map " + std::to_string(stats.mismatches) + " times");
      return 1;
    }

  } catch (const std::exception& e) {
    log_fatal(e.what());
    return 1;
  }

  return 0;
}
