#include "common/config_t.h"

#include <climits>
#include <fstream>
#include <iostream>
#include <sstream>
#include <limits>
#include <stdexcept>

// value must fit the field it is stored in
static void check_range(long value, long low, long high, int line_num) {
  if (value < low || value > high) {
    throw std::runtime_error("Value out of range on line " + std::to_string(line_num));
  }
}

void config_t::dump() const {
  std::cout << "# table_size, key_max, iters, put_prob, remove_prob, seed, verbose" << std::endl
            << table_size << ", " << key_max << ", " << iters << ", "
            << put_prob << ", " << remove_prob << ", " << seed << ", "
            << (verbose ? "true" : "false") << std::endl;
}

void config_t::validate() const {
  if (table_size < 1) {
    throw std::runtime_error("table_size must be at least 1");
  }
  if (key_max < 1) {
    throw std::runtime_error("key_max must be at least 1");
  }
  if (iters < 1) {
    throw std::runtime_error("iters must be at least 1");
  }
  if (put_prob < 0 || put_prob > 100 || remove_prob < 0 || remove_prob > 100) {
    throw std::runtime_error("put_prob and remove_prob must be within 0..100");
  }
  if (put_prob + remove_prob > 100) {
    throw std::runtime_error("put_prob + remove_prob must not exceed 100");
  }
}

config_t load_config(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw std::runtime_error("Could not open config file: " + filename);
  }

  config_t cfg;
  std::string line;
  int line_num = 0;
  while (std::getline(file, line)) {
    line_num++;

    if (line.empty() || line[0] == '#')
      continue;

    std::stringstream ss(line);
    std::string name;
    long value;

    if (!(ss >> name)) {
      continue; // whitespace only
    }
    if (!(ss >> value)) {
      throw std::runtime_error("Malformed config on line " + std::to_string(line_num));
    }

    std::string trailing;
    if (ss >> trailing) {
      throw std::runtime_error("Malformed config on line " + std::to_string(line_num));
    }

    const long int_min = std::numeric_limits<int>::min();
    const long int_max = std::numeric_limits<int>::max();
    if (name == "seed") {
      check_range(value, 0, static_cast<long>(UINT_MAX), line_num);
    } else {
      check_range(value, int_min, int_max, line_num);
    }

    if (name == "table_size") {
      cfg.table_size = static_cast<int>(value);
    } else if (name == "key_max") {
      cfg.key_max = static_cast<int>(value);
    } else if (name == "iters") {
      cfg.iters = static_cast<int>(value);
    } else if (name == "put_prob") {
      cfg.put_prob = static_cast<int>(value);
    } else if (name == "remove_prob") {
      cfg.remove_prob = static_cast<int>(value);
    } else if (name == "seed") {
      cfg.seed = static_cast<unsigned int>(value);
    } else if (name == "verbose") {
      cfg.verbose = value != 0;
    } else {
      throw std::runtime_error("Unknown config name '" + name + "' on line " +
                               std::to_string(line_num));
    }
  }

  cfg.validate();
  return cfg;
}
