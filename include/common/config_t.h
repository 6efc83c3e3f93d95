#pragma once

#include <string>

// store all of the workload parameters for one run

struct config_t {

  // Requested initial size of the table
  int table_size;

  // Keys are drawn from [0, key_max)
  int key_max;

  // The number of operations to run
  int iters;

  // Percentage of operations that are puts
  int put_prob;

  // Percentage of operations that are removes, the rest are gets
  int remove_prob;

  // Seed for the operation generator
  unsigned int seed;

  // Print the table after the run
  bool verbose;

  // simple constructor
  config_t()
      : table_size(17), key_max(10000), iters(100000), put_prob(50),
        remove_prob(20), seed(2400), verbose(false) { }

  // Print the values of all fields
  void dump() const;

  // Throws std::runtime_error when a field is out of range
  void validate() const;
};

// format of the property file, one pair per line:
// name value
// Lines starting with '#' and blank lines are skipped.
config_t load_config(const std::string &filename);
