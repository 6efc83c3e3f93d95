#pragma once

#include <cstddef>
#include <vector>

// Ascending primes used as table sizes when a table grows
const std::vector<size_t>& capacity_primes();

// Index of the first prime strictly greater than requested,
// or capacity_primes().size() if there is none
size_t first_prime_index_above(long requested);
