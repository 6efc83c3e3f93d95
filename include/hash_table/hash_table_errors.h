#pragma once

#include <stdexcept>
#include <string>

// Thrown by get() and remove() when the key is not stored in the table
class KeyNotFoundError : public std::out_of_range {
public:
  explicit KeyNotFoundError(const std::string& key)
      : std::out_of_range("Key not found: " + key), missing_key(key) {}

  const std::string& key() const { return missing_key; }

private:
  std::string missing_key;
};

// The prime capacity list has no larger entry left to grow into
class CapacityExhaustedError : public std::length_error {
public:
  explicit CapacityExhaustedError(size_t capacity)
      : std::length_error("No prime capacity left above " + std::to_string(capacity)) {}
};
