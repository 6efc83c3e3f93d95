#include <iostream>

#include "common/utils.h"

void log_info(const std::string& tag, const std::string& message) {
  std::cout << "[" << tag << "] " << message << std::endl;
}

void log_fatal(const std::string& message) {
  std::cerr << "[Fatal Error] " << message << std::endl;
}
