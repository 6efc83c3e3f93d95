#pragma once

#include <string>

// "[tag] message" on stdout
void log_info(const std::string& tag, const std::string& message);

// "[Fatal Error] message" on stderr
void log_fatal(const std::string& message);
