#pragma once

#include <cstdlib>
#include <string>

// Splits a "KEY:<int>" state line the way the panel firmware reads it.
static inline bool firmware_parse_state_line(const std::string& line, std::string& key, int& value) {
  auto colon = line.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= line.size()) {
    return false;
  }
  const std::string digits = line.substr(colon + 1);
  char* end = nullptr;
  long parsed = std::strtol(digits.c_str(), &end, 10);
  if (end == digits.c_str() || *end != '\0') {
    return false;
  }
  key = line.substr(0, colon);
  value = static_cast<int>(parsed);
  return true;
}
