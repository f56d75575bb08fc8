#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

class Random {
public:
  // [A-Za-z0-9]{length}
  static std::string alphanumeric(size_t length);
  static uint16_t u16();
};
