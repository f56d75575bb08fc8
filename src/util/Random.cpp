#include "Random.h"
#include <random>

namespace {

std::mt19937 &engine() {
  thread_local std::mt19937 rng{std::random_device{}()};
  return rng;
}

} // namespace

std::string Random::alphanumeric(size_t length) {
  static const char alphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
  std::uniform_int_distribution<size_t> pick(0, sizeof(alphabet) - 2);

  std::string out;
  out.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    out.push_back(alphabet[pick(engine())]);
  }
  return out;
}

uint16_t Random::u16() {
  std::uniform_int_distribution<uint32_t> dist(0, 0xFFFF);
  return static_cast<uint16_t>(dist(engine()));
}
