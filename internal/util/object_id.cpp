#include "object_id.hpp"

#include <array>
#include <stdexcept>

namespace pbxpatch::util {

namespace {

constexpr int kMaxDrawAttempts = 64;

} // namespace

bool IsObjectId(std::string_view value) {
  if (value.size() != kObjectIdLength) return false;

  for (char c : value) {
    const bool digit = c >= '0' && c <= '9';
    const bool upper = c >= 'A' && c <= 'F';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !upper && !lower) return false;
  }
  return true;
}

ObjectIdGenerator::ObjectIdGenerator() : rng_(std::random_device{}()) {
}

ObjectIdGenerator::ObjectIdGenerator(std::uint64_t seed) : rng_(seed) {
}

std::string ObjectIdGenerator::Draw() {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::array<uint8_t, kObjectIdLength / 2> bytes{};
  for (auto& b : bytes)
    b = static_cast<uint8_t>(rng_());

  std::string id;
  id.reserve(kObjectIdLength);
  for (auto b : bytes) {
    id.push_back(kHex[b >> 4]);
    id.push_back(kHex[b & 0x0F]);
  }
  return id;
}

std::string ObjectIdGenerator::Next(const std::unordered_set<std::string>& taken) {
  for (int attempt = 0; attempt < kMaxDrawAttempts; ++attempt) {
    auto id = Draw();
    if (!taken.contains(id)) return id;
  }
  throw std::runtime_error("object id generator kept producing identifiers that are already in use");
}

} // namespace pbxpatch::util
