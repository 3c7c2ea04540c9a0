#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <unordered_set>

namespace pbxpatch::util {

/*
  Object identifier helpers

  Descriptor objects are keyed by 96-bit ids written as 24 upper-case
  hex characters. Ids carry no meaning beyond uniqueness.
*/

inline constexpr std::size_t kObjectIdLength = 24;

bool IsObjectId(std::string_view value);

class ObjectIdGenerator {
 public:
  ObjectIdGenerator();
  explicit ObjectIdGenerator(std::uint64_t seed);
  virtual ~ObjectIdGenerator() = default;

  // Returns an id that is not in `taken`. Redraws on collision.
  std::string Next(const std::unordered_set<std::string>& taken);

 protected:
  virtual std::string Draw();

 private:
  std::mt19937_64 rng_;
};

} // namespace pbxpatch::util
