#pragma once

#include <optional>
#include <string>

#include "internal/storage/descriptor_store.hpp"
#include "internal/util/errors.hpp"

namespace pbxpatch::storage {

class MemoryDescriptorStore final : public DescriptorStore {
 public:
  MemoryDescriptorStore() = default;
  explicit MemoryDescriptorStore(std::string text) : text_(std::move(text)) {
  }

  std::string ReadAll() override {
    if (!text_) throw util::NotFound("memory descriptor is empty");
    return *text_;
  }

  void ReplaceAll(const std::string& text) override {
    text_ = text;
    ++writes_;
  }

  std::string Describe() const override {
    return "memory";
  }

  int Writes() const {
    return writes_;
  }

 private:
  std::optional<std::string> text_;
  int                        writes_ = 0;
};

} // namespace pbxpatch::storage
