#pragma once

#include <filesystem>
#include <string>

#include "internal/storage/descriptor_store.hpp"

namespace pbxpatch::storage {

class FileDescriptorStore final : public DescriptorStore {
 public:
  explicit FileDescriptorStore(std::filesystem::path path);

  std::string ReadAll() override;
  void        ReplaceAll(const std::string& text) override;
  std::string Describe() const override {
    return path_.string();
  }

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

} // namespace pbxpatch::storage
