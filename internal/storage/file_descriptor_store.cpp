#include "file_descriptor_store.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/util/errors.hpp"

namespace pbxpatch::storage {

FileDescriptorStore::FileDescriptorStore(std::filesystem::path path) : path_(std::move(path)) {
}

std::string FileDescriptorStore::ReadAll() {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    throw util::NotFound("descriptor not found: " + path_.string());
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw std::runtime_error("failed to open descriptor: " + path_.string());
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

/*
  Atomic write:
      write tmp -> flush -> rename
*/
void FileDescriptorStore::ReplaceAll(const std::string& text) {
  auto tmp_path = path_;
  tmp_path += ".tmp";

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to open " + tmp_path.string() + " for writing");
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      throw std::runtime_error("failed to write " + tmp_path.string());
    }
  }

  std::filesystem::rename(tmp_path, path_);
}

} // namespace pbxpatch::storage
