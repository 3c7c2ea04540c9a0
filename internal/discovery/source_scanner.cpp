#include "source_scanner.hpp"

#include <algorithm>
#include <system_error>

#include "internal/util/errors.hpp"

namespace pbxpatch::discovery {

namespace {

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string Relative(const std::filesystem::path& path, const std::filesystem::path& root) {
  std::error_code ec;
  auto            relative = std::filesystem::relative(path, root, ec);
  if (ec || relative.empty() || *relative.begin() == "..") {
    return path.lexically_normal().generic_string();
  }
  return relative.generic_string();
}

} // namespace

SourceScanner::SourceScanner(ScanOptions options, SourceTypeRegistry types) : options_(std::move(options)), types_(std::move(types)) {
}

std::vector<std::string> SourceScanner::DefaultExcludedDirectories() {
  return {"Build", "build", "DerivedData", "Pods"};
}

bool SourceScanner::IsExcludedDirectory(const std::filesystem::path& dir) const {
  const auto name = dir.filename().string();
  if (name.empty() || name.front() == '.') return true;
  if (EndsWith(name, ".xcodeproj") || EndsWith(name, ".xcworkspace")) return true;

  const auto& excluded = options_.excluded_directories;
  return std::find(excluded.begin(), excluded.end(), name) != excluded.end();
}

std::vector<SourceCandidate> SourceScanner::Scan() const {
  std::error_code ec;
  if (!std::filesystem::is_directory(options_.root, ec)) {
    throw util::NotFound("source root not found: " + options_.root.string());
  }

  std::vector<SourceCandidate> candidates;

  std::filesystem::recursive_directory_iterator it(options_.root, std::filesystem::directory_options::skip_permission_denied);
  for (; it != std::filesystem::recursive_directory_iterator(); ++it) {
    const auto& entry = *it;
    if (entry.is_directory()) {
      if (IsExcludedDirectory(entry.path())) it.disable_recursion_pending();
      continue;
    }
    if (!entry.is_regular_file()) continue;

    const auto name = entry.path().filename().string();
    if (!types_.IsSource(name)) continue;

    candidates.push_back({name, Relative(entry.path(), options_.root)});
  }

  std::sort(candidates.begin(), candidates.end(), [](const SourceCandidate& a, const SourceCandidate& b) { return a.relative_path < b.relative_path; });
  return candidates;
}

std::vector<SourceCandidate> SourceScanner::FromPaths(const std::vector<std::string>& paths) const {
  std::vector<SourceCandidate> candidates;
  candidates.reserve(paths.size());

  for (const auto& raw : paths) {
    std::filesystem::path path(raw);
    if (path.is_relative() && !options_.root.empty()) {
      std::error_code ec;
      // Paths missing from the working directory are taken relative to the root.
      if (!std::filesystem::exists(path, ec)) path = options_.root / path;
    }

    auto relative = options_.root.empty() ? path.lexically_normal().generic_string() : Relative(path, options_.root);
    candidates.push_back({path.filename().string(), std::move(relative)});
  }
  return candidates;
}

} // namespace pbxpatch::discovery
