#include "FileUtils.h"

#include <algorithm>
#include <fstream>

namespace ostmig {
Result<std::string> loadFile(const Path &path) {
  try {
    std::ifstream file(path.string());
    if (!file) {
      return makeError(StatusCode::kIOError, fmt::format("Error opening file: {}", path));
    }
    std::string output((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return output;
  } catch (const std::exception &e) {
    return makeError(StatusCode::kIOError, fmt::format("Error when read {}: {}", path, e.what()));
  }
}

Result<Void> storeToFile(const Path &path, const std::string &content) {
  try {
    std::ofstream file(path.string());
    if (!file) {
      return makeError(StatusCode::kIOError, fmt::format("Error opening file for writing: {}", path));
    }

    file << content;
    if (!file) {
      return makeError(StatusCode::kIOError, fmt::format("Error writing to file: {}", path));
    }
    return Void{};
  } catch (const std::exception &e) {
    return makeError(StatusCode::kIOError, fmt::format("Error when write to {}: {}", path, e.what()));
  }
}

Result<std::vector<Path>> listFiles(const Path &dir, std::string_view suffix) {
  boost::system::error_code ec;
  boost::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return makeError(StatusCode::kIOError, fmt::format("Error listing {}: {}", dir, ec.message()));
  }

  std::vector<Path> files;
  for (; it != boost::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      return makeError(StatusCode::kIOError, fmt::format("Error listing {}: {}", dir, ec.message()));
    }
    const auto &path = it->path();
    auto name = path.filename().string();
    if (name.size() < suffix.size() || !std::string_view(name).ends_with(suffix)) {
      continue;
    }
    if (!boost::filesystem::is_regular_file(it->status())) {
      continue;
    }
    files.push_back(path);
  }
  std::sort(files.begin(), files.end(), [](const Path &a, const Path &b) { return a.filename() < b.filename(); });
  return files;
}

Result<Void> renameFile(const Path &from, const Path &to) {
  boost::system::error_code ec;
  if (boost::filesystem::exists(to, ec)) {
    return makeError(StatusCode::kIOError, fmt::format("Rename {} failed: {} already exists", from, to));
  }
  boost::filesystem::rename(from, to, ec);
  if (ec) {
    return makeError(StatusCode::kIOError, fmt::format("Rename {} to {} failed: {}", from, to, ec.message()));
  }
  return Void{};
}

}  // namespace ostmig
