#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>

#include <tre/tre.hpp>

namespace {

// Reject names that would escape the output directory
bool isSafeRelative(const std::filesystem::path &path) {
  if (path.empty() || path.is_absolute() || path.has_root_name()) {
    return false;
  }
  for (const auto &part : path) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <archive.tre> <output_dir>\n";
    return 1;
  }

  tre::Error error;
  auto archive = tre::Archive::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error: " << error.toString() << "\n";
    return 1;
  }

  std::filesystem::path outputDir = argv[2];
  std::filesystem::create_directories(outputDir);

  int extractedCount = 0;
  int failedCount = 0;
  for (const auto &entry : archive->entries()) {
    std::string name = entry.name;
    std::replace(name.begin(), name.end(), '\\', '/');
    std::filesystem::path relative = name;
    if (!isSafeRelative(relative)) {
      std::cerr << "Skipping unsafe path " << entry.name << "\n";
      ++failedCount;
      continue;
    }

    if (!archive->extractToFile(entry, outputDir / relative, &error)) {
      std::cerr << "Failed to extract " << entry.name << ": " << error.toString() << "\n";
      ++failedCount;
      continue;
    }
    ++extractedCount;
  }

  std::cout << "Extracted " << extractedCount << " files to " << outputDir << "\n";
  return failedCount == 0 ? 0 : 1;
}
