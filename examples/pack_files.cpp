#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <tre/tre.hpp>

namespace fs = std::filesystem;

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <input_dir> <archive.tre> [--store] [--verbose]\n";
    return 1;
  }

  fs::path inputDir = argv[1];
  fs::path outputFile = argv[2];

  tre::BuilderOptions options;
  for (int i = 3; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--store") {
      options.compression = tre::CompressionPolicy::Store;
    } else if (arg == "--verbose") {
      tre::log::setLevel(tre::log::Level::Debug);
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      return 1;
    }
  }

  std::error_code ec;
  if (!fs::is_directory(inputDir, ec)) {
    std::cerr << "Error: not a directory: " << inputDir << "\n";
    return 1;
  }

  // Sorted so that the same tree always produces the same archive
  std::vector<fs::path> files;
  for (const auto &item : fs::recursive_directory_iterator(inputDir)) {
    if (item.is_regular_file()) {
      files.push_back(item.path());
    }
  }
  std::sort(files.begin(), files.end());

  auto archive = tre::Archive::create(options);
  tre::Error error;
  for (const auto &file : files) {
    std::string name = fs::relative(file, inputDir).generic_string();
    if (!archive.addFile(file, name, &error)) {
      std::cerr << "Error: " << error.toString() << "\n";
      return 1;
    }
  }

  if (!archive.write(outputFile, &error)) {
    std::cerr << "Error: " << error.toString() << "\n";
    return 1;
  }

  std::cout << "Packed " << files.size() << " files into " << outputFile << "\n";
  return 0;
}
