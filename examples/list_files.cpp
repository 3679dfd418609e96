#include <iostream>

#include <tre/tre.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.tre>\n";
    return 1;
  }

  tre::Error error;
  auto archive = tre::Archive::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error: " << error.toString() << "\n";
    return 1;
  }

  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Entries: " << archive->entryCount() << " ("
            << archive->reader()->totalUncompressedSize() << " bytes uncompressed)\n\n";

  for (const auto &entry : archive->entries()) {
    std::cout << "  " << entry.name << " (" << entry.size << " bytes, " << entry.storedSize
              << " stored, " << tre::compressionMethodName(entry.method) << ")\n";
  }

  return 0;
}
