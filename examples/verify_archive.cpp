#include <iostream>
#include <string>

#include <tre/tre.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.tre> [--deep]\n";
    return 1;
  }

  bool deep = argc > 2 && std::string(argv[2]) == "--deep";

  tre::Error error;
  auto archive = tre::Archive::open(argv[1], &error);
  if (!archive) {
    std::cerr << "Error: " << error.toString() << "\n";
    return 1;
  }

  tre::VerifyReport report = archive->verifyAll(deep);
  for (const auto &failure : report.failures) {
    std::cerr << "  " << failure.entryName << ": " << failure.toString() << "\n";
  }

  std::cout << "Checked " << report.checked << " entries, " << report.failures.size()
            << " failed\n";
  return report.ok() ? 0 : 1;
}
