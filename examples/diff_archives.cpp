#include <iostream>

#include <tre/tre.hpp>

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <old.tre> <new.tre>\n";
    return 2;
  }

  tre::Error error;
  auto before = tre::Archive::open(argv[1], &error);
  if (!before) {
    std::cerr << "Error: " << argv[1] << ": " << error.toString() << "\n";
    return 2;
  }

  auto after = tre::Archive::open(argv[2], &error);
  if (!after) {
    std::cerr << "Error: " << argv[2] << ": " << error.toString() << "\n";
    return 2;
  }

  tre::ArchiveDiff diff = tre::diffArchives(*before->reader(), *after->reader());

  for (const auto &change : diff.changes) {
    switch (change.kind) {
    case tre::ChangeKind::Added:
      std::cout << "+ " << change.name << " (" << change.after->size << " bytes)\n";
      break;
    case tre::ChangeKind::Removed:
      std::cout << "- " << change.name << " (" << change.before->size << " bytes)\n";
      break;
    case tre::ChangeKind::Modified:
      std::cout << "~ " << change.name << " (" << change.before->size << " -> "
                << change.after->size << " bytes, md5 " << tre::toHex(change.before->contentHash)
                << " -> " << tre::toHex(change.after->contentHash) << ")\n";
      break;
    }
  }

  std::cout << diff.count(tre::ChangeKind::Added) << " added, "
            << diff.count(tre::ChangeKind::Removed) << " removed, "
            << diff.count(tre::ChangeKind::Modified) << " modified\n";
  return diff.identical() ? 0 : 1;
}
