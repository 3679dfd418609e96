#include <algorithm>

#include <tre/checksum.hpp>
#include <tre/diff.hpp>
#include <tre/log.hpp>
#include <tre/reader.hpp>

namespace tre {

std::string_view changeKindName(ChangeKind kind) noexcept {
  switch (kind) {
  case ChangeKind::Added:
    return "added";
  case ChangeKind::Removed:
    return "removed";
  case ChangeKind::Modified:
    return "modified";
  }
  return "unknown";
}

size_t ArchiveDiff::count(ChangeKind kind) const {
  return static_cast<size_t>(std::count_if(changes.begin(), changes.end(),
                                           [kind](const EntryChange &c) { return c.kind == kind; }));
}

ArchiveDiff diffArchives(const Reader &before, const Reader &after) {
  ArchiveDiff diff;

  for (const auto &old : before.entries()) {
    const Entry *current = after.findEntryByHash(old.nameHash);
    if (!current) {
      diff.changes.push_back({ChangeKind::Removed, old.name, &old, nullptr});
    } else if (current->size != old.size || current->contentHash != old.contentHash) {
      diff.changes.push_back({ChangeKind::Modified, current->name, &old, current});
    }
  }

  for (const auto &current : after.entries()) {
    if (!before.findEntryByHash(current.nameHash)) {
      diff.changes.push_back({ChangeKind::Added, current.name, nullptr, &current});
    }
  }

  std::stable_sort(diff.changes.begin(), diff.changes.end(),
                   [](const EntryChange &a, const EntryChange &b) {
                     return normalizePath(a.name) < normalizePath(b.name);
                   });

  TRE_LOG_DEBUG("Diff: {} added, {} removed, {} modified", diff.count(ChangeKind::Added),
                diff.count(ChangeKind::Removed), diff.count(ChangeKind::Modified));
  return diff;
}

} // namespace tre
