#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace tre {

class Reader;

enum class ChangeKind { Added, Removed, Modified };

std::string_view changeKindName(ChangeKind kind) noexcept;

// One entry that differs between two archives. `before` / `after` point into the
// compared readers and are null for added / removed entries respectively.
struct EntryChange {
  ChangeKind kind = ChangeKind::Modified;
  std::string name;
  const Entry *before = nullptr;
  const Entry *after = nullptr;
};

struct ArchiveDiff {
  std::vector<EntryChange> changes; // Sorted by normalized name

  bool identical() const { return changes.empty(); }
  size_t count(ChangeKind kind) const;
};

// Compare two archives entry by entry, from their indexes alone (no extraction).
// Names match case-insensitively; an entry is modified when its size or content
// hash differs. Storage details (compression, offsets) are ignored.
ArchiveDiff diffArchives(const Reader &before, const Reader &after);

} // namespace tre
