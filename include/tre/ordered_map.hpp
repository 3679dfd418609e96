#pragma once

#include <cstddef>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tre {

// Map that keeps insertion order and rejects duplicate keys.
// Values live in a contiguous vector; a hash index maps each key to its slot.
template <typename Key, typename Value> class OrderedMap {
public:
  OrderedMap() = default;

  // Returns false (and leaves the map unchanged) if the key is already present
  bool insert(const Key &key, Value value) {
    if (index_.contains(key)) {
      return false;
    }
    index_.emplace(key, values_.size());
    keys_.push_back(key);
    values_.push_back(std::move(value));
    return true;
  }

  // Removes the key, preserving the order of the remaining values
  bool erase(const Key &key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      return false;
    }
    size_t pos = it->second;
    index_.erase(it);
    keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(pos));
    values_.erase(values_.begin() + static_cast<std::ptrdiff_t>(pos));
    for (size_t i = pos; i < keys_.size(); ++i) {
      index_[keys_[i]] = i;
    }
    return true;
  }

  const Value *find(const Key &key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &values_[it->second];
  }

  Value *find(const Key &key) {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &values_[it->second];
  }

  bool contains(const Key &key) const { return index_.contains(key); }

  void reserve(size_t count) {
    keys_.reserve(count);
    values_.reserve(count);
    index_.reserve(count);
  }

  void clear() {
    keys_.clear();
    values_.clear();
    index_.clear();
  }

  size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }

  const Key &keyAt(size_t pos) const { return keys_[pos]; }
  const Value &at(size_t pos) const { return values_[pos]; }
  Value &at(size_t pos) { return values_[pos]; }

  std::span<const Value> values() const { return values_; }

  auto begin() const { return values_.begin(); }
  auto end() const { return values_.end(); }

private:
  std::vector<Key> keys_;
  std::vector<Value> values_;
  std::unordered_map<Key, size_t> index_;
};

} // namespace tre
