#pragma once
#include <bulwark/policy/principal.hpp>
#include <bulwark/policy/wire.hpp>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <vector>

namespace bulwark::policy {

/// What an empty allowlist means for the protocol that owns it.
enum class empty_allowlist_t : uint8_t { unrestricted = 0, deny_all = 1 };

/// Unique principals kept in insertion order. Order is only kept for display;
/// membership is what the policy enforces.
template <typename T>
class allowlist final {
 public:
  allowlist() = default;
  allowlist(std::initializer_list<T> entries) {
    for (const auto& entry : entries) {
      add(entry);
    }
  }

  bool contains(const T& principal) const {
    return std::find(std::begin(entries_), std::end(entries_), principal) !=
           std::end(entries_);
  }

  /// false when the principal is already present
  bool add(const T& principal) {
    if (contains(principal)) {
      return false;
    }
    entries_.push_back(principal);
    return true;
  }

  /// false when the principal is absent
  bool remove(const T& principal) {
    auto it = std::find(std::begin(entries_), std::end(entries_), principal);
    if (it == std::end(entries_)) {
      return false;
    }
    entries_.erase(it);
    return true;
  }

  void clear() { entries_.clear(); }
  bool empty() const { return entries_.empty(); }
  std::size_t size() const { return entries_.size(); }
  const std::vector<T>& entries() const { return entries_; }

  bool permits(const T& principal, const empty_allowlist_t semantics) const {
    if (entries_.empty()) {
      return semantics == empty_allowlist_t::unrestricted;
    }
    return contains(principal);
  }

  bool same_members(const allowlist& other) const {
    return size() == other.size() &&
           std::all_of(std::begin(entries_), std::end(entries_),
                       [&](const auto& entry) { return other.contains(entry); });
  }

  bool operator==(const allowlist&) const = default;

 private:
  std::vector<T> entries_;
};

template <typename T>
void encode_allowlist(wire::writer& out, const allowlist<T>& list) {
  out.put(static_cast<uint32_t>(list.size()));
  for (const auto& entry : list.entries()) {
    principal_traits<T>::write(out, entry);
  }
}

/// Reads `[count: u32][count records]`. Rejects a count the remaining buffer
/// cannot hold and duplicate entries.
template <typename T>
std::optional<allowlist<T>> decode_allowlist(wire::reader& in) {
  auto count = in.get<uint32_t>();
  if (!count) {
    return std::nullopt;
  }
  if (in.remaining() / principal_traits<T>::kRecordSize < *count) {
    return std::nullopt;
  }
  auto list = allowlist<T>{};
  for (auto i = uint32_t{0}; i < *count; ++i) {
    auto entry = principal_traits<T>::read(in);
    if (!entry || !list.add(*entry)) {
      return std::nullopt;
    }
  }
  return list;
}

}  // namespace bulwark::policy
