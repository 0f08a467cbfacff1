#pragma once
#include <bulwark/schema/primitives.hpp>

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace bulwark::policy {

class registry;

/// Single-bit mask for `ordinal`, or std::nullopt when the ordinal does not
/// fit the mask width.
template <std::unsigned_integral Mask>
constexpr std::optional<Mask> make_bit(const unsigned ordinal) {
  if (ordinal >= static_cast<unsigned>(std::numeric_limits<Mask>::digits)) {
    return std::nullopt;
  }
  return static_cast<Mask>(Mask{1} << ordinal);
}

/// Ordinal of a single-bit flag, std::nullopt for zero or multi-bit masks.
template <std::unsigned_integral Mask>
constexpr std::optional<uint8_t> ordinal_of(const Mask flag) {
  if (!std::has_single_bit(flag)) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(std::countr_zero(flag));
}

/// Forward iterator over the set-bit ordinals of a mask, lowest first.
template <std::unsigned_integral Mask>
class bit_iterator final {
 public:
  using value_type = uint8_t;
  using difference_type = std::ptrdiff_t;
  using iterator_category = std::forward_iterator_tag;
  using reference = uint8_t;
  using pointer = void;

  bit_iterator() = default;
  explicit bit_iterator(const Mask remaining) : remaining_{remaining} {}

  uint8_t operator*() const {
    return static_cast<uint8_t>(std::countr_zero(remaining_));
  }

  bit_iterator& operator++() {
    remaining_ = static_cast<Mask>(remaining_ & (remaining_ - 1));
    return *this;
  }

  bit_iterator operator++(int) {
    auto copy = *this;
    ++(*this);
    return copy;
  }

  bool operator==(const bit_iterator&) const = default;

 private:
  Mask remaining_{};
};

/// Lazy view of the set bits of a mask. Holds the mask by value, so it can be
/// walked any number of times.
template <std::unsigned_integral Mask>
struct bit_range final {
  Mask mask{};

  bit_iterator<Mask> begin() const { return bit_iterator<Mask>{mask}; }
  bit_iterator<Mask> end() const { return bit_iterator<Mask>{}; }
  bool empty() const { return mask == 0; }
  std::size_t size() const { return static_cast<std::size_t>(std::popcount(mask)); }
};

template <std::unsigned_integral Mask>
constexpr bit_range<Mask> set_bits(const Mask mask) {
  return bit_range<Mask>{mask};
}

/// Single-bit masks making up `mask`, lowest first.
template <std::unsigned_integral Mask>
std::vector<Mask> set_flags(const Mask mask) {
  auto flags = std::vector<Mask>{};
  flags.reserve(std::popcount(mask));
  for (const auto ordinal : set_bits(mask)) {
    flags.push_back(static_cast<Mask>(Mask{1} << ordinal));
  }
  return flags;
}

/// Zero padded binary rendering, e.g. format_bits(5, 8) == "00000101".
std::string format_bits(uint64_t mask, std::size_t width = 16);

/// Names of the protocols enabled in `mask`; unknown bits render as their
/// numeric flag value.
std::vector<std::string> protocol_names(
    const registry& protocols,
    const bulwark::schema::integration_program_t& program,
    bulwark::schema::protocols_bitmask_t mask);

/// Names of the permissions set in `mask` for one protocol; unknown bits
/// (or an unknown protocol) render as their numeric flag value.
std::vector<std::string> permission_names(
    const registry& protocols,
    const bulwark::schema::integration_program_t& program,
    bulwark::schema::protocol_bitflag_t bitflag,
    bulwark::schema::permissions_bitmask_t mask);

}  // namespace bulwark::policy
