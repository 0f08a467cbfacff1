#pragma once
#include <bulwark/schema/primitives.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>

// Little-endian cursor helpers for the fixed policy payload layout.
namespace bulwark::policy::wire {

class writer final {
 public:
  template <typename Integer>
  void put(const Integer value) {
    auto little = boost::endian::native_to_little(value);
    auto bytes = reinterpret_cast<const uint8_t*>(&little);
    out_.insert(std::end(out_), bytes, bytes + sizeof(Integer));
  }

  void put(const bulwark::schema::pubkey_t& key) {
    out_.insert(std::end(out_), std::begin(key), std::end(key));
  }

  bulwark::schema::bytes_t take() { return std::move(out_); }

 private:
  bulwark::schema::bytes_t out_;
};

class reader final {
 public:
  explicit reader(const bulwark::schema::bytes_view_t& bytes)
      : bytes_{bytes} {}

  template <typename Integer>
  std::optional<Integer> get() {
    if (remaining() < sizeof(Integer)) {
      return std::nullopt;
    }
    auto value = Integer{};
    std::copy_n(bytes_.data() + offset_, sizeof(Integer),
                reinterpret_cast<uint8_t*>(&value));
    offset_ += sizeof(Integer);
    return boost::endian::little_to_native(value);
  }

  std::optional<bulwark::schema::pubkey_t> get_key() {
    auto key = bulwark::schema::pubkey_t{};
    if (remaining() < key.size()) {
      return std::nullopt;
    }
    std::copy_n(bytes_.data() + offset_, key.size(), key.data());
    offset_ += key.size();
    return key;
  }

  std::size_t remaining() const { return bytes_.size() - offset_; }
  bool exhausted() const { return remaining() == 0; }

 private:
  bulwark::schema::bytes_view_t bytes_;
  std::size_t offset_{};
};

}  // namespace bulwark::policy::wire
