#pragma once
#include <bulwark/schema/primitives.hpp>
#include <cstdint>
#include <memory>
#include <string_view>

namespace bulwark::blake3 {

bulwark::schema::hash32_t hash(const std::string_view& str);
bulwark::schema::hash32_t hash(const bulwark::schema::bytes_view_t& bytes);

/// Incremental hasher; feed the parts of a composite key in order.
class hasher final {
 public:
  hasher();
  ~hasher();
  hasher(const hasher&) = delete;
  hasher& operator=(const hasher&) = delete;

  hasher& update(const std::string_view& str);
  hasher& update(const bulwark::schema::bytes_view_t& bytes);
  bulwark::schema::hash32_t finalize() const;

 private:
  struct state;
  std::unique_ptr<state> state_;
};

}  // namespace bulwark::blake3
