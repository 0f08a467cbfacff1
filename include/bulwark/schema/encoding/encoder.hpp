#pragma once
#include <bulwark/schema/primitives.hpp>
#include <optional>

namespace bulwark::schema::encoding {

/// Codec selected by library tag; see scale/encoder.hpp for the one in use.
template <typename Library>
struct encoder {
  template <typename T>
  bulwark::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, bulwark::schema::bytes_t& out);

  template <typename T>
  T decode(const bulwark::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bulwark::schema::bytes_view_t& bytes);
};

}  // namespace bulwark::schema::encoding
