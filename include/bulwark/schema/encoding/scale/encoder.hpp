#pragma once
#include <bulwark/common/critical.hpp>
#include <bulwark/schema/encoding/encoder.hpp>
#include <bulwark/schema/primitives.hpp>
#include <iterator>
#include <optional>
#include <utility>
#include <scale/scale.hpp>

namespace bulwark::schema::encoding {

struct scale_encoder_tag {};

// Vault records, mutations and key components are SCALE encoded by aggregate
// decomposition; policy payloads use their own fixed layout (policy/wire.hpp).
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  bulwark::schema::bytes_t encode(const T& obj);

  /// Append the encoding of obj to out (key building).
  template <typename T>
  void encode(const T& obj, bulwark::schema::bytes_t& out);

  /// Decode bytes this process wrote itself; failure means a corrupt store.
  template <typename T>
  T decode(const bulwark::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const bulwark::schema::bytes_view_t& bytes);
};

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        bulwark::schema::bytes_t& out) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    bulwark::common::critical("SCALE encoding of a vault record failed");
  }
  out.insert(std::end(out), std::begin(encoded.value()),
             std::end(encoded.value()));
}

template <typename T>
bulwark::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto out = bulwark::schema::bytes_t{};
  encode(obj, out);
  return out;
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const bulwark::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const bulwark::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    bulwark::common::critical("stored SCALE record of {} bytes is corrupt",
                              bytes.size());
  }
  return std::move(*decoded);
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace bulwark::schema::encoding
