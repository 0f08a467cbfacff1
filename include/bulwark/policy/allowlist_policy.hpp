#pragma once
#include <bulwark/policy/allowlist.hpp>
#include <bulwark/policy/wire.hpp>
#include <bulwark/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <utility>

namespace bulwark::policy {

struct no_trailer final {
  void write(wire::writer&) const {}
  static std::optional<no_trailer> read(wire::reader&) { return no_trailer{}; }

  bool operator==(const no_trailer&) const = default;
};

inline constexpr uint16_t kDefaultMaxSlippageBps = 50;

struct slippage_trailer final {
  uint16_t max_slippage_bps{kDefaultMaxSlippageBps};

  void write(wire::writer& out) const { out.put(max_slippage_bps); }

  static std::optional<slippage_trailer> read(wire::reader& in) {
    auto bps = in.get<uint16_t>();
    if (!bps) {
      return std::nullopt;
    }
    return slippage_trailer{.max_slippage_bps = *bps};
  }

  bool operator==(const slippage_trailer&) const = default;
};

/// One allowlist followed by protocol-specific scalar fields:
/// `[count: u32][records][trailer]`, little endian.
template <typename T, typename Trailer = no_trailer>
struct allowlist_policy final {
  using principal_t = T;

  allowlist<T> allowed;
  Trailer trailer{};

  bulwark::schema::bytes_t encode() const {
    auto out = wire::writer{};
    encode_allowlist(out, allowed);
    trailer.write(out);
    return out.take();
  }

  static std::optional<allowlist_policy> try_decode(
      const bulwark::schema::bytes_view_t& bytes) {
    auto in = wire::reader{bytes};
    auto list = decode_allowlist<T>(in);
    if (!list) {
      return std::nullopt;
    }
    auto trailer = Trailer::read(in);
    if (!trailer || !in.exhausted()) {
      return std::nullopt;
    }
    return allowlist_policy{.allowed = std::move(*list),
                            .trailer = std::move(*trailer)};
  }

  bool operator==(const allowlist_policy&) const = default;
};

}  // namespace bulwark::policy
