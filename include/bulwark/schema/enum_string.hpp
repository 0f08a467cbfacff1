#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace bulwark::schema {

/// Display name of an enumerator, paired as in the k*Mappings tables.
template <typename Enum>
using enum_name_t = std::pair<std::string_view, Enum>;

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<enum_name_t<Enum>, N>& mappings) {
  auto found = std::find_if(
      std::begin(mappings), std::end(mappings),
      [value](const auto& mapping) { return mapping.second == value; });
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->first;
}

}  // namespace bulwark::schema
