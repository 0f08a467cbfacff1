#include <bulwark/policy/bitmask.hpp>
#include <bulwark/policy/registry.hpp>

#include <algorithm>

namespace bulwark::policy {

std::string format_bits(const uint64_t mask, const std::size_t width) {
  auto digits = std::size_t{0};
  for (auto remaining = mask; remaining != 0; remaining >>= 1u) {
    ++digits;
  }
  auto out = std::string(std::max(width, digits), '0');
  auto position = out.size();
  for (auto remaining = mask; remaining != 0; remaining >>= 1u) {
    --position;
    if ((remaining & 1u) != 0) {
      out[position] = '1';
    }
  }
  return out;
}

std::vector<std::string> protocol_names(
    const registry& protocols,
    const bulwark::schema::integration_program_t& program,
    const bulwark::schema::protocols_bitmask_t mask) {
  auto names = std::vector<std::string>{};
  for (const auto flag : set_flags(mask)) {
    if (auto protocol = protocols.resolve(program, flag)) {
      names.emplace_back(protocol->name);
    } else {
      names.push_back(std::to_string(flag));
    }
  }
  return names;
}

std::vector<std::string> permission_names(
    const registry& protocols,
    const bulwark::schema::integration_program_t& program,
    const bulwark::schema::protocol_bitflag_t bitflag,
    const bulwark::schema::permissions_bitmask_t mask) {
  auto protocol = protocols.resolve(program, bitflag);
  auto names = std::vector<std::string>{};
  for (const auto bit : set_bits(mask)) {
    auto name = protocol ? protocol->permission_name(bit) : std::nullopt;
    if (name) {
      names.emplace_back(*name);
    } else {
      names.push_back(
          std::to_string(bulwark::schema::permissions_bitmask_t{1} << bit));
    }
  }
  return names;
}

}  // namespace bulwark::policy
