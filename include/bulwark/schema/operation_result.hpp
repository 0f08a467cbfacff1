#pragma once

#include <bulwark/schema/policy_error_code.hpp>
#include <bulwark/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

// Schema type: operation result.
// Access workflow: Envelope returned by every local operation and every
// remote mutation: code 0 on success, policy_error_code otherwise.
namespace bulwark::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<transaction_id_t> transaction_id;

  bool ok() const { return code == 0; }
};

using operation_result_t = operation_result<1>;

inline operation_result_t make_error(const policy_error_code code,
                                     std::string log,
                                     std::string info,
                                     std::string codespace) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::move(codespace);
  return result;
}

inline bool has_code(const operation_result_t& result,
                     const policy_error_code code) {
  return result.code == static_cast<uint32_t>(code);
}

}  // namespace bulwark::schema
