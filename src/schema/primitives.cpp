#include <bulwark/common/critical.hpp>
#include <bulwark/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace bulwark::schema {

namespace {

constexpr auto kBase58Alphabet = std::string_view{
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"};

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<uint8_t> base58_digit(const char c) {
  auto position = kBase58Alphabet.find(c);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return static_cast<uint8_t>(position);
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    bulwark::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    bulwark::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    bulwark::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_base58(const bytes_view_t& bytes) {
  auto zeros = size_t{0};
  while (zeros < bytes.size() && bytes[zeros] == 0) {
    ++zeros;
  }

  // log(256) / log(58) ~= 1.37
  auto digits = std::vector<uint8_t>(((bytes.size() - zeros) * 138 / 100) + 1);
  auto length = size_t{0};
  for (auto index = zeros; index < bytes.size(); ++index) {
    auto carry = static_cast<uint32_t>(bytes[index]);
    auto i = size_t{0};
    for (auto it = digits.rbegin();
         (carry != 0 || i < length) && it != digits.rend(); ++it, ++i) {
      carry += 256u * (*it);
      *it = static_cast<uint8_t>(carry % 58u);
      carry /= 58u;
    }
    length = i;
  }

  auto it = std::next(std::begin(digits),
                      static_cast<std::ptrdiff_t>(digits.size() - length));
  while (it != std::end(digits) && *it == 0) {
    ++it;
  }

  auto out = std::string(zeros, '1');
  out.reserve(zeros + static_cast<size_t>(std::distance(it, std::end(digits))));
  for (; it != std::end(digits); ++it) {
    out.push_back(kBase58Alphabet[*it]);
  }
  return out;
}

std::string to_base58(const pubkey_t& key) {
  return to_base58(bytes_view_t{key.data(), key.size()});
}

std::optional<bytes_t> try_from_base58(const std::string_view encoded) {
  auto zeros = size_t{0};
  while (zeros < encoded.size() && encoded[zeros] == '1') {
    ++zeros;
  }

  // log(58) / log(256) ~= 0.733
  auto bytes = std::vector<uint8_t>(((encoded.size() - zeros) * 733 / 1000) + 1);
  auto length = size_t{0};
  for (auto index = zeros; index < encoded.size(); ++index) {
    auto digit = base58_digit(encoded[index]);
    if (!digit) {
      return std::nullopt;
    }
    auto carry = static_cast<uint32_t>(*digit);
    auto i = size_t{0};
    for (auto it = bytes.rbegin();
         (carry != 0 || i < length) && it != bytes.rend(); ++it, ++i) {
      carry += 58u * (*it);
      *it = static_cast<uint8_t>(carry % 256u);
      carry /= 256u;
    }
    length = i;
  }

  auto it = std::next(std::begin(bytes),
                      static_cast<std::ptrdiff_t>(bytes.size() - length));
  while (it != std::end(bytes) && *it == 0) {
    ++it;
  }

  auto out = bytes_t(zeros, 0);
  out.insert(std::end(out), it, std::end(bytes));
  return out;
}

std::optional<pubkey_t> try_parse_pubkey(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  if (auto hex = try_make_hash32(text)) {
    return hex;
  }
  auto decoded = try_from_base58(text);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto key = pubkey_t{};
  std::copy(decoded->begin(), decoded->end(), key.begin());
  return key;
}

std::string short_key(const pubkey_t& key) {
  auto encoded = to_base58(key);
  if (encoded.size() > 8) {
    encoded.resize(8);
  }
  return encoded + "...";
}

}  // namespace bulwark::schema
