#include <blake3.h>
#include <bulwark/blake3/hash.hpp>

namespace bulwark::blake3 {

struct hasher::state {
  blake3_hasher inner{};
};

hasher::hasher() : state_{std::make_unique<state>()} {
  blake3_hasher_init(&state_->inner);
}

hasher::~hasher() = default;

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_->inner, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const bulwark::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_->inner, bytes.data(), bytes.size());
  return *this;
}

bulwark::schema::hash32_t hasher::finalize() const {
  // BLAKE3_OUT_LEN
  auto output = bulwark::schema::hash32_t{};
  blake3_hasher_finalize(&state_->inner, output.data(), output.size());
  return output;
}

bulwark::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

bulwark::schema::hash32_t hash(const bulwark::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace bulwark::blake3
