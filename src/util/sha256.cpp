// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace floodchain {

void CSHA256::CtxDeleter::operator()(evp_md_ctx_st *ctx) const {
  EVP_MD_CTX_free(ctx);
}

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }
  Reset();
}

CSHA256::~CSHA256() = default;

CSHA256 &CSHA256::Reset() {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  return *this;
}

CSHA256 &CSHA256::Write(const uint8_t *data, size_t len) {
  if (len > 0 && EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

void CSHA256::Finalize(uint8_t hash[OUTPUT_SIZE]) {
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), hash, &out_len) != 1 || out_len != OUTPUT_SIZE) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
}

Digest Sha256(std::span<const uint8_t> data) {
  Digest out;
  CSHA256().Write(data).Finalize(out.data());
  return out;
}

Digest Sha256(const std::string &data) {
  Digest out;
  CSHA256().Write(data).Finalize(out.data());
  return out;
}

} // namespace floodchain
