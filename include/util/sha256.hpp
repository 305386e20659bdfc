// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

// Forward declaration (OpenSSL)
struct evp_md_ctx_st;

namespace floodchain {

// Raw SHA-256 digest
using Digest = std::array<uint8_t, 32>;

/**
 * CSHA256 - incremental SHA-256 hasher backed by OpenSSL's EVP interface
 *
 * Usage:
 *   Digest out;
 *   CSHA256().Write(data, len).Finalize(out.data());
 *
 * Throws std::runtime_error if OpenSSL fails to allocate or initialize a
 * digest context.
 */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  ~CSHA256();

  CSHA256(const CSHA256 &) = delete;
  CSHA256 &operator=(const CSHA256 &) = delete;

  CSHA256 &Write(const uint8_t *data, size_t len);
  CSHA256 &Write(std::span<const uint8_t> data) { return Write(data.data(), data.size()); }
  CSHA256 &Write(const std::string &data) {
    return Write(reinterpret_cast<const uint8_t *>(data.data()), data.size());
  }

  // Writes OUTPUT_SIZE bytes to hash. The hasher must be Reset() before reuse.
  void Finalize(uint8_t hash[OUTPUT_SIZE]);

  CSHA256 &Reset();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st *ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

// One-shot helper
Digest Sha256(std::span<const uint8_t> data);
Digest Sha256(const std::string &data);

} // namespace floodchain
