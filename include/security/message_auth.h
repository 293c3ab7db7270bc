#pragma once

#include "common/types.h"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace hacluster {
namespace security {

using common::Result;
using common::Timestamp;

/// Header names carried by signed peer messages
constexpr const char *TIMESTAMP_HEADER = "X-Cluster-Timestamp";
constexpr const char *NONCE_HEADER = "X-Cluster-Nonce";
constexpr const char *SIGNATURE_HEADER = "X-Cluster-Signature";

/// Constant-time string equality (length is not hidden)
bool secure_compare(const std::string &a, const std::string &b);

/// Lower-case hex HMAC-SHA256 of @p data keyed with @p key
std::string hmac_sha256_hex(const std::string &key, const std::string &data);

/// 16 random bytes from the OpenSSL CSPRNG, hex encoded
Result<bool> generate_nonce(std::string &nonce_out);

/**
 * @brief HMAC request signing for control-plane messages
 *
 * The signature covers "timestamp\nnonce\nbody" and is keyed with the
 * cluster secret. verify() rejects timestamps outside the window and nonces
 * already seen within it.
 *
 * @note Thread safety: verify() may be called from concurrent request
 *       handlers.
 */
class MessageAuthenticator {
private:
  uint32_t window_seconds_;
  size_t max_cached_nonces_;

  mutable std::mutex nonce_mutex_;
  std::map<std::string, int64_t> seen_nonces_; ///< nonce -> expiry (unix ms)

  void prune_expired_nonces(int64_t now_ms);

public:
  explicit MessageAuthenticator(uint32_t window_seconds,
                                size_t max_cached_nonces = 10000);

  /**
   * @brief Produce the three signature headers for @p body
   * @return error only if the CSPRNG fails
   */
  Result<std::map<std::string, std::string>>
  sign(const std::string &secret, const std::string &body,
       Timestamp now) const;

  Result<bool> verify(const std::string &secret, const std::string &body,
                      const std::string &timestamp,
                      const std::string &nonce,
                      const std::string &signature, Timestamp now);

  size_t cached_nonce_count() const;
};

} // namespace security
} // namespace hacluster
