#include "security/message_auth.h"
#include "common/logging.h"
#include <cstdlib>
#include <iomanip>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <sstream>
#include <vector>

namespace hacluster {
namespace security {

namespace {

std::string to_hex(const unsigned char *data, size_t size) {
  std::stringstream ss;
  for (size_t i = 0; i < size; ++i) {
    ss << std::hex << std::setfill('0') << std::setw(2)
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::string signing_payload(const std::string &timestamp,
                            const std::string &nonce,
                            const std::string &body) {
  return timestamp + "\n" + nonce + "\n" + body;
}

} // namespace

bool secure_compare(const std::string &a, const std::string &b) {
  if (a.size() != b.size()) {
    return false;
  }
  if (a.empty()) {
    return true;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string hmac_sha256_hex(const std::string &key, const std::string &data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
       reinterpret_cast<const unsigned char *>(data.data()), data.size(),
       digest, &digest_len);
  return to_hex(digest, digest_len);
}

Result<bool> generate_nonce(std::string &nonce_out) {
  std::vector<unsigned char> random_bytes(16);
  if (RAND_bytes(random_bytes.data(), static_cast<int>(random_bytes.size())) !=
      1) {
    return Result<bool>("Failed to generate secure random bytes");
  }
  nonce_out = to_hex(random_bytes.data(), random_bytes.size());
  return Result<bool>(true);
}

MessageAuthenticator::MessageAuthenticator(uint32_t window_seconds,
                                           size_t max_cached_nonces)
    : window_seconds_(window_seconds), max_cached_nonces_(max_cached_nonces) {}

Result<std::map<std::string, std::string>>
MessageAuthenticator::sign(const std::string &secret, const std::string &body,
                           Timestamp now) const {
  using Headers = std::map<std::string, std::string>;

  std::string nonce;
  auto generated = generate_nonce(nonce);
  if (!generated.is_ok()) {
    return Result<Headers>(generated.error());
  }

  std::string timestamp = std::to_string(common::to_unix_millis(now));
  Headers headers;
  headers[TIMESTAMP_HEADER] = timestamp;
  headers[NONCE_HEADER] = nonce;
  headers[SIGNATURE_HEADER] =
      hmac_sha256_hex(secret, signing_payload(timestamp, nonce, body));
  return Result<Headers>(headers);
}

Result<bool> MessageAuthenticator::verify(const std::string &secret,
                                          const std::string &body,
                                          const std::string &timestamp,
                                          const std::string &nonce,
                                          const std::string &signature,
                                          Timestamp now) {
  if (timestamp.empty() || nonce.empty() || signature.empty()) {
    return Result<bool>("missing signature headers");
  }

  char *end = nullptr;
  long long sent_ms = std::strtoll(timestamp.c_str(), &end, 10);
  if (end == timestamp.c_str() || *end != '\0') {
    return Result<bool>("malformed signature timestamp");
  }

  int64_t now_ms = common::to_unix_millis(now);
  int64_t window_ms = static_cast<int64_t>(window_seconds_) * 1000;
  int64_t skew = now_ms - static_cast<int64_t>(sent_ms);
  if (skew > window_ms || skew < -window_ms) {
    return Result<bool>("signature timestamp outside accepted window");
  }

  std::string expected =
      hmac_sha256_hex(secret, signing_payload(timestamp, nonce, body));
  if (!secure_compare(expected, signature)) {
    return Result<bool>("invalid message signature");
  }

  std::lock_guard<std::mutex> lock(nonce_mutex_);
  prune_expired_nonces(now_ms);
  if (seen_nonces_.count(nonce) > 0) {
    LOG_WARN("auth", "replayed nonce rejected");
    return Result<bool>("replayed message nonce");
  }
  if (!seen_nonces_.empty() && seen_nonces_.size() >= max_cached_nonces_) {
    // Evict the entry closest to expiry
    auto oldest = seen_nonces_.begin();
    for (auto it = seen_nonces_.begin(); it != seen_nonces_.end(); ++it) {
      if (it->second < oldest->second)
        oldest = it;
    }
    seen_nonces_.erase(oldest);
  }
  seen_nonces_[nonce] = static_cast<int64_t>(sent_ms) + window_ms;
  return Result<bool>(true);
}

void MessageAuthenticator::prune_expired_nonces(int64_t now_ms) {
  for (auto it = seen_nonces_.begin(); it != seen_nonces_.end();) {
    if (it->second < now_ms) {
      it = seen_nonces_.erase(it);
    } else {
      ++it;
    }
  }
}

size_t MessageAuthenticator::cached_nonce_count() const {
  std::lock_guard<std::mutex> lock(nonce_mutex_);
  return seen_nonces_.size();
}

} // namespace security
} // namespace hacluster
