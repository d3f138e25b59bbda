#pragma once

// OpenSSL headers - ONLY allowed in impl/ directory
#include <openssl/evp.h>

#include <segmented_stream_platform/ssp_errors.h>
#include <segmented_stream_platform/ssp_ring_buffer.h>

#include <array>
#include <cstdint>

namespace ssp {
namespace impl {

// Streaming AES-128-CBC decryptor for one HLS segment.
// Input may arrive in any chunking; only whole 16-byte blocks are
// decrypted and the remainder is carried into the next update(). The last
// decrypted block is held back until finish() so PKCS#7 padding can be
// stripped.
class AesCbcDecryptor {
public:
    AesCbcDecryptor() = default;
    ~AesCbcDecryptor();

    // Non-copyable
    AesCbcDecryptor(const AesCbcDecryptor&) = delete;
    AesCbcDecryptor& operator=(const AesCbcDecryptor&) = delete;

    // Move semantics
    AesCbcDecryptor(AesCbcDecryptor&& other) noexcept;
    AesCbcDecryptor& operator=(AesCbcDecryptor&& other) noexcept;

    Result<void> init(const Bytes& key, const std::array<uint8_t, 16>& iv);

    // Decrypt as many whole blocks as available
    Result<Bytes> update(const uint8_t* data, size_t len);

    // Flush the held-back block. Returns the bytes that never formed a
    // block through residual (they are not decryptable).
    Result<Bytes> finish(size_t* residual);

    static constexpr size_t kBlockSize = 16;

private:
    EVP_CIPHER_CTX* m_ctx = nullptr;
    Bytes m_pending;     // ciphertext not yet a whole block
    Bytes m_held_block;  // last decrypted block
};

} // namespace impl
} // namespace ssp
