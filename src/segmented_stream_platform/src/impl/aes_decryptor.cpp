#include "aes_decryptor.h"

namespace ssp {
namespace impl {

AesCbcDecryptor::~AesCbcDecryptor() {
    if (m_ctx) {
        EVP_CIPHER_CTX_free(m_ctx);
    }
}

AesCbcDecryptor::AesCbcDecryptor(AesCbcDecryptor&& other) noexcept
    : m_ctx(other.m_ctx)
    , m_pending(std::move(other.m_pending))
    , m_held_block(std::move(other.m_held_block)) {
    other.m_ctx = nullptr;
}

AesCbcDecryptor& AesCbcDecryptor::operator=(AesCbcDecryptor&& other) noexcept {
    if (this != &other) {
        if (m_ctx) {
            EVP_CIPHER_CTX_free(m_ctx);
        }
        m_ctx = other.m_ctx;
        m_pending = std::move(other.m_pending);
        m_held_block = std::move(other.m_held_block);
        other.m_ctx = nullptr;
    }
    return *this;
}

Result<void> AesCbcDecryptor::init(const Bytes& key, const std::array<uint8_t, 16>& iv) {
    if (key.size() != kBlockSize) {
        return Error::decryption_failed("AES-128 key must be 16 bytes, got " +
                                        std::to_string(key.size()));
    }

    if (m_ctx) {
        EVP_CIPHER_CTX_free(m_ctx);
    }
    m_ctx = EVP_CIPHER_CTX_new();
    if (m_ctx == nullptr) {
        return Error::internal("Failed to allocate EVP_CIPHER_CTX");
    }

    if (EVP_DecryptInit_ex(m_ctx, EVP_aes_128_cbc(), nullptr, key.data(), iv.data()) != 1 ||
        EVP_CIPHER_CTX_set_padding(m_ctx, 0) != 1) {
        EVP_CIPHER_CTX_free(m_ctx);
        m_ctx = nullptr;
        return Error::decryption_failed("Failed to initialise AES-128-CBC");
    }

    m_pending.clear();
    m_held_block.clear();
    return Result<void>();
}

Result<Bytes> AesCbcDecryptor::update(const uint8_t* data, size_t len) {
    if (m_ctx == nullptr) {
        return Error::internal("AesCbcDecryptor::update before init");
    }

    m_pending.insert(m_pending.end(), data, data + len);
    size_t whole = (m_pending.size() / kBlockSize) * kBlockSize;
    if (whole == 0) {
        return Bytes();
    }

    Bytes plain(whole);
    int out_len = 0;
    if (EVP_DecryptUpdate(m_ctx, plain.data(), &out_len, m_pending.data(),
                          static_cast<int>(whole)) != 1) {
        return Error::decryption_failed("EVP_DecryptUpdate failed");
    }
    plain.resize(static_cast<size_t>(out_len));
    m_pending.erase(m_pending.begin(), m_pending.begin() + static_cast<std::ptrdiff_t>(whole));

    Bytes out;
    out.swap(m_held_block);
    if (plain.size() >= kBlockSize) {
        auto split = plain.end() - static_cast<std::ptrdiff_t>(kBlockSize);
        out.insert(out.end(), plain.begin(), split);
        m_held_block.assign(split, plain.end());
    } else {
        out.insert(out.end(), plain.begin(), plain.end());
    }
    return out;
}

Result<Bytes> AesCbcDecryptor::finish(size_t* residual) {
    if (residual) {
        *residual = m_pending.size();
    }
    m_pending.clear();

    Bytes out;
    out.swap(m_held_block);
    if (out.size() == kBlockSize) {
        uint8_t pad = out.back();
        bool valid = pad >= 1 && pad <= kBlockSize;
        for (size_t i = 0; valid && i < pad; ++i) {
            valid = out[kBlockSize - 1 - i] == pad;
        }
        if (valid) {
            out.resize(kBlockSize - pad);
        }
    }
    return out;
}

} // namespace impl
} // namespace ssp
