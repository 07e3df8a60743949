#pragma once
#include <vector>
#include <array>
#include <cstdint>
#include <cstddef>

namespace blobkey {

static constexpr size_t DIGEST_LEN = 32;
using Digest = std::array<uint8_t, DIGEST_LEN>;

class Hasher {
public:
    virtual ~Hasher() = default;
    virtual Digest hash(const uint8_t* data, size_t len) const = 0;

    Digest hash(const std::vector<uint8_t>& data) const {
        return hash(data.data(), data.size());
    }
};

// SHA-256 via OpenSSL EVP. Throws std::runtime_error on failure.
class Sha256Hasher : public Hasher {
public:
    using Hasher::hash;
    Digest hash(const uint8_t* data, size_t len) const override;
};

// First TRUNCATED_HASH_LEN bytes of hasher.hash(data, len).
std::vector<uint8_t> truncated_hash(const Hasher& hasher,
                                    const uint8_t* data, size_t len);

} // namespace blobkey
