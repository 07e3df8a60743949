#include "hasher.hpp"
#include "large_blob.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace blobkey {

Digest Sha256Hasher::hash(const uint8_t* data, size_t len) const {
    Digest out;
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, out.data(), &out_len, EVP_sha256(), nullptr) != 1 ||
        out_len != DIGEST_LEN)
        throw std::runtime_error("SHA-256 digest failed");
    return out;
}

std::vector<uint8_t> truncated_hash(const Hasher& hasher,
                                    const uint8_t* data, size_t len)
{
    Digest d = hasher.hash(data, len);
    return std::vector<uint8_t>(d.begin(), d.begin() + TRUNCATED_HASH_LEN);
}

} // namespace blobkey
