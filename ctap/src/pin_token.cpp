#include "pin_token.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace blobkey {

static std::array<uint8_t, 32> hmac_sha256(const uint8_t* key, size_t key_len,
                                           const std::vector<uint8_t>& msg)
{
    std::array<uint8_t, 32> mac;
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(), key, static_cast<int>(key_len),
              msg.data(), msg.size(), mac.data(), &mac_len) || mac_len != mac.size())
        throw std::runtime_error("HMAC-SHA256 failed");
    return mac;
}

static size_t param_len(uint32_t protocol) {
    return protocol == 1 ? 16 : 32;
}

PinUvAuthToken::PinUvAuthToken(std::vector<uint32_t> protocols)
    : protocols_(std::move(protocols))
{
    reset();
}

PinUvAuthToken::PinUvAuthToken(const std::array<uint8_t, PIN_TOKEN_LEN>& token,
                               std::vector<uint32_t> protocols)
    : token_(token), protocols_(std::move(protocols)) {}

void PinUvAuthToken::reset() {
    if (RAND_bytes(token_.data(), static_cast<int>(token_.size())) != 1)
        throw std::runtime_error("RAND_bytes failed");
    permissions_ = 0;
}

void PinUvAuthToken::check_protocol(std::optional<uint32_t> protocol) const {
    if (!protocol)
        throw LargeBlobError(StatusCode::Ctap2ErrMissingParameter,
                             "pinUvAuthProtocol is required");
    if (std::find(protocols_.begin(), protocols_.end(), *protocol) == protocols_.end())
        throw LargeBlobError(StatusCode::Ctap1ErrInvalidParameter,
                             "unsupported pinUvAuthProtocol " + std::to_string(*protocol));
}

void PinUvAuthToken::has_permission(PinPermission perm) const {
    if ((permissions_ & static_cast<uint8_t>(perm)) == 0)
        throw LargeBlobError(StatusCode::Ctap2ErrUnauthorizedPermission);
}

bool PinUvAuthToken::verify(uint32_t protocol,
                            const std::vector<uint8_t>& message,
                            const std::vector<uint8_t>& pin_uv_auth_param) const
{
    size_t n = param_len(protocol);
    if (pin_uv_auth_param.size() != n)
        return false;
    auto mac = hmac_sha256(token_.data(), token_.size(), message);
    return CRYPTO_memcmp(mac.data(), pin_uv_auth_param.data(), n) == 0;
}

std::vector<uint8_t> PinUvAuthToken::authenticate(uint32_t protocol,
                                                  const std::vector<uint8_t>& message) const
{
    auto mac = hmac_sha256(token_.data(), token_.size(), message);
    return std::vector<uint8_t>(mac.begin(), mac.begin() + param_len(protocol));
}

} // namespace blobkey
