#pragma once
#include "large_blob.hpp"
#include <array>
#include <vector>
#include <optional>
#include <cstdint>

namespace blobkey {

static constexpr size_t PIN_TOKEN_LEN = 32;

class AuthTokenVerifier {
public:
    virtual ~AuthTokenVerifier() = default;

    // Throws Ctap2ErrMissingParameter if absent, Ctap1ErrInvalidParameter
    // if the protocol is not supported.
    virtual void check_protocol(std::optional<uint32_t> protocol) const = 0;

    // Throws Ctap2ErrUnauthorizedPermission if the token lacks `perm`.
    virtual void has_permission(PinPermission perm) const = 0;

    virtual bool verify(uint32_t protocol,
                        const std::vector<uint8_t>& message,
                        const std::vector<uint8_t>& pin_uv_auth_param) const = 0;
};

// The authenticator's current pinUvAuthToken.
//
// Protocol 1 authenticates with HMAC-SHA256(token, message) truncated to
// 16 bytes; protocol 2 uses the full 32-byte HMAC.
class PinUvAuthToken : public AuthTokenVerifier {
public:
    // Fresh random token, no permissions.
    explicit PinUvAuthToken(std::vector<uint32_t> protocols = {1, 2});
    // Fixed token, for known-answer tests.
    PinUvAuthToken(const std::array<uint8_t, PIN_TOKEN_LEN>& token,
                   std::vector<uint32_t> protocols = {1, 2});

    void check_protocol(std::optional<uint32_t> protocol) const override;
    void has_permission(PinPermission perm) const override;
    bool verify(uint32_t protocol,
                const std::vector<uint8_t>& message,
                const std::vector<uint8_t>& pin_uv_auth_param) const override;

    // pinUvAuthParam a platform holding this token would send for `message`.
    std::vector<uint8_t> authenticate(uint32_t protocol,
                                      const std::vector<uint8_t>& message) const;

    // Regenerates the token and drops all permissions.
    void reset();

    void    set_permissions(uint8_t mask) { permissions_ = mask; }
    uint8_t permissions() const           { return permissions_; }

private:
    std::array<uint8_t, PIN_TOKEN_LEN> token_;
    uint8_t                            permissions_ = 0;
    std::vector<uint32_t>              protocols_;
};

} // namespace blobkey
