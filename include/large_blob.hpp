#pragma once
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <cstdint>
#include <cstddef>

namespace blobkey {

// Maximum message size supported by the authenticator transport. 1024 is the
// default; larger values speed up long responses but risk dropped packets.
static constexpr size_t MAX_MSG_SIZE = 1024;
// Bytes of each message reserved for the command envelope.
static constexpr size_t MSG_OVERHEAD = 64;
// Length of the truncated SHA-256 appended to the large blob data.
static constexpr size_t TRUNCATED_HASH_LEN = 16;
// Smallest valid array: one byte of payload plus its tag.
static constexpr size_t MIN_LARGE_BLOB_ARRAY_SIZE = TRUNCATED_HASH_LEN + 1;
// Default storage budget for the committed array.
static constexpr size_t MAX_LARGE_BLOB_ARRAY_SIZE = 2048;

// CTAP status codes raised by this service.
enum class StatusCode : uint8_t {
    Ctap1ErrInvalidParameter       = 0x02,
    Ctap1ErrInvalidLength          = 0x03,
    Ctap1ErrInvalidSeq             = 0x04,
    Ctap2ErrMissingParameter       = 0x14,
    Ctap2ErrKeyStoreFull           = 0x28,
    Ctap2ErrPinAuthInvalid         = 0x33,
    Ctap2ErrPuatRequired           = 0x36,
    Ctap2ErrLargeBlobStorageFull   = 0x3B,
    Ctap2ErrIntegrityFailure       = 0x3C,
    Ctap2ErrUnauthorizedPermission = 0x40,
    Ctap2ErrVendorInternalError    = 0xF2,
};

// "CTAP1_ERR_INVALID_SEQ" style name, for diagnostics.
const char* status_name(StatusCode code);

class LargeBlobError : public std::runtime_error {
public:
    LargeBlobError(StatusCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    explicit LargeBlobError(StatusCode code)
        : std::runtime_error(status_name(code)), code_(code) {}

    StatusCode code() const { return code_; }

private:
    StatusCode code_;
};

// Permission bits carried by a pinUvAuthToken.
enum class PinPermission : uint8_t {
    MakeCredential             = 0x01,
    GetAssertion               = 0x02,
    CredentialManagement       = 0x04,
    BioEnrollment              = 0x08,
    LargeBlobWrite             = 0x10,
    AuthenticatorConfiguration = 0x20,
};

// Decoded authenticatorLargeBlobs request.
struct LargeBlobsParams {
    std::optional<size_t>               get;     // fragment length to read
    std::optional<std::vector<uint8_t>> set;     // fragment to write
    size_t                              offset = 0;
    std::optional<size_t>               length;  // total length, first set fragment only
    std::optional<std::vector<uint8_t>> pin_uv_auth_param;
    std::optional<uint32_t>             pin_uv_auth_protocol;

    // Command-shape rules enforced before dispatch. Throws LargeBlobError.
    void check(size_t max_array_size) const;
};

// Response body; `config` is set for get and empty for set.
struct LargeBlobsResponse {
    std::optional<std::vector<uint8_t>> config;
};

} // namespace blobkey
