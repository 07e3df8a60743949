#pragma once
#include "large_blob.hpp"
#include "blob_store.hpp"
#include "hasher.hpp"
#include "pin_token.hpp"
#include <vector>
#include <optional>
#include <cstdint>

namespace blobkey {

// Command byte of authenticatorLargeBlobs, mixed into the signed message.
static constexpr uint8_t LARGE_BLOBS_COMMAND = 0x0C;

// Implements authenticatorLargeBlobs and keeps its write state between calls.
//
// Writes arrive as ordered fragments. Nothing reaches the store until the
// fragment that completes the declared length passes the integrity check.
// Not thread-safe; the authenticator runs one command at a time.
class LargeBlobs {
public:
    enum class State { Idle, Receiving };

    LargeBlobs(BlobStore& store, AuthTokenVerifier& verifier,
               const Hasher& hasher, size_t max_msg_size = MAX_MSG_SIZE);

    // Validates the request shape, then runs get or set.
    LargeBlobsResponse process_command(const LargeBlobsParams& params);

    std::vector<uint8_t> get(size_t length, size_t offset) const;

    void set(const std::vector<uint8_t>& fragment,
             size_t offset,
             std::optional<size_t> length,
             const std::optional<std::vector<uint8_t>>& pin_uv_auth_param,
             std::optional<uint32_t> pin_uv_auth_protocol);

    size_t max_fragment_length() const { return max_fragment_length_; }

    State  state() const                { return session_.state; }
    size_t expected_length() const      { return session_.expected_length; }
    size_t expected_next_offset() const { return session_.expected_next_offset; }
    size_t buffered() const             { return session_.buffer.size(); }

private:
    struct WriteSession {
        State                state = State::Idle;
        std::vector<uint8_t> buffer;
        size_t               expected_length = 0;
        size_t               expected_next_offset = 0;
    };

    void authorize_fragment(const std::vector<uint8_t>& fragment,
                            size_t offset,
                            const std::optional<std::vector<uint8_t>>& pin_uv_auth_param,
                            std::optional<uint32_t> pin_uv_auth_protocol) const;
    void finalize();
    void clear_session();

    BlobStore&         store_;
    AuthTokenVerifier& verifier_;
    const Hasher&      hasher_;
    size_t             max_fragment_length_;
    WriteSession       session_;
};

// 0xFF x 32 || 0x0C 0x00 || u32le(offset) || hash(fragment)
std::vector<uint8_t> large_blob_auth_message(const Hasher& hasher,
                                             const std::vector<uint8_t>& fragment,
                                             size_t offset);

} // namespace blobkey
