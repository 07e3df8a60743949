#include "large_blobs.hpp"
#include <openssl/crypto.h>
#include <stdexcept>

namespace blobkey {

std::vector<uint8_t> large_blob_auth_message(const Hasher& hasher,
                                             const std::vector<uint8_t>& fragment,
                                             size_t offset)
{
    uint32_t off = static_cast<uint32_t>(offset);

    std::vector<uint8_t> msg(32, 0xFF);
    msg.reserve(32 + 2 + 4 + DIGEST_LEN);
    msg.push_back(LARGE_BLOBS_COMMAND);
    msg.push_back(0x00);
    msg.push_back((off >>  0) & 0xFF);
    msg.push_back((off >>  8) & 0xFF);
    msg.push_back((off >> 16) & 0xFF);
    msg.push_back((off >> 24) & 0xFF);
    Digest d = hasher.hash(fragment);
    msg.insert(msg.end(), d.begin(), d.end());
    return msg;
}

LargeBlobs::LargeBlobs(BlobStore& store, AuthTokenVerifier& verifier,
                       const Hasher& hasher, size_t max_msg_size)
    : store_(store), verifier_(verifier), hasher_(hasher)
{
    if (max_msg_size <= MSG_OVERHEAD)
        throw std::invalid_argument("max_msg_size must exceed the message overhead");
    max_fragment_length_ = max_msg_size - MSG_OVERHEAD;
}

LargeBlobsResponse LargeBlobs::process_command(const LargeBlobsParams& params) {
    params.check(store_.max_array_size());

    if (params.get)
        return LargeBlobsResponse{get(*params.get, params.offset)};

    if (params.set) {
        set(*params.set, params.offset, params.length,
            params.pin_uv_auth_param, params.pin_uv_auth_protocol);
        return LargeBlobsResponse{};
    }

    // check() guarantees one of get or set.
    throw LargeBlobError(StatusCode::Ctap1ErrInvalidParameter);
}

// ── get ───────────────────────────────────────────────────────────────────────

std::vector<uint8_t> LargeBlobs::get(size_t length, size_t offset) const {
    if (length > max_fragment_length_)
        throw LargeBlobError(StatusCode::Ctap1ErrInvalidLength);
    return store_.read(length, offset);
}

// ── set ───────────────────────────────────────────────────────────────────────

void LargeBlobs::set(const std::vector<uint8_t>& fragment,
                     size_t offset,
                     std::optional<size_t> length,
                     const std::optional<std::vector<uint8_t>>& pin_uv_auth_param,
                     std::optional<uint32_t> pin_uv_auth_protocol)
{
    if (fragment.size() > max_fragment_length_)
        throw LargeBlobError(StatusCode::Ctap1ErrInvalidLength);

    if (offset == 0) {
        if (!length)
            throw LargeBlobError(StatusCode::Ctap1ErrInvalidParameter,
                                 "length is required on the first fragment");
        if (*length > store_.max_array_size())
            throw LargeBlobError(StatusCode::Ctap2ErrLargeBlobStorageFull);
        clear_session();
        session_.expected_length = *length;
        session_.state = State::Receiving;
    }
    if (offset != session_.expected_next_offset)
        throw LargeBlobError(StatusCode::Ctap1ErrInvalidSeq);

    if (store_.has_pin())
        authorize_fragment(fragment, offset, pin_uv_auth_param, pin_uv_auth_protocol);

    // Length bound is checked after authentication.
    if (offset + fragment.size() > session_.expected_length)
        throw LargeBlobError(StatusCode::Ctap1ErrInvalidParameter,
                             "fragment exceeds the declared length");

    session_.buffer.insert(session_.buffer.end(), fragment.begin(), fragment.end());
    session_.expected_next_offset = session_.buffer.size();

    if (session_.expected_next_offset == session_.expected_length)
        finalize();
}

void LargeBlobs::authorize_fragment(const std::vector<uint8_t>& fragment,
                                    size_t offset,
                                    const std::optional<std::vector<uint8_t>>& pin_uv_auth_param,
                                    std::optional<uint32_t> pin_uv_auth_protocol) const
{
    if (!pin_uv_auth_param)
        throw LargeBlobError(StatusCode::Ctap2ErrPuatRequired);
    verifier_.check_protocol(pin_uv_auth_protocol);
    verifier_.has_permission(PinPermission::LargeBlobWrite);

    auto message = large_blob_auth_message(hasher_, fragment, offset);
    if (!verifier_.verify(*pin_uv_auth_protocol, message, *pin_uv_auth_param))
        throw LargeBlobError(StatusCode::Ctap2ErrPinAuthInvalid);
}

// ── finalize ──────────────────────────────────────────────────────────────────

void LargeBlobs::finalize() {
    std::vector<uint8_t> array;
    array.swap(session_.buffer);
    clear_session();

    if (array.size() < TRUNCATED_HASH_LEN)
        throw LargeBlobError(StatusCode::Ctap2ErrIntegrityFailure,
                             "array is shorter than its checksum");

    size_t hash_index = array.size() - TRUNCATED_HASH_LEN;
    Digest d = hasher_.hash(array.data(), hash_index);
    if (CRYPTO_memcmp(d.data(), array.data() + hash_index, TRUNCATED_HASH_LEN) != 0)
        throw LargeBlobError(StatusCode::Ctap2ErrIntegrityFailure);

    store_.commit(array);
}

void LargeBlobs::clear_session() {
    session_ = WriteSession{};
}

} // namespace blobkey
