#include "large_blob.hpp"

namespace blobkey {

// ── Request shape ─────────────────────────────────────────────────────────────

void LargeBlobsParams::check(size_t max_array_size) const {
    if (get.has_value() == set.has_value())
        throw LargeBlobError(StatusCode::Ctap1ErrInvalidParameter,
                             "exactly one of get or set must be present");

    if (get) {
        if (length)
            throw LargeBlobError(StatusCode::Ctap1ErrInvalidParameter,
                                 "length is not allowed with get");
        return;
    }

    // A missing length at offset 0 is reported by the session itself.
    if (offset != 0 && length)
        throw LargeBlobError(StatusCode::Ctap1ErrInvalidParameter,
                             "length is only allowed on the first fragment");
    if (length) {
        if (*length > max_array_size)
            throw LargeBlobError(StatusCode::Ctap2ErrLargeBlobStorageFull);
        if (*length < MIN_LARGE_BLOB_ARRAY_SIZE)
            throw LargeBlobError(StatusCode::Ctap1ErrInvalidParameter,
                                 "length is below the minimum array size");
    }
}

} // namespace blobkey
