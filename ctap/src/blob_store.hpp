#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>

namespace blobkey {

// Durable home of the committed large blob array.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    // Up to `length` bytes of the committed array starting at `offset`.
    // Returns a short or empty slice at or past the end of the array.
    virtual std::vector<uint8_t> read(size_t length, size_t offset) const = 0;

    // Atomically replaces the committed array. Throws LargeBlobError; the
    // previous array stays in place on failure.
    virtual void commit(const std::vector<uint8_t>& array) = 0;

    // True once a PIN has been enrolled.
    virtual bool has_pin() const = 0;

    virtual size_t max_array_size() const = 0;
};

} // namespace blobkey
