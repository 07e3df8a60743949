#pragma once
#include "large_blob.hpp"
#include "blob_store.hpp"
#include "hasher.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace blobkey {

// Array served before the first commit: CBOR empty array (0x80) followed by
// the first 16 bytes of SHA-256(0x80).
extern const std::vector<uint8_t> kDefaultLargeBlobArray;

// Authenticator state persisted in a single msgpack file:
//   { "v": 1, "ph": bin(16)?, "lb": bin? }
// Missing file means a fresh authenticator. Every write replaces the file
// through a temp file and rename(), so a crash leaves the old or new state.
class FileStore : public BlobStore {
public:
    explicit FileStore(std::string path,
                       size_t max_array_size = MAX_LARGE_BLOB_ARRAY_SIZE);

    std::vector<uint8_t> read(size_t length, size_t offset) const override;
    void                 commit(const std::vector<uint8_t>& array) override;
    bool                 has_pin() const override { return pin_hash_.has_value(); }
    size_t               max_array_size() const override { return max_array_size_; }

    size_t array_size() const { return array().size(); }

    // Enrols a PIN: stores the first 16 bytes of SHA-256(pin).
    void set_pin(const std::string& pin);
    // Constant-time comparison against the stored hash; false if none.
    bool verify_pin(const std::string& pin) const;

    const std::string& path() const { return path_; }

private:
    const std::vector<uint8_t>& array() const;
    void load();
    void save() const;

    std::string                         path_;
    size_t                              max_array_size_;
    Sha256Hasher                        hasher_;
    std::optional<std::vector<uint8_t>> pin_hash_;
    std::optional<std::vector<uint8_t>> large_blob_;
};

// msgpack encoding of the state file body.
std::vector<uint8_t> pack_state(const std::optional<std::vector<uint8_t>>& pin_hash,
                                const std::optional<std::vector<uint8_t>>& large_blob);

void unpack_state(const std::vector<uint8_t>& data,
                  std::optional<std::vector<uint8_t>>& pin_hash,
                  std::optional<std::vector<uint8_t>>& large_blob);

} // namespace blobkey
