#include "file_store.hpp"
#include <msgpack.hpp>
#include <openssl/crypto.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <utility>
#include <sys/stat.h>

namespace blobkey {

const std::vector<uint8_t> kDefaultLargeBlobArray = {
    0x80, 0x76, 0xbe, 0x8b, 0x52, 0x8d, 0x00, 0x75, 0xf7,
    0xaa, 0xe9, 0x8d, 0x6f, 0xa5, 0x7a, 0x6d, 0x3c,
};

static constexpr uint32_t STATE_VERSION = 1;

static LargeBlobError store_error(const std::string& msg) {
    return LargeBlobError(StatusCode::Ctap2ErrVendorInternalError, "store: " + msg);
}

// ── msgpack helpers ───────────────────────────────────────────────────────────

static std::string require_str(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::STR)
        throw store_error(std::string(ctx) + ": expected string");
    return {obj.via.str.ptr, obj.via.str.size};
}

static std::vector<uint8_t> require_bin(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::BIN)
        throw store_error(std::string(ctx) + ": expected binary");
    return {reinterpret_cast<const uint8_t*>(obj.via.bin.ptr),
            reinterpret_cast<const uint8_t*>(obj.via.bin.ptr) + obj.via.bin.size};
}

static void pack_bin(msgpack::packer<msgpack::sbuffer>& pk, const std::vector<uint8_t>& v) {
    pk.pack_bin(static_cast<uint32_t>(v.size()));
    pk.pack_bin_body(reinterpret_cast<const char*>(v.data()), v.size());
}

std::vector<uint8_t> pack_state(const std::optional<std::vector<uint8_t>>& pin_hash,
                                const std::optional<std::vector<uint8_t>>& large_blob)
{
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(buf);

    pk.pack_map(1 + (pin_hash ? 1 : 0) + (large_blob ? 1 : 0));

    pk.pack(std::string("v"));
    pk.pack_uint32(STATE_VERSION);

    if (pin_hash) {
        pk.pack(std::string("ph"));
        pack_bin(pk, *pin_hash);
    }
    if (large_blob) {
        pk.pack(std::string("lb"));
        pack_bin(pk, *large_blob);
    }

    return {reinterpret_cast<const uint8_t*>(buf.data()),
            reinterpret_cast<const uint8_t*>(buf.data()) + buf.size()};
}

void unpack_state(const std::vector<uint8_t>& data,
                  std::optional<std::vector<uint8_t>>& pin_hash,
                  std::optional<std::vector<uint8_t>>& large_blob)
{
    msgpack::object_handle oh;
    try {
        oh = msgpack::unpack(reinterpret_cast<const char*>(data.data()), data.size());
    } catch (const msgpack::unpack_error& e) {
        throw store_error(std::string("malformed state file: ") + e.what());
    }
    const msgpack::object& obj = oh.get();
    if (obj.type != msgpack::type::MAP)
        throw store_error("state file must be a map");

    pin_hash.reset();
    large_blob.reset();
    bool got_v = false;

    const auto& map = obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        const auto& kv = map.ptr[i];
        std::string key = require_str(kv.key, "map key");

        if (key == "v") {
            if (kv.val.type != msgpack::type::POSITIVE_INTEGER ||
                kv.val.via.u64 != STATE_VERSION)
                throw store_error("unsupported state version");
            got_v = true;
        } else if (key == "ph") {
            pin_hash = require_bin(kv.val, "'ph'");
            if (pin_hash->size() != TRUNCATED_HASH_LEN)
                throw store_error("'ph' has the wrong length");
        } else if (key == "lb") {
            large_blob = require_bin(kv.val, "'lb'");
        }
    }

    if (!got_v)
        throw store_error("state file has no version");
}

// ── FileStore ─────────────────────────────────────────────────────────────────

FileStore::FileStore(std::string path, size_t max_array_size)
    : path_(std::move(path)), max_array_size_(max_array_size)
{
    load();
}

const std::vector<uint8_t>& FileStore::array() const {
    return large_blob_ ? *large_blob_ : kDefaultLargeBlobArray;
}

std::vector<uint8_t> FileStore::read(size_t length, size_t offset) const {
    const auto& a = array();
    size_t start = std::min(offset, a.size());
    size_t end   = start + std::min(length, a.size() - start);
    return std::vector<uint8_t>(a.begin() + start, a.begin() + end);
}

void FileStore::commit(const std::vector<uint8_t>& array) {
    if (array.size() > max_array_size_)
        throw LargeBlobError(StatusCode::Ctap2ErrKeyStoreFull);

    std::optional<std::vector<uint8_t>> previous = std::move(large_blob_);
    large_blob_ = array;
    try {
        save();
    } catch (const LargeBlobError&) {
        large_blob_ = std::move(previous);
        throw;
    }
}

void FileStore::set_pin(const std::string& pin) {
    std::optional<std::vector<uint8_t>> previous = std::move(pin_hash_);
    pin_hash_ = truncated_hash(hasher_, reinterpret_cast<const uint8_t*>(pin.data()),
                               pin.size());
    try {
        save();
    } catch (const LargeBlobError&) {
        pin_hash_ = std::move(previous);
        throw;
    }
}

bool FileStore::verify_pin(const std::string& pin) const {
    if (!pin_hash_)
        return false;
    auto h = truncated_hash(hasher_, reinterpret_cast<const uint8_t*>(pin.data()),
                            pin.size());
    return CRYPTO_memcmp(h.data(), pin_hash_->data(), TRUNCATED_HASH_LEN) == 0;
}

// ── file I/O ──────────────────────────────────────────────────────────────────

void FileStore::load() {
    struct stat st;
    errno = 0;
    if (stat(path_.c_str(), &st) != 0) {
        if (errno == ENOENT)
            return;  // fresh authenticator
        throw store_error("cannot stat " + path_ + ": " + std::strerror(errno));
    }
    if (!S_ISREG(st.st_mode))
        throw store_error(path_ + " is not a regular file");

    std::ifstream f(path_, std::ios::binary);
    if (!f)
        throw store_error("cannot open " + path_);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (!f && !f.eof())
        throw store_error("read error on " + path_);
    unpack_state(bytes, pin_hash_, large_blob_);
}

void FileStore::save() const {
    auto bytes = pack_state(pin_hash_, large_blob_);
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw store_error("cannot open " + tmp);
        f.write(reinterpret_cast<const char*>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
        f.flush();
        if (!f) {
            std::remove(tmp.c_str());
            throw store_error("write error on " + tmp);
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        int err = errno;
        std::remove(tmp.c_str());
        throw store_error("cannot replace " + path_ + ": " + std::strerror(err));
    }
}

} // namespace blobkey
