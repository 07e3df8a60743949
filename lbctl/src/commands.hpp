#pragma once
#include "config.hpp"
#include "file_store.hpp"
#include "large_blobs.hpp"
#include <string>

namespace lbctl {

struct Options {
    std::string config_path;
    std::string store_path;
    std::string out_path;
    std::string pin;
    bool        have_pin = false;
    size_t      fragment = 0;
    bool        raw      = false;
    bool        verbose  = false;
    std::string arg;
};

// Platform side of authenticatorLargeBlobs: owns the store, the token and
// the session, and splits transfers into fragments.
struct Authenticator {
    blobkey::Config         cfg;
    blobkey::FileStore      store;
    blobkey::PinUvAuthToken token;
    blobkey::Sha256Hasher   hasher;
    blobkey::LargeBlobs     blobs;

    explicit Authenticator(const blobkey::Config& c)
        : cfg(c),
          store(c.store_path, c.max_large_blob_array_size),
          token(c.pin_uv_auth_protocols),
          blobs(store, token, hasher, c.max_msg_size) {}
};

blobkey::Config resolve_config(const Options& opt);

int cmd_init(const Options& opt);
int cmd_info(Authenticator& a);
int cmd_read(Authenticator& a, const Options& opt);
int cmd_write(Authenticator& a, const Options& opt);
int cmd_reset(Authenticator& a, const Options& opt);
int cmd_set_pin(Authenticator& a, const Options& opt);

// Runs one of init, info, read, write, reset, set-pin and returns the exit
// code: 0=ok, 1=usage, 2=CTAP status, 3=I/O or internal.
int run_command(const std::string& cmd, const Options& opt);

} // namespace lbctl
