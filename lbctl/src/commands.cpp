#include "commands.hpp"

#include <algorithm>
#include <iostream>
#include <fstream>
#include <iterator>
#include <vector>
#include <string>
#include <cstring>
#include <stdexcept>
#include <openssl/crypto.h>

using namespace blobkey;

namespace lbctl {

// ── File reading ──────────────────────────────────────────────────────────────

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Cannot open file: " + path);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)),
                                 std::istreambuf_iterator<char>());
}

Config resolve_config(const Options& opt) {
    Config cfg = opt.config_path.empty() ? Config{} : load_config(opt.config_path);
    if (!opt.store_path.empty())
        cfg.store_path = opt.store_path;
    return cfg;
}

// Checks the PIN and grants a LargeBlobWrite token, as getPinUvAuthToken would.
static bool unlock(Authenticator& a, const Options& opt) {
    if (!a.store.has_pin())
        return true;
    if (!opt.have_pin) {
        std::cerr << "Error: a PIN is enrolled; --pin is required\n";
        return false;
    }
    if (!a.store.verify_pin(opt.pin)) {
        std::cerr << "Error: wrong PIN\n";
        return false;
    }
    a.token.reset();
    a.token.set_permissions(static_cast<uint8_t>(PinPermission::LargeBlobWrite));
    return true;
}

static int ctap_failure(const char* what, const LargeBlobError& e) {
    std::cerr << "Error: " << what << " failed: " << status_name(e.code())
              << " (0x" << std::hex << static_cast<int>(e.code()) << std::dec << ")";
    if (std::strcmp(e.what(), status_name(e.code())) != 0)
        std::cerr << ": " << e.what();
    std::cerr << "\n";
    return 2;
}

// Sends `array` through the session in fragments of at most `fragment` bytes.
static int send_array(Authenticator& a, const Options& opt,
                      const std::vector<uint8_t>& array)
{
    size_t step = a.blobs.max_fragment_length();
    if (opt.fragment != 0) {
        if (opt.fragment > step) {
            std::cerr << "Error: --fragment " << opt.fragment
                      << " exceeds the maximum fragment length " << step << "\n";
            return 1;
        }
        step = opt.fragment;
    }

    uint32_t protocol = a.cfg.pin_uv_auth_protocols.back();
    for (size_t off = 0; off < array.size(); off += step) {
        size_t end = std::min(off + step, array.size());

        LargeBlobsParams p;
        p.set    = std::vector<uint8_t>(array.begin() + off, array.begin() + end);
        p.offset = off;
        if (off == 0)
            p.length = array.size();
        if (a.store.has_pin()) {
            p.pin_uv_auth_param =
                a.token.authenticate(protocol, large_blob_auth_message(a.hasher, *p.set, off));
            p.pin_uv_auth_protocol = protocol;
        }

        try {
            a.blobs.process_command(p);
        } catch (const LargeBlobError& e) {
            return ctap_failure("write", e);
        }
        if (opt.verbose)
            std::cerr << "sent [" << off << ", " << end << ") of " << array.size() << "\n";
    }
    return 0;
}

// ── Commands ──────────────────────────────────────────────────────────────────

int cmd_init(const Options& opt) {
    if (opt.config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        return 1;
    }
    Config cfg;
    if (!opt.store_path.empty())
        cfg.store_path = opt.store_path;

    std::ofstream f(opt.config_path);
    if (!f) {
        std::cerr << "Error: cannot write " << opt.config_path << "\n";
        return 3;
    }
    f << emit_config_yaml(cfg);
    if (!f) {
        std::cerr << "Error: write error on " << opt.config_path << "\n";
        return 3;
    }
    return 0;
}

int cmd_info(Authenticator& a) {
    std::cout << "store:            " << a.store.path() << "\n"
              << "pin:              " << (a.store.has_pin() ? "set" : "not set") << "\n"
              << "array length:     " << a.store.array_size() << "\n"
              << "max array length: " << a.store.max_array_size() << "\n"
              << "max fragment:     " << a.blobs.max_fragment_length() << "\n";
    return 0;
}

int cmd_read(Authenticator& a, const Options& opt) {
    std::vector<uint8_t> array;
    size_t step = a.blobs.max_fragment_length();

    for (;;) {
        LargeBlobsParams p;
        p.get    = step;
        p.offset = array.size();
        LargeBlobsResponse r;
        try {
            r = a.blobs.process_command(p);
        } catch (const LargeBlobError& e) {
            return ctap_failure("read", e);
        }
        const auto& part = *r.config;
        array.insert(array.end(), part.begin(), part.end());
        if (opt.verbose)
            std::cerr << "read " << part.size() << " bytes at " << p.offset << "\n";
        if (part.size() < step)
            break;
    }

    if (array.size() < TRUNCATED_HASH_LEN) {
        std::cerr << "Warning: stored array is shorter than its checksum\n";
    } else {
        size_t n = array.size() - TRUNCATED_HASH_LEN;
        Digest d = a.hasher.hash(array.data(), n);
        if (CRYPTO_memcmp(d.data(), array.data() + n, TRUNCATED_HASH_LEN) != 0)
            std::cerr << "Warning: stored array checksum does not match\n";
    }

    if (opt.out_path.empty()) {
        std::cout.write(reinterpret_cast<const char*>(array.data()),
                        static_cast<std::streamsize>(array.size()));
        return 0;
    }
    std::ofstream f(opt.out_path, std::ios::binary);
    if (!f) {
        std::cerr << "Error: cannot write " << opt.out_path << "\n";
        return 3;
    }
    f.write(reinterpret_cast<const char*>(array.data()),
            static_cast<std::streamsize>(array.size()));
    if (!f) {
        std::cerr << "Error: write error on " << opt.out_path << "\n";
        return 3;
    }
    return 0;
}

int cmd_write(Authenticator& a, const Options& opt) {
    if (opt.arg.empty()) {
        std::cerr << "Error: <payload-file> is required\n";
        return 1;
    }
    std::vector<uint8_t> array;
    try {
        array = read_file(opt.arg);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }
    if (!opt.raw) {
        auto tag = truncated_hash(a.hasher, array.data(), array.size());
        array.insert(array.end(), tag.begin(), tag.end());
    }
    if (array.size() < MIN_LARGE_BLOB_ARRAY_SIZE) {
        std::cerr << "Error: array of " << array.size() << " bytes is below the minimum of "
                  << MIN_LARGE_BLOB_ARRAY_SIZE << "\n";
        return 1;
    }
    if (!unlock(a, opt))
        return 2;
    return send_array(a, opt, array);
}

int cmd_reset(Authenticator& a, const Options& opt) {
    if (!unlock(a, opt))
        return 2;
    return send_array(a, opt, kDefaultLargeBlobArray);
}

int cmd_set_pin(Authenticator& a, const Options& opt) {
    if (opt.arg.size() < 4) {
        std::cerr << "Error: PIN must be at least 4 characters\n";
        return 1;
    }
    if (a.store.has_pin()) {
        std::cerr << "Error: a PIN is already enrolled\n";
        return 2;
    }
    a.store.set_pin(opt.arg);
    return 0;
}

// ── Dispatch ──────────────────────────────────────────────────────────────────

int run_command(const std::string& cmd, const Options& opt) {
    if (cmd == "init")
        return cmd_init(opt);

    try {
        Authenticator a(resolve_config(opt));

        if (cmd == "info") {
            return cmd_info(a);
        } else if (cmd == "read") {
            return cmd_read(a, opt);
        } else if (cmd == "write") {
            return cmd_write(a, opt);
        } else if (cmd == "reset") {
            return cmd_reset(a, opt);
        } else if (cmd == "set-pin") {
            return cmd_set_pin(a, opt);
        }
        std::cerr << "Error: unknown command '" << cmd << "'\n";
        return 1;
    } catch (const LargeBlobError& e) {
        return ctap_failure(cmd.c_str(), e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }
}

} // namespace lbctl
