#include "config.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace blobkey;

static bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

static bool rejects(const std::string& yaml, const std::string& ctx) {
    try {
        parse_config(yaml);
    } catch (const std::runtime_error&) {
        return true;
    }
    return fail(ctx + ": accepted");
}

int main() {
    bool ok = true;

    // Defaults
    {
        Config c = parse_config("");
        ok &= check(c.store_path == "blobkey.store", "default store");
        ok &= check(c.max_msg_size == 1024, "default max_msg_size");
        ok &= check(c.max_large_blob_array_size == 2048, "default array size");
        ok &= check(c.pin_uv_auth_protocols == std::vector<uint32_t>({1, 2}),
                    "default protocols");
    }

    // Partial override
    {
        Config c = parse_config("store: /tmp/x.store\nmax_msg_size: 2048\n");
        ok &= check(c.store_path == "/tmp/x.store", "override store");
        ok &= check(c.max_msg_size == 2048, "override max_msg_size");
        ok &= check(c.max_large_blob_array_size == 2048, "array size keeps default");
    }

    {
        Config c = parse_config("pin_uv_auth_protocols: [1]\n");
        ok &= check(c.pin_uv_auth_protocols == std::vector<uint32_t>({1}), "protocol list");
    }

    ok &= rejects("max_msg_size: 64\n", "max_msg_size at overhead");
    ok &= rejects("max_large_blob_array_size: 16\n", "array size below minimum");
    ok &= rejects("pin_uv_auth_protocols: [1, 3]\n", "unknown protocol");
    ok &= rejects("pin_uv_auth_protocols: []\n", "empty protocol list");
    ok &= rejects("pin_uv_auth_protocols: 1\n", "scalar protocol list");
    ok &= rejects("max_msg_size: lots\n", "non-numeric size");
    ok &= rejects("- a\n- b\n", "sequence at top level");
    ok &= rejects("store: [unterminated\n", "malformed YAML");

    // Emit then load from disk
    {
        Config c;
        c.store_path = "state/authenticator.store";
        c.max_msg_size = 1200;
        c.max_large_blob_array_size = 4096;
        c.pin_uv_auth_protocols = {2};

        std::string path = "test_config_" + std::to_string(getpid()) + ".yaml";
        {
            std::ofstream f(path);
            f << emit_config_yaml(c);
        }
        try {
            Config d = load_config(path);
            ok &= check(d.store_path == c.store_path, "emitted store");
            ok &= check(d.max_msg_size == c.max_msg_size, "emitted max_msg_size");
            ok &= check(d.max_large_blob_array_size == c.max_large_blob_array_size,
                        "emitted array size");
            ok &= check(d.pin_uv_auth_protocols == c.pin_uv_auth_protocols,
                        "emitted protocols");
        } catch (const std::exception& e) {
            ok &= fail(std::string("load_config threw: ") + e.what());
        }
        std::remove(path.c_str());
    }

    try {
        load_config("does-not-exist.yaml");
        ok &= fail("missing config file accepted");
    } catch (const std::runtime_error&) {
    }

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
