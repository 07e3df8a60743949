#include "commands.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include <unistd.h>

using namespace blobkey;
using lbctl::Options;
using lbctl::run_command;

static bool fail(const std::string& msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const std::string& msg) {
    if (!cond) return fail(msg);
    return true;
}

static bool exits(int got, int want, const std::string& ctx) {
    if (got == want) return true;
    return fail(ctx + ": exit " + std::to_string(got) + ", expected " + std::to_string(want));
}

static void write_bytes(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(data.data()),
            static_cast<std::streamsize>(data.size()));
}

static std::vector<uint8_t> read_bytes(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)),
                                 std::istreambuf_iterator<char>());
}

static std::vector<uint8_t> with_tag(std::vector<uint8_t> data) {
    Sha256Hasher h;
    auto tag = truncated_hash(h, data.data(), data.size());
    data.insert(data.end(), tag.begin(), tag.end());
    return data;
}

int main() {
    bool ok = true;
    std::string id      = std::to_string(getpid());
    std::string config  = "lbctl_" + id + ".yaml";
    std::string store   = "lbctl_" + id + ".store";
    std::string payload = "lbctl_" + id + ".payload";
    std::string out     = "lbctl_" + id + ".out";

    auto base = [&] {
        Options o;
        o.config_path = config;
        return o;
    };
    auto read_back = [&]() -> std::vector<uint8_t> {
        Options o = base();
        o.out_path = out;
        if (run_command("read", o) != 0) {
            fail("read failed");
            return {};
        }
        return read_bytes(out);
    };

    // init writes a config that later commands pick the store up from
    {
        Options o;
        ok &= exits(run_command("init", o), 1, "init without --config");
        o = base();
        o.store_path = store;
        ok &= exits(run_command("init", o), 0, "init");
        ok &= check(load_config(config).store_path == store, "init store path");
    }

    // Fresh store reads back the default array
    ok &= check(read_back() == kDefaultLargeBlobArray, "fresh read");
    ok &= exits(run_command("info", base()), 0, "info");

    // write appends the checksum and stores the array
    std::vector<uint8_t> data(1500, 0x42);
    write_bytes(payload, data);
    {
        Options o = base();
        o.arg = payload;
        ok &= exits(run_command("write", o), 0, "write");
        ok &= check(read_back() == with_tag(data), "write then read");
    }

    // Small fragments reach the same result
    std::vector<uint8_t> small(200, 0x17);
    write_bytes(payload, small);
    {
        Options o = base();
        o.arg = payload;
        o.fragment = 64;
        ok &= exits(run_command("write", o), 0, "write with --fragment 64");
        ok &= check(read_back() == with_tag(small), "fragmented write");

        o.fragment = 2000;
        ok &= exits(run_command("write", o), 1, "--fragment above maximum");
    }

    // --raw sends the file as-is; a bad checksum is refused by the session
    {
        Options o = base();
        o.arg = payload;
        o.raw = true;
        ok &= exits(run_command("write", o), 2, "raw payload without checksum");
        ok &= check(read_back() == with_tag(small), "failed raw write kept array");

        write_bytes(payload, with_tag(std::vector<uint8_t>(40, 0x09)));
        ok &= exits(run_command("write", o), 0, "raw payload with checksum");
        ok &= check(read_back() == with_tag(std::vector<uint8_t>(40, 0x09)), "raw write");
    }

    // Empty and too-short arrays are rejected before anything is sent
    {
        write_bytes(payload, {});
        Options o = base();
        o.arg = payload;
        o.raw = true;
        ok &= exits(run_command("write", o), 1, "empty raw payload");
        o.raw = false;
        ok &= exits(run_command("write", o), 1, "empty payload plus checksum");
        ok &= check(read_back() == with_tag(std::vector<uint8_t>(40, 0x09)),
                    "short writes kept array");
    }

    // Too large for the store
    {
        write_bytes(payload, std::vector<uint8_t>(MAX_LARGE_BLOB_ARRAY_SIZE, 0x01));
        Options o = base();
        o.arg = payload;
        ok &= exits(run_command("write", o), 2, "oversized payload");
    }

    // Missing payload file
    {
        Options o = base();
        o.arg = "lbctl_" + id + ".missing";
        ok &= exits(run_command("write", o), 3, "missing payload file");
        o.arg.clear();
        ok &= exits(run_command("write", o), 1, "no payload argument");
    }

    // PIN enrolment gates writes
    write_bytes(payload, small);
    {
        Options o = base();
        o.arg = "12";
        ok &= exits(run_command("set-pin", o), 1, "short PIN");
        o.arg = "1234";
        ok &= exits(run_command("set-pin", o), 0, "set-pin");
        ok &= exits(run_command("set-pin", o), 2, "second set-pin");

        Options w = base();
        w.arg = payload;
        ok &= exits(run_command("write", w), 2, "write without --pin");
        w.pin = "9999";
        w.have_pin = true;
        ok &= exits(run_command("write", w), 2, "write with wrong PIN");
        ok &= check(read_back() == with_tag(std::vector<uint8_t>(40, 0x09)),
                    "unauthorized writes kept array");

        w.pin = "1234";
        w.fragment = 100;
        ok &= exits(run_command("write", w), 0, "write with PIN");
        ok &= check(read_back() == with_tag(small), "authorized write");
    }

    // reset stores the empty array
    {
        Options o = base();
        ok &= exits(run_command("reset", o), 2, "reset without --pin");
        o.pin = "1234";
        o.have_pin = true;
        ok &= exits(run_command("reset", o), 0, "reset");
        ok &= check(read_back() == kDefaultLargeBlobArray, "reset array");
    }

    ok &= exits(run_command("frobnicate", base()), 1, "unknown command");

    std::remove(config.c_str());
    std::remove(store.c_str());
    std::remove(payload.c_str());
    std::remove(out.c_str());

    if (ok) {
        std::cout << "PASS\n";
        return 0;
    }
    return 1;
}
