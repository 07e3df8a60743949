#include "commands.hpp"

#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>

using lbctl::Options;

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " init    --config <file>\n"
        "  " << prog << " info    [--config <file>] [--store <file>]\n"
        "  " << prog << " read    [--config <file>] [--store <file>] [--out <file>]\n"
        "  " << prog << " write   [--config <file>] [--store <file>] [--pin <pin>]\n"
        "                [--fragment <n>] [--raw] [--verbose] <payload-file>\n"
        "  " << prog << " reset   [--config <file>] [--store <file>] [--pin <pin>]\n"
        "  " << prog << " set-pin [--config <file>] [--store <file>] <pin>\n"
        "\n"
        "  --config   YAML config (store path, message size, protocols)\n"
        "  --store    Authenticator state file, overrides the config\n"
        "  --pin      PIN, required to write once one is enrolled\n"
        "  --fragment Bytes per write fragment (default: largest allowed)\n"
        "  --raw      Send <payload-file> as-is; it must already end in its checksum\n"
        "\n"
        "  read:    fetches the large blob array in fragments and writes it to stdout\n"
        "  write:   appends the 16-byte SHA-256 checksum and stores the array\n"
        "  reset:   stores the empty array\n"
        "\n"
        "Exit codes: 0=ok, 1=usage, 2=CTAP status, 3=I/O or internal\n";
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd != "init" && cmd != "info" && cmd != "read" && cmd != "write" &&
        cmd != "reset" && cmd != "set-pin") {
        std::cerr << "Error: unknown command '" << cmd << "'\n";
        print_usage(argv[0]);
        return 1;
    }

    Options opt;
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 || std::strcmp(argv[i], "--store") == 0 ||
            std::strcmp(argv[i], "--out") == 0 || std::strcmp(argv[i], "--pin") == 0 ||
            std::strcmp(argv[i], "--fragment") == 0) {
            std::string flag = argv[i];
            if (++i >= argc) {
                std::cerr << "Error: " << flag << " requires a value\n";
                return 1;
            }
            if (flag == "--config") {
                opt.config_path = argv[i];
            } else if (flag == "--store") {
                opt.store_path = argv[i];
            } else if (flag == "--out") {
                opt.out_path = argv[i];
            } else if (flag == "--pin") {
                opt.pin = argv[i];
                opt.have_pin = true;
            } else {
                char* end = nullptr;
                unsigned long n = std::strtoul(argv[i], &end, 10);
                if (*argv[i] == '\0' || *end != '\0' || n == 0) {
                    std::cerr << "Error: --fragment must be a positive integer\n";
                    return 1;
                }
                opt.fragment = n;
            }
        } else if (std::strcmp(argv[i], "--raw") == 0) {
            opt.raw = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            opt.verbose = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: unknown option '" << argv[i] << "'\n";
            return 1;
        } else {
            if (!opt.arg.empty()) {
                std::cerr << "Error: unexpected argument '" << argv[i] << "'\n";
                return 1;
            }
            opt.arg = argv[i];
        }
    }

    return lbctl::run_command(cmd, opt);
}
