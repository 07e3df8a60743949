#pragma once
#include "large_blob.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace blobkey {

struct Config {
    std::string           store_path = "blobkey.store";
    size_t                max_msg_size = MAX_MSG_SIZE;
    size_t                max_large_blob_array_size = MAX_LARGE_BLOB_ARRAY_SIZE;
    std::vector<uint32_t> pin_uv_auth_protocols = {1, 2};
};

// Loads a YAML config; absent keys keep their defaults.
// Throws std::runtime_error on unreadable files or out-of-range values.
Config load_config(const std::string& path);

Config parse_config(const std::string& yaml_text);

std::string emit_config_yaml(const Config& cfg);

} // namespace blobkey
