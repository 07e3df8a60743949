#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>
#include <string>

namespace blobkey {

// ── Validation ────────────────────────────────────────────────────────────────

static void validate(const Config& cfg) {
    if (cfg.store_path.empty())
        throw std::runtime_error("config: 'store' must not be empty");
    if (cfg.max_msg_size <= MSG_OVERHEAD)
        throw std::runtime_error("config: 'max_msg_size' must be greater than " +
                                 std::to_string(MSG_OVERHEAD));
    if (cfg.max_large_blob_array_size < MIN_LARGE_BLOB_ARRAY_SIZE)
        throw std::runtime_error("config: 'max_large_blob_array_size' must be at least " +
                                 std::to_string(MIN_LARGE_BLOB_ARRAY_SIZE));
    if (cfg.pin_uv_auth_protocols.empty())
        throw std::runtime_error("config: 'pin_uv_auth_protocols' must not be empty");
    for (uint32_t p : cfg.pin_uv_auth_protocols) {
        if (p != 1 && p != 2)
            throw std::runtime_error("config: unknown pinUvAuthProtocol " + std::to_string(p));
    }
}

// ── YAML parsing ──────────────────────────────────────────────────────────────

static Config from_node(const YAML::Node& doc) {
    Config cfg;
    if (!doc || doc.IsNull())
        return cfg;
    if (!doc.IsMap())
        throw std::runtime_error("config: top-level node must be a map");

    try {
        cfg.store_path   = doc["store"].as<std::string>(cfg.store_path);
        cfg.max_msg_size = doc["max_msg_size"].as<size_t>(cfg.max_msg_size);
        cfg.max_large_blob_array_size =
            doc["max_large_blob_array_size"].as<size_t>(cfg.max_large_blob_array_size);

        YAML::Node protos = doc["pin_uv_auth_protocols"];
        if (protos) {
            if (!protos.IsSequence())
                throw std::runtime_error("config: 'pin_uv_auth_protocols' must be a sequence");
            cfg.pin_uv_auth_protocols.clear();
            for (const auto& p : protos)
                cfg.pin_uv_auth_protocols.push_back(p.as<uint32_t>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("config: ") + e.what());
    }

    validate(cfg);
    return cfg;
}

Config parse_config(const std::string& yaml_text) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("config: ") + e.what());
    }
    return from_node(doc);
}

Config load_config(const std::string& path) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("config: cannot load " + path + ": " + e.what());
    }
    return from_node(doc);
}

// ── YAML emission ─────────────────────────────────────────────────────────────

std::string emit_config_yaml(const Config& cfg) {
    YAML::Emitter out;

    out << YAML::BeginMap;
    out << YAML::Key << "store"        << YAML::Value << cfg.store_path;
    out << YAML::Key << "max_msg_size" << YAML::Value << cfg.max_msg_size;
    out << YAML::Key << "max_large_blob_array_size"
        << YAML::Value << cfg.max_large_blob_array_size;
    out << YAML::Key << "pin_uv_auth_protocols" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (uint32_t p : cfg.pin_uv_auth_protocols)
        out << p;
    out << YAML::EndSeq;
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

} // namespace blobkey
