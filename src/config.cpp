// =============================================================================
// config.cpp - JSON engine configuration and logging setup
// =============================================================================

#include "peg/config.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace peg {

using json = nlohmann::json;

namespace {

Address parse_address(const json& value, const std::string& field) {
    if (!value.is_string()) {
        throw ConfigError(field + ": expected a hex address string");
    }
    auto addr = address_from_hex(value.get<std::string>());
    if (!addr) {
        throw ConfigError(field + ": invalid address '" + value.get<std::string>() + "'");
    }
    return *addr;
}

std::vector<Address> parse_address_list(const json& value, const std::string& field) {
    if (!value.is_array()) {
        throw ConfigError(field + ": expected an array of addresses");
    }
    std::vector<Address> out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        out.push_back(parse_address(value[i], field + "[" + std::to_string(i) + "]"));
    }
    return out;
}

json address_list_to_json(const std::vector<Address>& list) {
    json out = json::array();
    for (const auto& addr : list) {
        out.push_back(to_hex(addr));
    }
    return out;
}

bool is_known_level(const std::string& level) {
    return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
}

} // anonymous namespace

// =============================================================================
// Loading
// =============================================================================

EngineConfig EngineConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

EngineConfig EngineConfig::parse(std::string_view content) {
    json j;
    try {
        j = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("malformed config: ") + e.what());
    }
    return from_json(j);
}

EngineConfig EngineConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be an object");
    }

    EngineConfig config;

    try {
        if (auto it = j.find("general"); it != j.end()) {
            config.general.log_level = it->value("log_level", config.general.log_level);
        }
        if (auto it = j.find("oracle"); it != j.end()) {
            if (auto timeout = it->find("timeout_seconds"); timeout != it->end()) {
                if (!timeout->is_number_unsigned()) {
                    throw ConfigError("oracle.timeout_seconds must be a non-negative integer, got " +
                                      timeout->dump());
                }
                config.oracle.timeout_seconds = timeout->get<uint64_t>();
            }
        }
        if (auto it = j.find("peg"); it != j.end()) {
            if (it->contains("address")) {
                config.peg.address = parse_address(it->at("address"), "peg.address");
            }
            config.peg.symbol = it->value("symbol", config.peg.symbol);
        }
        if (auto it = j.find("engine"); it != j.end()) {
            if (it->contains("address")) {
                config.engine.address = parse_address(it->at("address"), "engine.address");
            }
        }
        if (auto it = j.find("collateral"); it != j.end()) {
            if (it->contains("tokens")) {
                config.collateral.tokens = parse_address_list(it->at("tokens"), "collateral.tokens");
            }
            if (it->contains("price_feeds")) {
                config.collateral.price_feeds =
                    parse_address_list(it->at("price_feeds"), "collateral.price_feeds");
            }
        }
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("wrong value type in config: ") + e.what());
    }

    config.validate();
    return config;
}

// =============================================================================
// Serialization
// =============================================================================

json EngineConfig::to_json() const {
    return json{
        {"general", {{"log_level", general.log_level}}},
        {"oracle", {{"timeout_seconds", oracle.timeout_seconds}}},
        {"peg", {{"address", to_hex(peg.address)}, {"symbol", peg.symbol}}},
        {"engine", {{"address", to_hex(engine.address)}}},
        {"collateral", {
            {"tokens", address_list_to_json(collateral.tokens)},
            {"price_feeds", address_list_to_json(collateral.price_feeds)},
        }},
    };
}

std::string EngineConfig::dump(int indent) const {
    return to_json().dump(indent);
}

void EngineConfig::validate() const {
    if (collateral.tokens.size() != collateral.price_feeds.size()) {
        throw ConfigError("collateral.tokens has " + std::to_string(collateral.tokens.size()) +
                          " entries but collateral.price_feeds has " +
                          std::to_string(collateral.price_feeds.size()),
                          ErrorCode::TOKEN_AND_FEED_LENGTH_MISMATCH);
    }
    if (!is_known_level(general.log_level)) {
        throw ConfigError("unknown log level '" + general.log_level + "'");
    }
    if (oracle.timeout_seconds == 0) {
        throw ConfigError("oracle.timeout_seconds must be positive");
    }
}

void configure_logging(const EngineConfig& config) {
    config.validate();
    spdlog::set_level(spdlog::level::from_str(config.general.log_level));
}

} // namespace peg
