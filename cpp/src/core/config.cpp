#include "statcube/config.hpp"
#include "statcube/error.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace statcube {

namespace {

bool parse_bool(const std::string& key, const std::string& text) {
    std::string val = text;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "true" || val == "1" || val == "yes" || val == "on") return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    throw StatcubeException(ErrorCode::INVALID_CONFIG, "expected a boolean for " + key, text);
}

uint32_t parse_unsigned(const std::string& key, const std::string& text) {
    try {
        std::size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed);
        if (consumed == text.size() && text.find('-') == std::string::npos &&
            value <= UINT32_MAX) {
            return static_cast<uint32_t>(value);
        }
    } catch (const std::exception&) {
        // reported below
    }
    throw StatcubeException(ErrorCode::INVALID_CONFIG, "expected a non-negative integer for " + key, text);
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

void load_from_yaml(Config& config, const std::string& config_file) {
    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(config_file);
    } catch (const YAML::Exception& e) {
        throw StatcubeException(ErrorCode::INVALID_CONFIG,
                                std::string("cannot load config: ") + e.what(), config_file);
    }

    try {
        if (const auto codec = yaml["codec"]) {
            if (codec["naming"]) config.codec.naming = parse_naming(codec["naming"].as<std::string>());
            if (codec["value_column"]) config.codec.value_column = codec["value_column"].as<std::string>();
            if (codec["version"]) config.codec.version = parse_version(codec["version"].as<std::string>());
        }

        if (const auto fetch = yaml["fetch"]) {
            if (fetch["timeout"]) config.fetch.timeout_seconds = fetch["timeout"].as<uint32_t>();
            if (fetch["max_redirects"]) config.fetch.max_redirects = fetch["max_redirects"].as<uint32_t>();
            if (fetch["user_agent"]) config.fetch.user_agent = fetch["user_agent"].as<std::string>();
            if (fetch["verify_peer"]) config.fetch.verify_peer = fetch["verify_peer"].as<bool>();
        }

        if (const auto logging = yaml["logging"]) {
            if (logging["level"]) config.logging.level = parse_log_level(logging["level"].as<std::string>());
            if (logging["file"]) config.logging.file = logging["file"].as<std::string>();
            if (logging["console_output"]) config.logging.console_output = logging["console_output"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw StatcubeException(ErrorCode::INVALID_CONFIG,
                                std::string("bad config value: ") + e.what(), config_file);
    } catch (const StatcubeException& e) {
        throw StatcubeException(ErrorCode::INVALID_CONFIG, e.what(), config_file);
    }
}

} // anonymous namespace

void apply_env_overrides(Config& config) {
    try {
        if (const char* v = env("STATCUBE_NAMING")) config.codec.naming = parse_naming(v);
        if (const char* v = env("STATCUBE_VERSION")) config.codec.version = parse_version(v);
    } catch (const StatcubeException& e) {
        throw StatcubeException(ErrorCode::INVALID_CONFIG, e.what(), "environment");
    }
    if (const char* v = env("STATCUBE_VALUE_COLUMN")) config.codec.value_column = v;

    if (const char* v = env("STATCUBE_FETCH_TIMEOUT")) {
        config.fetch.timeout_seconds = parse_unsigned("STATCUBE_FETCH_TIMEOUT", v);
    }
    if (const char* v = env("STATCUBE_MAX_REDIRECTS")) {
        config.fetch.max_redirects = parse_unsigned("STATCUBE_MAX_REDIRECTS", v);
    }
    if (const char* v = env("STATCUBE_USER_AGENT")) config.fetch.user_agent = v;
    if (const char* v = env("STATCUBE_VERIFY_PEER")) {
        config.fetch.verify_peer = parse_bool("STATCUBE_VERIFY_PEER", v);
    }

    if (const char* v = env("STATCUBE_LOG_LEVEL")) config.logging.level = parse_log_level(v);
    if (const char* v = env("STATCUBE_LOG_FILE")) config.logging.file = v;
}

Config load_config(const std::string& config_file) {
    Config config;
    config.config_file = config_file;

    if (!config_file.empty()) {
        load_from_yaml(config, config_file);
    }
    apply_env_overrides(config);

    return config;
}

} // namespace statcube
