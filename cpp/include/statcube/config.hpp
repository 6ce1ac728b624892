#pragma once

#include "statcube/logging.hpp"
#include "statcube/types.hpp"

#include <cstdint>
#include <string>

namespace statcube {

struct CodecConfig {
    Naming naming = Naming::Label;
    std::string value_column = "value";
    Version version = Version::V2_0;
};

struct FetchConfig {
    uint32_t timeout_seconds = 30;
    uint32_t max_redirects = 5;
    std::string user_agent = "statcube/1.0";
    bool verify_peer = true;
};

struct Config {
    CodecConfig codec;
    FetchConfig fetch;
    LogConfig logging;
    std::string config_file;
};

// Defaults, then the YAML file (if given), then STATCUBE_* environment variables.
// Throws InvalidConfig on unreadable files or bad values.
Config load_config(const std::string& config_file = "");

// STATCUBE_NAMING, STATCUBE_VALUE_COLUMN, STATCUBE_VERSION, STATCUBE_FETCH_TIMEOUT,
// STATCUBE_MAX_REDIRECTS, STATCUBE_USER_AGENT, STATCUBE_VERIFY_PEER,
// STATCUBE_LOG_LEVEL, STATCUBE_LOG_FILE
void apply_env_overrides(Config& config);

} // namespace statcube
