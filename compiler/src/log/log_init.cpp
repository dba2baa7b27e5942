//! # Log Configuration from the Environment
//!
//! Reads WAOT_LOG, WAOT_LOG_FILE and WAOT_LOG_FORMAT.

#include "log/log.hpp"

#include <cstdlib>
#include <string>

namespace waot::log {

static std::string read_env(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    std::string value;
    if (_dupenv_s(&buf, &len, name) == 0 && buf) {
        value = buf;
        free(buf);
    }
    return value;
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
#endif
}

LogConfig config_from_env() {
    LogConfig config;

    std::string spec = read_env("WAOT_LOG");
    if (!spec.empty()) {
        // "codegen=trace,*=warn" or "codegen,loader" are filter specs,
        // anything else is a plain level name.
        if (spec.find('=') != std::string::npos || spec.find(',') != std::string::npos) {
            config.filter_spec = spec;
        } else {
            config.level = parse_level(spec);
        }
    }

    config.log_file = read_env("WAOT_LOG_FILE");

    std::string format = read_env("WAOT_LOG_FORMAT");
    if (format == "json" || format == "JSON") {
        config.format = LogFormat::JSON;
    }

    return config;
}

} // namespace waot::log
