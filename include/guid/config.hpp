#pragma once

#include <guid/log.hpp>
#include <guid/result.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace guid {

struct GeneratorConfig {
    std::string prefix;                 // first two bytes are used
    std::optional<int32_t> fingerprint;
};

struct OutputConfig {
    std::string separator = "\r\n";
    bool slug = false;
};

struct LogConfig {
    log::Level level = log::Warn;
    bool color = true;
};

// Layered configuration: global < local. A later layer overrides only the
// keys it sets.
struct Config {
    GeneratorConfig generator;
    OutputConfig output;
    LogConfig logging;
    // Track which fields were explicitly set (for merge)
    bool output_separator_set = false;
    bool output_slug_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Pushes generator settings into default_generator() and log settings
    // into guid::log
    void apply() const;
};

// ~/.guid/config.toml, or "" when no home directory is known
std::string global_config_path();

} // namespace guid
