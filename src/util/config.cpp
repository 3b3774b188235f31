#include <guid/config.hpp>
#include <guid/generator.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace guid {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return GuidError{GuidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [generator] section
    if (auto gen = doc["generator"].as_table()) {
        if (auto v = (*gen)["prefix"].value<std::string>()) {
            cfg.generator.prefix = *v;
        }
        if (auto node = (*gen)["fingerprint"]) {
            auto v = node.value<int64_t>();
            if (!v) {
                return GuidError{GuidError::Config,
                    "generator.fingerprint must be an integer"};
            }
            cfg.generator.fingerprint = filter_field(*v);
        }
    }

    // [output] section
    if (auto out = doc["output"].as_table()) {
        if (auto v = (*out)["separator"].value<std::string>()) {
            cfg.output.separator = *v;
            cfg.output_separator_set = true;
        }
        if (auto v = (*out)["slug"].value<bool>()) {
            cfg.output.slug = *v;
            cfg.output_slug_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            GUID_TRY(lvl);
            cfg.logging.level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return GuidError{GuidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        r.error().hint = "in " + path;
    }
    return r;
}

void Config::merge(const Config& other) {
    if (!other.generator.prefix.empty()) {
        generator.prefix = other.generator.prefix;
    }
    if (other.generator.fingerprint) {
        generator.fingerprint = other.generator.fingerprint;
    }

    if (other.output_separator_set) {
        output.separator = other.output.separator;
        output_separator_set = true;
    }
    if (other.output_slug_set) {
        output.slug = other.output.slug;
        output_slug_set = true;
    }

    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply() const {
    log::set_level(logging.level);
    if (log_color_set) {
        log::set_color_enabled(logging.color);
    }

    if (!generator.prefix.empty()) {
        if (generator.prefix.size() < 2) {
            log::warn("ignoring prefix '%s': a prefix needs two bytes",
                      generator.prefix.c_str());
        } else {
            set_global_prefix_bytes(static_cast<uint8_t>(generator.prefix[0]),
                                    static_cast<uint8_t>(generator.prefix[1]));
        }
    }
    if (generator.fingerprint) {
        set_global_fingerprint(*generator.fingerprint);
    }
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.guid/config.toml";
}

} // namespace guid
