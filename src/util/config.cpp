#include <crock/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <sstream>

namespace crock {

static CrockError config_error(const std::string& key, const std::string& what) {
    return CrockError{CrockError::Config, "invalid value for '" + key + "': " + what};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return CrockError{CrockError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [output] section
    if (auto output = doc["output"].as_table()) {
        if (auto node = output->get("group")) {
            auto v = node->value<int64_t>();
            if (!v || *v < 0 || *v > 26) {
                return config_error("output.group", "expected an integer in 0..26");
            }
            cfg.group = static_cast<size_t>(*v);
        }
        if (auto node = output->get("lowercase")) {
            auto v = node->value<bool>();
            if (!v) return config_error("output.lowercase", "expected a boolean");
            cfg.lowercase = *v;
        }
    }

    // [generate] section
    if (auto gen = doc["generate"].as_table()) {
        if (auto node = gen->get("version")) {
            auto v = node->value<std::string>();
            if (v && *v == "v4") {
                cfg.version = 4;
            } else if (v && *v == "v7") {
                cfg.version = 7;
            } else {
                return config_error("generate.version", "expected \"v4\" or \"v7\"");
            }
        }
        if (auto node = gen->get("count")) {
            auto v = node->value<int64_t>();
            if (!v || *v < 1 || *v > std::numeric_limits<int>::max()) {
                return config_error("generate.count", "expected an integer in 1..2147483647");
            }
            cfg.count = static_cast<int>(*v);
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = lg->get("level")) {
            auto v = node->value<std::string>();
            auto lvl = v ? log::parse_level(*v) : std::nullopt;
            if (!lvl) {
                return config_error("log.level", "expected trace, debug, info, warn or error");
            }
            cfg.log_level = *lvl;
        }
        if (auto node = lg->get("color")) {
            auto v = node->value<bool>();
            if (!v) return config_error("log.color", "expected a boolean");
            cfg.log_color = *v;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return CrockError{CrockError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.group) group = other.group;
    if (other.lowercase) lowercase = other.lowercase;
    if (other.version) version = other.version;
    if (other.count) count = other.count;
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local,
                         const std::optional<Config>& explicit_file) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    if (explicit_file.has_value()) result.merge(explicit_file.value());
    return result;
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.crock/config.toml";
}

std::string local_config_path() {
    return ".crock.toml";
}

} // namespace crock
