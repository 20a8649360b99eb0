#pragma once

#include <crock/log.hpp>
#include <crock/result.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace crock {

// Layered CLI configuration: global > local > --config file.
// Later layers override only the fields they set.
struct Config {
    // [output]
    std::optional<size_t> group;
    std::optional<bool> lowercase;
    // [generate]
    std::optional<int> version;
    std::optional<int> count;
    // [log]
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;

    size_t group_or_default() const { return group.value_or(0); }
    bool lowercase_or_default() const { return lowercase.value_or(false); }
    int version_or_default() const { return version.value_or(7); }
    int count_or_default() const { return count.value_or(1); }

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local,
                            const std::optional<Config>& explicit_file);

    // Push [log] settings into crock::log.
    void apply_logging() const;
};

// ~/.crock/config.toml, or "" when no home directory is known
std::string global_config_path();

// .crock.toml in the working directory
std::string local_config_path();

} // namespace crock
