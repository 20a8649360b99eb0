#pragma once

#include <crock/config.hpp>
#include <crock/crockford_uuid.hpp>
#include <crock/result.hpp>
#include <optional>
#include <string>
#include <vector>

// Argument handling for the crock command-line tool.
namespace crock::cli {

extern const char* const kUsage;

struct Invocation {
    std::optional<std::string> config_path;
    int verbosity = 0;
    std::string command;
    std::vector<std::string> args;
};

// argv[0] is the program name and is skipped.
Result<Invocation> parse_args(const std::vector<std::string>& argv);
Result<Invocation> parse_args(int argc, char** argv);

struct GenPlan {
    int version = 7;
    int count = 1;
};

// `gen` options on top of the configured defaults.
Result<GenPlan> parse_gen_options(const std::vector<std::string>& args, const Config& cfg);

// Positive decimal that fits an int; InvalidArg otherwise.
Result<int> parse_count(const std::string& text);

// Hyphenated hex UUID or Crockford text.
Result<CrockfordUuid> parse_any(const std::string& text);

Result<std::string> single_arg(const Invocation& inv);

// Canonical form with the configured grouping and case.
std::string display(const CrockfordUuid& id, const Config& cfg);

} // namespace crock::cli
