// crock -- command-line front end for Crockford Base32 UUIDs.
//
//     crock encode 01890a5d-ac96-774b-bcce-b302099a8057
//     crock decode 064GMQDCJSVMQF6EPC10K6M0AW
//     crock gen --v7 -n 5
//     crock inspect 064g-mqdc-jsvm-qf6e-pc10-k6m0-aw
//
// Settings come from ~/.crock/config.toml, ./.crock.toml and --config PATH,
// in that order.

#include <crock/cli.hpp>
#include <crock/config.hpp>
#include <crock/crockford_uuid.hpp>
#include <crock/log.hpp>
#include <crock/result.hpp>
#include <crock/uuid.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace crock;
using cli::Invocation;

static std::optional<Config> load_optional(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) return std::nullopt;
    auto cfg = Config::load(path);
    if (cfg.is_err()) {
        // A broken ambient config should not block the command.
        log::warn("ignoring %s", cfg.error().format().c_str());
        return std::nullopt;
    }
    log::debug("loaded config %s", path.c_str());
    return cfg.value();
}

static Result<Config> load_config(const Invocation& inv) {
    auto global = load_optional(global_config_path());
    auto local = load_optional(local_config_path());

    std::optional<Config> explicit_file;
    if (inv.config_path) {
        auto cfg = Config::load(*inv.config_path);
        CROCK_TRY(cfg);
        explicit_file = cfg.value();
    }
    return Result<Config>::ok(Config::effective(global, local, explicit_file));
}

static Status cmd_encode(const Invocation& inv, const Config& cfg) {
    auto arg = cli::single_arg(inv);
    CROCK_TRY(arg);
    auto uuid = Uuid::from_string(arg.value());
    CROCK_TRY(uuid);
    std::cout << cli::display(CrockfordUuid::from_uuid(uuid.value()), cfg) << "\n";
    return ok_status();
}

static Status cmd_decode(const Invocation& inv, const Config&) {
    auto arg = cli::single_arg(inv);
    CROCK_TRY(arg);
    auto id = CrockfordUuid::from_string(arg.value());
    CROCK_TRY(id);
    std::cout << id.value().uuid().to_string() << "\n";
    return ok_status();
}

static Status cmd_gen(const Invocation& inv, const Config& cfg) {
    auto plan = cli::parse_gen_options(inv.args, cfg);
    CROCK_TRY(plan);
    const auto& p = plan.value();

    log::debug("generating %d v%d identifier(s)", p.count, p.version);
    for (int i = 0; i < p.count; ++i) {
        auto id = p.version == 4 ? CrockfordUuid::generate_v4() : CrockfordUuid::generate_v7();
        std::cout << cli::display(id, cfg) << "\n";
    }
    return ok_status();
}

static Status cmd_inspect(const Invocation& inv, const Config& cfg) {
    auto arg = cli::single_arg(inv);
    CROCK_TRY(arg);
    auto id = cli::parse_any(arg.value());
    CROCK_TRY(id);

    const auto& v = id.value();
    std::cout << "crockford: " << cli::display(v, cfg) << "\n";
    std::cout << "uuid:      " << v.uuid().to_string() << "\n";
    std::cout << "version:   " << v.version() << "\n";
    if (auto ms = v.unix_ts_ms()) {
        std::cout << "unix_ms:   " << *ms << "\n";
    }
    return ok_status();
}

static Status run(int argc, char** argv) {
    auto inv = cli::parse_args(argc, argv);
    CROCK_TRY(inv);
    const auto& invocation = inv.value();

    if (invocation.command == "help") {
        std::cout << cli::kUsage;
        return ok_status();
    }

    auto cfg = load_config(invocation);
    CROCK_TRY(cfg);
    cfg.value().apply_logging();
    // Command-line verbosity wins over the config file.
    if (invocation.verbosity > 0) log::set_level(log::Debug);
    if (invocation.verbosity < 0) log::set_level(log::Error);

    log::trace("command '%s' with %zu argument(s)",
               invocation.command.c_str(), invocation.args.size());

    if (invocation.command == "encode") return cmd_encode(invocation, cfg.value());
    if (invocation.command == "decode") return cmd_decode(invocation, cfg.value());
    if (invocation.command == "gen") return cmd_gen(invocation, cfg.value());
    if (invocation.command == "inspect") return cmd_inspect(invocation, cfg.value());

    return CrockError{CrockError::InvalidArg,
        "unknown command '" + invocation.command + "'", cli::kUsage};
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
