#include <crock/cli.hpp>
#include <crock/base32.hpp>
#include <crock/uuid.hpp>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace crock::cli {

const char* const kUsage =
    "usage: crock [--config PATH] [-v|-q] <command> [args]\n"
    "\n"
    "commands:\n"
    "  encode <uuid>          standard UUID -> Crockford Base32\n"
    "  decode <crockford>     Crockford Base32 -> standard UUID\n"
    "  gen [--v4|--v7] [-n N] generate identifiers\n"
    "  inspect <id>           show both forms, version and timestamp\n";

Result<Invocation> parse_args(const std::vector<std::string>& argv) {
    Invocation inv;
    for (size_t i = 1; i < argv.size(); ++i) {
        const std::string& a = argv[i];
        if (a == "--config") {
            if (i + 1 >= argv.size()) {
                return CrockError{CrockError::InvalidArg, "--config needs a path", kUsage};
            }
            inv.config_path = argv[++i];
        } else if (a == "-v" || a == "--verbose") {
            ++inv.verbosity;
        } else if (a == "-q" || a == "--quiet") {
            --inv.verbosity;
        } else if (a == "-h" || a == "--help") {
            inv.command = "help";
        } else if (inv.command.empty()) {
            inv.command = a;
        } else {
            inv.args.push_back(a);
        }
    }
    if (inv.command.empty()) {
        return CrockError{CrockError::InvalidArg, "no command given", kUsage};
    }
    return Result<Invocation>::ok(std::move(inv));
}

Result<Invocation> parse_args(int argc, char** argv) {
    return parse_args(std::vector<std::string>(argv, argv + argc));
}

Result<int> parse_count(const std::string& text) {
    CrockError bad{CrockError::InvalidArg,
        "-n expects an integer in 1..2147483647, got '" + text + "'"};
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return bad;
    }
    errno = 0;
    char* end = nullptr;
    long long n = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || *end != '\0' || n < 1 || n > std::numeric_limits<int>::max()) {
        return bad;
    }
    return Result<int>::ok(static_cast<int>(n));
}

Result<GenPlan> parse_gen_options(const std::vector<std::string>& args, const Config& cfg) {
    GenPlan plan;
    plan.version = cfg.version_or_default();
    plan.count = cfg.count_or_default();

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a == "--v4") {
            plan.version = 4;
        } else if (a == "--v7") {
            plan.version = 7;
        } else if (a == "-n") {
            if (i + 1 >= args.size()) {
                return CrockError{CrockError::InvalidArg, "-n needs a count", kUsage};
            }
            auto n = parse_count(args[++i]);
            CROCK_TRY(n);
            plan.count = n.value();
        } else {
            return CrockError{CrockError::InvalidArg, "unknown gen option '" + a + "'", kUsage};
        }
    }
    return Result<GenPlan>::ok(plan);
}

// The hex form is exactly 36 characters with dashes, which never decodes
// as Crockford text, so trying it first is unambiguous.
Result<CrockfordUuid> parse_any(const std::string& text) {
    auto as_hex = Uuid::from_string(text);
    if (as_hex.is_ok()) {
        return Result<CrockfordUuid>::ok(CrockfordUuid::from_uuid(as_hex.value()));
    }
    return CrockfordUuid::from_string(text);
}

Result<std::string> single_arg(const Invocation& inv) {
    if (inv.args.size() != 1) {
        return CrockError{CrockError::InvalidArg,
            "'" + inv.command + "' takes exactly one argument", kUsage};
    }
    return Result<std::string>::ok(inv.args[0]);
}

std::string display(const CrockfordUuid& id, const Config& cfg) {
    std::string s = base32::format_grouped(id.to_string(), cfg.group_or_default());
    if (cfg.lowercase_or_default()) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

} // namespace crock::cli
