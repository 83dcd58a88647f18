/**
 * @file main.cpp
 * @brief ocp-canon CLI entry point
 *
 * Commands:
 *   canonicalize - Print the canonical form of a JSON file
 *   hash         - Print the SHA-256 digest of a JSON file's canonical form
 *   verify       - Compare a JSON file against an expected digest
 *   equal        - Compare two JSON files by canonical form
 *   reproduce    - Recompute an archive entry's semantic hash
 *   vectors      - Replay a canonicalization test vector file
 *   version      - Show version information
 */

#include "ocp/require_cpp23.hpp"

#include "ocp/canonical_json.hpp"
#include "ocp/common.hpp"
#include "ocp/digest.hpp"
#include "ocp/entry.hpp"
#include "ocp/json_io.hpp"
#include "ocp/number_format.hpp"
#include "ocp/schema_validate.hpp"
#include "ocp/value_model.hpp"
#include "ocp/vectors.hpp"
#include "ocp/version.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <exception>
#include <filesystem>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace {

// Exit codes
constexpr int kExitOk = 0;
constexpr int kExitCheckFailed = 1;
constexpr int kExitUsage = 2;

constexpr std::array<std::string_view, 6> kCommands = {
    "canonicalize", "hash", "verify", "equal", "reproduce", "vectors"};

[[nodiscard]] bool is_known_command(std::string_view command)
{
    return std::ranges::find(kCommands, command) != kCommands.end();
}

void print_version()
{
    std::println("ocp-canon {} ({})", ocp::kVersion, ocp::kBuildId);
    std::println("  canonical_form:   {}", ocp::kCanonicalFormVersion);
    std::println("  hash_algorithm:   {}", ocp::kHashAlgorithm);
    std::println("  max_safe_integer: {}", ocp::value::kMaxSafeInteger);
    std::println("  plain_exponent:   ({}, {})",
                 ocp::canonical::kMinPlainExponent,
                 ocp::canonical::kMaxPlainExponent);
}

void print_help()
{
    std::print(R"(ocp-canon - Canonical JSON and SHA-256 semantic digests

Usage: ocp-canon <command> [options]

Commands:
  canonicalize  Print the canonical form of a JSON file
  hash          Print the digest of a JSON file's canonical form
  verify        Compare a JSON file against an expected digest
  equal         Compare two JSON files by canonical form
  reproduce     Recompute an archive entry's semantic hash
  vectors       Replay a canonicalization test vector file
  version       Show version information

Common Options:
  --max-depth N       Maximum container nesting (default: {})
  --strict            Reject integers outside +/-(2^53 - 1)
  --help, -h          Show help

Exit status: 0 success, 1 check failed, 2 usage or input error.
Run 'ocp-canon <command> --help' for command-specific options.
)",
               ocp::canonical::kDefaultMaxDepth);
}

void print_command_help(std::string_view command)
{
    if (command == "canonicalize") {
        std::print(R"(Usage: ocp-canon canonicalize --input FILE [--max-depth N] [--strict]

Print the canonical form of FILE followed by a newline.
)");
    } else if (command == "hash") {
        std::print(R"(Usage: ocp-canon hash --input FILE [--prefixed] [--max-depth N] [--strict]

Print the 64-character lowercase hex SHA-256 of FILE's canonical form.
  --prefixed    Print as sha256:<hex>
)");
    } else if (command == "verify") {
        std::print(R"(Usage: ocp-canon verify --input FILE --digest HEX [--max-depth N] [--strict]

Print OK when FILE hashes to HEX, MISMATCH otherwise (exit 1).
)");
    } else if (command == "equal") {
        std::print(R"(Usage: ocp-canon equal --left FILE --right FILE [--max-depth N] [--strict]

Print EQUAL when both files have the same canonical form, DIFFERENT otherwise (exit 1).
)");
    } else if (command == "reproduce") {
        std::print(R"(Usage: ocp-canon reproduce --entry FILE [--max-depth N] [--strict]

Recompute the semantic hash of an archive entry over its hash scope
(action_type, agent_id, content, evidence_pointers, constitutional_citation,
timestamp) and compare it with the entry's semantic_hash.
)");
    } else if (command == "vectors") {
        std::print(R"(Usage: ocp-canon vectors --file FILE [--schema-dir DIR] [--max-depth N] [--strict]

Validate FILE against test_vectors.schema.json, then check every vector.
  --schema-dir DIR    Directory holding the schemas (default: {})
)",
                   OCP_SCHEMA_DIR);
    }
}

struct CommandOptions
{
    std::string input;
    std::string digest;
    std::string left;
    std::string right;
    std::string entry;
    std::string vector_file;
    std::string schema_dir;
    bool prefixed;
    ocp::canonical::CanonicalOptions canonical;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> ocp::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            ocp::Error::make("MissingArgument",
                             std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] ocp::Result<std::size_t> parse_depth_value(std::string_view value)
{
    std::size_t parsed = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(
            ocp::Error::make("InvalidArgument",
                             std::string("Invalid --max-depth value: ") + std::string(value)));
    }
    return parsed;
}

/**
 * @brief Options taking a value, mapped to their destination field
 */
[[nodiscard]] std::string* string_option_target(std::string_view arg, CommandOptions& options)
{
    if (arg == "--input" || arg == "-i") {
        return &options.input;
    }
    if (arg == "--digest") {
        return &options.digest;
    }
    if (arg == "--left") {
        return &options.left;
    }
    if (arg == "--right") {
        return &options.right;
    }
    if (arg == "--entry") {
        return &options.entry;
    }
    if (arg == "--file") {
        return &options.vector_file;
    }
    if (arg == "--schema-dir") {
        return &options.schema_dir;
    }
    return nullptr;
}

[[nodiscard]] ocp::Result<CommandOptions> parse_command_args(std::span<char*> args)
{
    CommandOptions options{.input = std::string{},
                           .digest = std::string{},
                           .left = std::string{},
                           .right = std::string{},
                           .entry = std::string{},
                           .vector_file = std::string{},
                           .schema_dir = OCP_SCHEMA_DIR,
                           .prefixed = false,
                           .canonical = ocp::canonical::CanonicalOptions{},
                           .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--strict") {
            options.canonical.strict = true;
            continue;
        }
        if (arg == "--prefixed") {
            options.prefixed = true;
            continue;
        }
        if (arg == "--max-depth") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto depth = parse_depth_value(*value);
            if (!depth) {
                return std::unexpected(depth.error());
            }
            options.canonical.max_depth = *depth;
            skip_next = true;
            continue;
        }
        if (auto* target = string_option_target(arg, options); target != nullptr) {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            *target = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(
            ocp::Error::make("InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

[[nodiscard]] bool require_option(std::string_view command,
                                  std::string_view value,
                                  std::string_view option)
{
    if (!value.empty()) {
        return true;
    }
    std::println(stderr, "Error: {} is required", option);
    print_command_help(command);
    return false;
}

[[nodiscard]] ocp::Result<nlohmann::json> load_input(const std::string& path)
{
    return ocp::common::read_json_file(std::filesystem::path(path));
}

int run_canonicalize(const CommandOptions& options)
{
    auto input = load_input(options.input);
    if (!input) {
        std::println(stderr, "Error: {}", input.error().message);
        return kExitUsage;
    }
    auto canonical = ocp::canonical::canonicalize(*input, options.canonical);
    if (!canonical) {
        std::println(stderr, "Error: {}: {}", canonical.error().code, canonical.error().message);
        return kExitUsage;
    }
    std::println("{}", *canonical);
    return kExitOk;
}

int run_hash(const CommandOptions& options)
{
    auto input = load_input(options.input);
    if (!input) {
        std::println(stderr, "Error: {}", input.error().message);
        return kExitUsage;
    }
    auto digest = options.prefixed ? ocp::digest::hash_prefixed(*input, options.canonical)
                                   : ocp::digest::hash(*input, options.canonical);
    if (!digest) {
        std::println(stderr, "Error: {}: {}", digest.error().code, digest.error().message);
        return kExitUsage;
    }
    std::println("{}", *digest);
    return kExitOk;
}

int run_verify(const CommandOptions& options)
{
    auto input = load_input(options.input);
    if (!input) {
        std::println(stderr, "Error: {}", input.error().message);
        return kExitUsage;
    }
    if (!ocp::common::is_digest_hex(options.digest)) {
        std::println(stderr, "Warning: --digest is not 64 lowercase hex characters");
    }
    auto matches = ocp::digest::verify(*input, options.digest, options.canonical);
    if (!matches) {
        std::println(stderr, "Error: {}: {}", matches.error().code, matches.error().message);
        return kExitUsage;
    }
    std::println("{}", *matches ? "OK" : "MISMATCH");
    return *matches ? kExitOk : kExitCheckFailed;
}

int run_equal(const CommandOptions& options)
{
    auto left = load_input(options.left);
    if (!left) {
        std::println(stderr, "Error: {}", left.error().message);
        return kExitUsage;
    }
    auto right = load_input(options.right);
    if (!right) {
        std::println(stderr, "Error: {}", right.error().message);
        return kExitUsage;
    }
    // Report why a side cannot take part; the comparison itself stays fail-closed
    for (const auto* side : {&*left, &*right}) {
        if (auto valid = ocp::canonical::validate_for_canonical(*side, options.canonical); !valid) {
            std::println(stderr, "Error: {}: {}", valid.error().code, valid.error().message);
        }
    }
    const bool equal = ocp::digest::canonically_equal(*left, *right, options.canonical);
    std::println("{}", equal ? "EQUAL" : "DIFFERENT");
    return equal ? kExitOk : kExitCheckFailed;
}

int run_reproduce(const CommandOptions& options)
{
    auto entry = load_input(options.entry);
    if (!entry) {
        std::println(stderr, "Error: {}", entry.error().message);
        return kExitUsage;
    }
    auto reproduction = ocp::entry::reproduce(*entry, options.canonical);
    if (!reproduction) {
        std::println(stderr,
                     "Error: {}: {}",
                     reproduction.error().code,
                     reproduction.error().message);
        return kExitUsage;
    }

    std::println("[reproduce] {}", reproduction->matches ? "MATCH" : "MISMATCH");
    std::println("  recorded:   {}", reproduction->recorded.empty() ? "<missing>" : reproduction->recorded);
    std::println("  reproduced: {}", reproduction->reproduced);
    return reproduction->matches ? kExitOk : kExitCheckFailed;
}

int run_vectors(const CommandOptions& options)
{
    auto document = load_input(options.vector_file);
    if (!document) {
        std::println(stderr, "Error: {}", document.error().message);
        return kExitUsage;
    }

    const auto schema_path = std::filesystem::path(options.schema_dir) / "test_vectors.schema.json";
    if (auto valid = ocp::common::validate_json(*document, schema_path.string()); !valid) {
        std::println(stderr, "Error: {}: {}", valid.error().code, valid.error().message);
        return kExitUsage;
    }

    auto report = ocp::vectors::run_vectors(*document, options.canonical);
    if (!report) {
        std::println(stderr, "Error: {}", report.error().message);
        return kExitUsage;
    }
    for (const auto& outcome : report->outcomes) {
        if (!outcome.passed) {
            std::println("FAIL {}: {}", outcome.name, outcome.detail);
        }
    }
    std::println("[vectors] {} passed, {} failed", report->passed, report->failed);
    return report->ok() ? kExitOk : kExitCheckFailed;
}

int report_unknown_command(std::string_view command)
{
    std::println(stderr, "Unknown command: {}", command);
    print_help();
    return kExitUsage;
}

int dispatch(std::string_view command, const CommandOptions& options)
{
    if (command == "canonicalize") {
        return require_option(command, options.input, "--input") ? run_canonicalize(options)
                                                                 : kExitUsage;
    }
    if (command == "hash") {
        return require_option(command, options.input, "--input") ? run_hash(options) : kExitUsage;
    }
    if (command == "verify") {
        if (!require_option(command, options.input, "--input")
            || !require_option(command, options.digest, "--digest")) {
            return kExitUsage;
        }
        return run_verify(options);
    }
    if (command == "equal") {
        if (!require_option(command, options.left, "--left")
            || !require_option(command, options.right, "--right")) {
            return kExitUsage;
        }
        return run_equal(options);
    }
    if (command == "reproduce") {
        return require_option(command, options.entry, "--entry") ? run_reproduce(options)
                                                                 : kExitUsage;
    }
    if (command == "vectors") {
        return require_option(command, options.vector_file, "--file") ? run_vectors(options)
                                                                      : kExitUsage;
    }
    return report_unknown_command(command);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return kExitUsage;
        }

        std::string_view cmd = argv[1];
        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return kExitOk;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return kExitOk;
        }

        if (!is_known_command(cmd)) {
            return report_unknown_command(cmd);
        }

        auto args = std::span<char*>(argv + 2, static_cast<std::size_t>(argc - 2));
        auto options = parse_command_args(args);
        if (!options) {
            std::println(stderr, "Error: {}", options.error().message);
            return kExitUsage;
        }
        if (options->show_help) {
            print_command_help(cmd);
            return kExitOk;
        }
        return dispatch(cmd, *options);
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return kExitUsage;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
