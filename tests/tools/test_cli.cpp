/**
 * @file test_cli.cpp
 * @brief End-to-end checks of the ocp-canon command line
 */

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <sys/wait.h>

namespace ocp::tools::tests {
namespace {

namespace fs = std::filesystem;

constexpr std::string_view kCliBinary = OCP_TEST_CLI_BIN;
constexpr std::string_view kDataDir = OCP_TEST_DATA_DIR;

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

struct CommandResult
{
    int exit_code;
    std::string output;
};

[[nodiscard]] std::string quote_arg(std::string_view value)
{
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return std::format("\"{}\"", escaped);
}

[[nodiscard]] int exit_status(int raw)
{
    if (raw != -1 && WIFEXITED(raw)) {
        return WEXITSTATUS(raw);
    }
    return -1;
}

[[nodiscard]] CommandResult run_cli(const fs::path& workdir, const std::vector<std::string>& args)
{
    std::string command = quote_arg(kCliBinary);
    for (const auto& arg : args) {
        command += ' ';
        command += quote_arg(arg);
    }
    const auto output_path = workdir / "stdout.txt";
    command += std::format(" > {} 2> {}", quote_arg(output_path.string()),
                           quote_arg((workdir / "stderr.txt").string()));

    const int status = exit_status(std::system(command.c_str()));
    std::ifstream in(output_path);
    std::string output((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return CommandResult{.exit_code = status, .output = std::move(output)};
}

[[nodiscard]] fs::path write_file(const fs::path& dir, std::string_view name, std::string_view content)
{
    const auto path = dir / name;
    std::ofstream out(path);
    out << content;
    return path;
}

}  // namespace

TEST(Cli, CanonicalizePrintsCanonicalForm)
{
    TempDir dir("ocp_cli_canonicalize");
    const auto input = write_file(dir.path(), "in.json", R"({ "b" : 1.0, "a" : [3, 1, 2] })");
    auto result = run_cli(dir.path(), {"canonicalize", "--input", input.string()});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, "{\"a\":[3,1,2],\"b\":1}\n");
}

TEST(Cli, HashAndVerify)
{
    TempDir dir("ocp_cli_hash");
    const auto input = write_file(dir.path(), "in.json", R"({"value":42,"action":"propose"})");
    constexpr std::string_view kDigest =
        "0f3d1ee26f08f66bd2daf25919db9f33ba6caa7886dd44db8d41344e1c7d2d93";

    auto hashed = run_cli(dir.path(), {"hash", "--input", input.string()});
    EXPECT_EQ(hashed.exit_code, 0);
    EXPECT_EQ(hashed.output, std::string(kDigest) + "\n");

    auto prefixed = run_cli(dir.path(), {"hash", "--input", input.string(), "--prefixed"});
    EXPECT_EQ(prefixed.output, "sha256:" + std::string(kDigest) + "\n");

    auto ok = run_cli(dir.path(), {"verify", "--input", input.string(), "--digest", std::string(kDigest)});
    EXPECT_EQ(ok.exit_code, 0);
    EXPECT_EQ(ok.output, "OK\n");

    auto mismatch = run_cli(dir.path(), {"verify", "--input", input.string(), "--digest", std::string(64, '0')});
    EXPECT_EQ(mismatch.exit_code, 1);
    EXPECT_EQ(mismatch.output, "MISMATCH\n");
}

TEST(Cli, Equal)
{
    TempDir dir("ocp_cli_equal");
    const auto left = write_file(dir.path(), "l.json", R"({"z":1,"a":2})");
    const auto right = write_file(dir.path(), "r.json", R"({"a":2.0,"z":1})");
    const auto other = write_file(dir.path(), "o.json", R"({"a":2,"z":2})");

    auto same = run_cli(dir.path(), {"equal", "--left", left.string(), "--right", right.string()});
    EXPECT_EQ(same.exit_code, 0);
    EXPECT_EQ(same.output, "EQUAL\n");

    auto different = run_cli(dir.path(), {"equal", "--left", left.string(), "--right", other.string()});
    EXPECT_EQ(different.exit_code, 1);
    EXPECT_EQ(different.output, "DIFFERENT\n");
}

TEST(Cli, DepthLimitIsInputError)
{
    TempDir dir("ocp_cli_depth");
    const auto input = write_file(dir.path(), "in.json", "[[[[1]]]]");
    auto limited = run_cli(dir.path(), {"canonicalize", "--input", input.string(), "--max-depth", "3"});
    EXPECT_EQ(limited.exit_code, 2);
    auto allowed = run_cli(dir.path(), {"canonicalize", "--input", input.string(), "--max-depth", "4"});
    EXPECT_EQ(allowed.exit_code, 0);
    EXPECT_EQ(allowed.output, "[[[[1]]]]\n");
}

TEST(Cli, ReproduceArchiveEntry)
{
    TempDir dir("ocp_cli_reproduce");
    const auto entry = fs::path(kDataDir) / "entry" / "archive_entry.json";
    auto result = run_cli(dir.path(), {"reproduce", "--entry", entry.string()});
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_TRUE(result.output.starts_with("[reproduce] MATCH"));
}

TEST(Cli, VectorsPass)
{
    TempDir dir("ocp_cli_vectors");
    const auto vectors = fs::path(kDataDir) / "vectors" / "canonical_vectors.json";
    auto result = run_cli(dir.path(), {"vectors", "--file", vectors.string(), "--schema-dir", OCP_SCHEMA_DIR});
    EXPECT_EQ(result.exit_code, 0) << result.output;
    EXPECT_NE(result.output.find("0 failed"), std::string::npos);
}

TEST(Cli, UsageErrors)
{
    TempDir dir("ocp_cli_usage");
    EXPECT_EQ(run_cli(dir.path(), {"hash"}).exit_code, 2);
    EXPECT_EQ(run_cli(dir.path(), {"hash", "--input"}).exit_code, 2);
    EXPECT_EQ(run_cli(dir.path(), {"frobnicate"}).exit_code, 2);
    EXPECT_EQ(run_cli(dir.path(), {"canonicalize", "--input", "does-not-exist.json"}).exit_code, 2);
    EXPECT_EQ(run_cli(dir.path(), {"version"}).exit_code, 0);
    EXPECT_EQ(run_cli(dir.path(), {"frobnicate", "--help"}).exit_code, 2);
    EXPECT_EQ(run_cli(dir.path(), {"hash", "--help"}).exit_code, 0);
}

}  // namespace ocp::tools::tests
