#include <cli/App.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

    struct Run
    {
        ReturnCode rc;
        std::string output;
    };

    Run run(cli::Command command, std::vector<std::string> args, std::optional<std::filesystem::path> filepath = {}, bool use_chars = false)
    {
        cli::Options options;
        options.exe_name = "tspan-cli";
        options.command = command;
        options.args = std::move(args);
        options.filepath = std::move(filepath);
        options.use_chars = use_chars;

        std::ostringstream oss;
        cli::App app{options, oss};
        const auto rc = app.run();
        return Run{rc, oss.str()};
    }

} // namespace

TEST_CASE("App commands", "[ut][cli][App]")
{
    SECTION("info")
    {
        const auto r = run(cli::Command::Info, {"2", "5"});
        REQUIRE(r.rc == ReturnCode::Ok);
        REQUIRE(r.output == "[2, 5) len 3 empty false\n");
    }
    SECTION("len")
    {
        const auto r = run(cli::Command::Len, {"4", "3"});
        REQUIRE(r.rc == ReturnCode::Ok);
        REQUIRE(r.output == "[4, 7)\n");
    }
    SECTION("union")
    {
        const auto r = run(cli::Command::Union, {"0", "2", "5", "7"});
        REQUIRE(r.rc == ReturnCode::Ok);
        REQUIRE(r.output == "[0, 7)\n");
    }
    SECTION("intersect")
    {
        REQUIRE(run(cli::Command::Intersect, {"0", "3", "3", "6"}).output == "[3, 3)\n");
        REQUIRE(run(cli::Command::Intersect, {"0", "2", "5", "7"}).output == "none\n");
    }
    SECTION("overlaps")
    {
        REQUIRE(run(cli::Command::Overlaps, {"0", "3", "3", "6"}).output == "false\n");
        REQUIRE(run(cli::Command::Overlaps, {"0", "4", "3", "6"}).output == "true\n");
    }
    SECTION("contains")
    {
        REQUIRE(run(cli::Command::Contains, {"2", "5", "5"}).output == "false\n");
        REQUIRE(run(cli::Command::Contains, {"2", "5", "3", "4"}).output == "true\n");
    }
    SECTION("translate")
    {
        REQUIRE(run(cli::Command::Translate, {"3", "5", "-2"}).output == "[1, 3)\n");
        REQUIRE(run(cli::Command::Translate, {"3", "5", "-4"}).rc != ReturnCode::Ok);
    }
    SECTION("errors")
    {
        REQUIRE(run(cli::Command::Info, {"5", "2"}).rc != ReturnCode::Ok);
        REQUIRE(run(cli::Command::Info, {"5"}).rc != ReturnCode::Ok);
        REQUIRE(run(cli::Command::Info, {"a", "2"}).rc != ReturnCode::Ok);
        REQUIRE(run(cli::Command::Show, {"0", "1"}).rc != ReturnCode::Ok);
    }
    SECTION("offsets beyond the configured width")
    {
        const auto too_large = std::to_string(static_cast<std::uint64_t>(tspan::max_value<tspan::SpanValue>()) + 1u);
        const std::string does_not_parse = "99999999999999999999";

        REQUIRE(run(cli::Command::Info, {"0", does_not_parse}).rc != ReturnCode::Ok);
        REQUIRE(run(cli::Command::Len, {"0", does_not_parse}).rc != ReturnCode::Ok);
        REQUIRE(run(cli::Command::Translate, {"0", does_not_parse, "1"}).rc != ReturnCode::Ok);
        if (tspan::max_value<tspan::SpanValue>() < std::numeric_limits<std::uint64_t>::max())
        {
            REQUIRE(run(cli::Command::Info, {"0", too_large}).rc != ReturnCode::Ok);
            REQUIRE(run(cli::Command::Len, {too_large, "0"}).rc != ReturnCode::Ok);
        }
        const auto max = std::to_string(static_cast<std::uint64_t>(tspan::max_value<tspan::SpanValue>()));
        REQUIRE(run(cli::Command::Info, {"0", max}).rc == ReturnCode::Ok);
        REQUIRE(run(cli::Command::Len, {max, "1"}).rc != ReturnCode::Ok);
        REQUIRE(run(cli::Command::Translate, {"0", max, "1"}).rc != ReturnCode::Ok);
    }
}

TEST_CASE("App show", "[ut][cli][App]")
{
    const auto fp = std::filesystem::temp_directory_path() / "tspan_app_show.txt";
    {
        std::ofstream fo{fp, std::ios::binary};
        fo << "caf\xc3\xa9 au lait";
    }

    REQUIRE(run(cli::Command::Show, {"6", "8"}, fp).output == "au\n");
    REQUIRE(run(cli::Command::Show, {"4", "6"}, fp, true).output == " a\n");
    REQUIRE(run(cli::Command::Show, {"10", "40"}, fp).rc != ReturnCode::Ok);

    std::filesystem::remove(fp);
}
