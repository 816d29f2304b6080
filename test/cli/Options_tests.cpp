#include <cli/Options.hpp>

#include <catch2/catch_test_macros.hpp>

TEST_CASE("Options::parse", "[ut][cli][Options]")
{
    cli::Options options;

    SECTION("command with positional arguments")
    {
        const char *argv[] = {"tspan-cli", "-v", "2", "translate", "3", "5", "-2"};
        REQUIRE(options.parse(7, argv) == ReturnCode::Ok);
        REQUIRE(options.exe_name == "tspan-cli");
        REQUIRE(options.verbose == 2);
        REQUIRE(options.command == cli::Command::Translate);
        REQUIRE(options.args == std::vector<std::string>{"3", "5", "-2"});
    }
    SECTION("file and chars")
    {
        const char *argv[] = {"tspan-cli", "--file", "input.txt", "-c", "show", "0", "4"};
        REQUIRE(options.parse(7, argv) == ReturnCode::Ok);
        REQUIRE(options.filepath == std::filesystem::path{"input.txt"});
        REQUIRE(options.use_chars);
        REQUIRE(options.command == cli::Command::Show);
    }
    SECTION("help")
    {
        const char *argv[] = {"tspan-cli", "-h"};
        REQUIRE(options.parse(2, argv) == ReturnCode::Ok);
        REQUIRE(options.print_help);
        REQUIRE(!options.command);
    }
    SECTION("unknown option")
    {
        const char *argv[] = {"tspan-cli", "--bogus", "info", "1", "2"};
        REQUIRE(options.parse(5, argv) != ReturnCode::Ok);
    }
    SECTION("unknown command")
    {
        const char *argv[] = {"tspan-cli", "split", "1", "2"};
        REQUIRE(options.parse(4, argv) != ReturnCode::Ok);
    }
    SECTION("missing verbosity level")
    {
        const char *argv[] = {"tspan-cli", "-v"};
        REQUIRE(options.parse(2, argv) != ReturnCode::Ok);
    }
}
