#ifndef HEADER_cli_Options_hpp_ALREADY_INCLUDED
#define HEADER_cli_Options_hpp_ALREADY_INCLUDED

#include <ReturnCode.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cli {

    enum class Command
    {
        Info,
        Len,
        Union,
        Intersect,
        Overlaps,
        Contains,
        Translate,
        Show,
    };

    class Options
    {
    public:
        std::string exe_name;

        bool print_help = false;
        int verbose = 0;
        std::optional<std::filesystem::path> filepath;
        bool use_chars = false;
        std::optional<Command> command;
        // Positional arguments following the command
        std::vector<std::string> args;

        ReturnCode parse(int argc, const char **argv);

        std::string help() const;
    };

} // namespace cli

#endif
