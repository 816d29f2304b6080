#include <cli/Options.hpp>

#include <rubr/cli/Range.hpp>
#include <rubr/mss.hpp>

#include <cctype>
#include <charconv>
#include <iostream>
#include <sstream>

namespace cli {

    namespace {

        std::optional<Command> parse_command(const std::string &str)
        {
            if (str == "info") return Command::Info;
            if (str == "len") return Command::Len;
            if (str == "union") return Command::Union;
            if (str == "intersect") return Command::Intersect;
            if (str == "overlaps") return Command::Overlaps;
            if (str == "contains") return Command::Contains;
            if (str == "translate") return Command::Translate;
            if (str == "show") return Command::Show;
            return std::nullopt;
        }

        // Negative numbers like "-3" are positional, not options
        bool looks_like_option(const std::string &str)
        {
            return str.size() > 1 && str[0] == '-' && !std::isdigit(static_cast<unsigned char>(str[1]));
        }

    } // namespace

    ReturnCode Options::parse(int argc, const char **argv)
    {
        MSS_BEGIN(ReturnCode);

        rubr::cli::Range r{argc, argv};

        MSS(r.pop(exe_name));

        for (std::string arg; r.pop(arg);)
        {
            auto is = [&](const char *sh, const char *lh) {
                return arg == sh || arg == lh;
            };

            if (false) {}
            else if (is("-h", "--help"))
                print_help = true;
            else if (is("-v", "--verbose"))
            {
                std::string level;
                MSS(r.pop(level), std::cerr << "Expected a level after '" << arg << "'" << std::endl);
                const auto [ptr, ec] = std::from_chars(level.data(), level.data() + level.size(), verbose);
                MSS(ec == std::errc{} && ptr == level.data() + level.size(), std::cerr << "Invalid verbosity level '" << level << "'" << std::endl);
            }
            else if (is("-f", "--file"))
            {
                std::string fp;
                MSS(r.pop(fp), std::cerr << "Expected a filepath after '" << arg << "'" << std::endl);
                filepath = fp;
            }
            else if (is("-c", "--chars"))
                use_chars = true;
            else if (looks_like_option(arg))
                MSS(false, std::cerr << "Unknown CLI argument '" << arg << "'" << std::endl);
            else if (!command)
            {
                command = parse_command(arg);
                MSS(!!command, std::cerr << "Unknown command '" << arg << "'" << std::endl);
            }
            else
                args.push_back(arg);
        }

        MSS_END();
    }

    std::string Options::help() const
    {
        std::ostringstream oss;
        oss << "Help for '" << exe_name << "'" << std::endl;
        oss << exe_name << " Options Command Args" << std::endl;
        oss << "Options" << std::endl;
        oss << "    -h  --help            Print this help" << std::endl;
        oss << "    -v  --verbose LEVEL   Log level, 0 only reports errors" << std::endl;
        oss << "    -f  --file PATH       File used by 'show'" << std::endl;
        oss << "    -c  --chars           Offsets count UTF-8 code points instead of bytes" << std::endl;
        oss << "Commands" << std::endl;
        oss << "    info START END                Print span properties" << std::endl;
        oss << "    len START LEN                 Span from offset and length" << std::endl;
        oss << "    union A_START A_END B_START B_END" << std::endl;
        oss << "    intersect A_START A_END B_START B_END" << std::endl;
        oss << "    overlaps A_START A_END B_START B_END" << std::endl;
        oss << "    contains START END POS|B_START B_END" << std::endl;
        oss << "    translate START END DELTA" << std::endl;
        oss << "    show START END                Print the text covered by the span" << std::endl;
        return oss.str();
    }

} // namespace cli
