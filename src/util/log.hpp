#ifndef HEADER_util_log_hpp_ALREAD_INCLUDED
#define HEADER_util_log_hpp_ALREAD_INCLUDED

#include <ostream>

namespace util { namespace log {

    // Higher levels are more verbose
    enum class Level : int
    {
        Error = 0,
        Warning = 1,
        Info = 2,
        Debug = 3,
    };

    void set_level(int level);
    void set_level(Level level);

    std::ostream &os(Level level);
    std::ostream &error();
    std::ostream &warning();
    std::ostream &debug();

}} // namespace util::log

#endif
