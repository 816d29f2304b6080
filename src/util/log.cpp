#include <util/log.hpp>

#include <gubg/Logger.hpp>

namespace util { namespace log {

    gubg::Logger s_logger;

    void set_level(int level)
    {
        s_logger.level = level;
    }
    void set_level(Level level)
    {
        set_level(static_cast<int>(level));
    }

    std::ostream &os(Level level)
    {
        return s_logger.os(static_cast<int>(level));
    }
    std::ostream &error()
    {
        return s_logger.error();
    }
    std::ostream &warning()
    {
        return s_logger.warning();
    }
    std::ostream &debug()
    {
        return os(Level::Debug);
    }

}} // namespace util::log
