#include <log/log.hpp>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    void setSink(LogSink onLog)
    {
        Detail::logger.setSink(std::move(onLog));
    }

    void resetSink()
    {
        Detail::logger.setSink({});
    }
}
