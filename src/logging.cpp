#include "logging.hpp"

#include <memory>

namespace align_dist {

namespace {
cpplog::StdErrLogger stdErrLogger;
cpplog::BaseLogger* currentTarget = &stdErrLogger;
cpplog::loglevel_t currentLevel = LL_INFO;
std::unique_ptr<cpplog::FilteringLogger> filteringLogger(new cpplog::FilteringLogger(currentLevel, currentTarget));
}

cpplog::BaseLogger& logger()
{
    return *filteringLogger;
}

void setLogLevel(const cpplog::loglevel_t level)
{
    currentLevel = level;
    filteringLogger.reset(new cpplog::FilteringLogger(currentLevel, currentTarget));
}

void setLogTarget(cpplog::BaseLogger* target)
{
    currentTarget = target ? target : &stdErrLogger;
    filteringLogger.reset(new cpplog::FilteringLogger(currentLevel, currentTarget));
}

}
