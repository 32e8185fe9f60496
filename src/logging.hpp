#ifndef ALIGN_DIST_LOGGING_H
#define ALIGN_DIST_LOGGING_H

#include <cpplog.hpp>

namespace align_dist {

/// Shared logger; writes to stderr, filtered at the current level (default: LL_INFO)
cpplog::BaseLogger& logger();

void setLogLevel(const cpplog::loglevel_t level);

/// Send filtered messages to `target` instead of stderr; nullptr restores stderr.
void setLogTarget(cpplog::BaseLogger* target);

}

#endif
