#pragma once

#include <string_view>
#include <boost/log/trivial.hpp>

#define VT_LOG(lev) BOOST_LOG_TRIVIAL(lev)

namespace vt::utility {

// Applies the VT_LOG_LEVEL environment variable, if set to a known level.
void setLogFilter();

// trace, debug, info, warning, error or fatal; returns false for anything else.
bool setLogLevel(std::string_view level);

} // namespace vt::utility
