#include <cstdlib>
#include <map>
#include <string>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include <vt/utility/Logging.hpp>
#include <vt/utility/Text.hpp>

namespace vt::utility {

bool setLogLevel(std::string_view level) {
  static const std::map<std::string, boost::log::trivial::severity_level> sevs {
    {"trace",   boost::log::trivial::trace},
    {"debug",   boost::log::trivial::debug},
    {"info",    boost::log::trivial::info},
    {"warning", boost::log::trivial::warning},
    {"error",   boost::log::trivial::error},
    {"fatal",   boost::log::trivial::fatal},
  };
  auto levit = sevs.find(toLower(trim(level)));
  if (levit == sevs.end()) {
    return false;
  }
  boost::log::core::get()->set_filter(
    boost::log::trivial::severity >= levit->second
  );
  return true;
}

void setLogFilter() {
  if (const char* level = std::getenv("VT_LOG_LEVEL")) {
    if (!setLogLevel(level)) {
      VT_LOG(warning) << "Ignoring unknown VT_LOG_LEVEL '" << level << "'";
    }
  }
}

} // namespace vt::utility
