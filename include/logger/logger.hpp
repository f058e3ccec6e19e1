#ifndef VBAUNLOCK_LOGGER_HPP
#define VBAUNLOCK_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace vbaunlock::logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces every sink with a text file sink at log_file, records below min_level are dropped
void init_logging(const std::string& log_file,
                  severity_level min_level = boost::log::trivial::warning);

// Replaces every sink with one writing to standard error
void init_console_logging(severity_level min_level = boost::log::trivial::warning);

void set_log_level(severity_level min_level);

void enable_logging();
void disable_logging();

// trace, debug, info, warning, error or fatal
std::optional<severity_level> parse_severity(const std::string& name);

} // namespace vbaunlock::logging

#endif // VBAUNLOCK_LOGGER_HPP
