#ifndef BLOBSTORE_LOGGER_HPP
#define BLOBSTORE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace blobstore::logger {

// Installs a rotating file sink and, when `console` is set, a console sink.
// Replaces any sinks installed before. Records below `min_level` are dropped.
void init_logging(const std::string& log_file = "blobstore.log",
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info,
                  bool console = false);

// Console-only logging, used by the tests
void init_console_logging(boost::log::trivial::severity_level min_level = boost::log::trivial::warning);

} // namespace blobstore::logger

#endif // BLOBSTORE_LOGGER_HPP
