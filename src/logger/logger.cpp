#include "logger/logger.hpp"
#include <filesystem>
#include <iostream>
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

namespace blobstore::logger {

namespace {

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

auto record_format() {
  return expr::stream
    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
    << " [" << logging::trivial::severity << "]"
    << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "] "
    << expr::smessage;
}

void add_console_sink() {
  using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
  auto backend = boost::make_shared<sinks::text_ostream_backend>();
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<console_sink>(backend);
  sink->set_formatter(record_format());
  logging::core::get()->add_sink(sink);
}

} // namespace

void init_logging(const std::string& log_file, logging::trivial::severity_level min_level, bool console) {
  try {
    logging::core::get()->remove_all_sinks();

    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    auto backend = boost::make_shared<sinks::text_file_backend>(
      keywords::file_name = log_path.string(),
      keywords::rotation_size = 10 * 1024 * 1024,
      keywords::open_mode = std::ios::out | std::ios::app);
    backend->auto_flush(true);

    using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
    auto sink = boost::make_shared<file_sink>(backend);
    sink->set_formatter(record_format());
    logging::core::get()->add_sink(sink);

    if (console) {
      add_console_sink();
    }

    logging::add_common_attributes();
    logging::core::get()->set_filter(logging::trivial::severity >= min_level);
    logging::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file " << log_path.string();
  } catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging(logging::trivial::severity_level min_level) {
  logging::core::get()->remove_all_sinks();
  add_console_sink();
  logging::add_common_attributes();
  logging::core::get()->set_filter(logging::trivial::severity >= min_level);
}

} // namespace blobstore::logger
