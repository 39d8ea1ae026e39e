#include "logger.hxx"

#include <stdexcept>
#include <unistd.h> // isatty(), fileno()

#include "utils.hxx"

namespace CTXLogger {

severity_level _severity_level = severity_level::warning;

severity_level parse_severity_level(const std::string& s)
{
  if (s == "trace")
    return severity_level::trace;
  if (s == "debug")
    return severity_level::debug;
  if (s == "info")
    return severity_level::info;
  if (s == "warning")
    return severity_level::warning;
  if (s == "error")
    return severity_level::error;
  if (s == "fatal")
    return severity_level::fatal;

  throw std::invalid_argument("Unknown severity level: " + s);
}

const char* to_string(const severity_level lvl)
{
  switch (lvl) {
  case severity_level::trace: return "trace";
  case severity_level::debug: return "debug";
  case severity_level::info: return "info";
  case severity_level::warning: return "warning";
  case severity_level::error: return "error";
  case severity_level::fatal: return "fatal";
  case severity_level::always: return "always";
  }
  return "unknown";
}

void StreamSink::log(const std::string& m) { str << m << std::endl; }

void StreamSink::log(const char* m) { str << m << std::endl; }

FILE* StreamSink::get_standard_stream(const std::ostream& stream)
{
  if (&stream == &std::cout)
    return stdout;
  else if ((&stream == &std::cerr) || (&stream == &std::clog))
    return stderr;

  return nullptr;
}

bool StreamSink::is_atty(const std::ostream& stream)
{
  FILE* std_stream = get_standard_stream(stream);

  // fileno() crashes on an invalid FILE*, anything that is not
  // a standard stream is assumed not to be a terminal.
  if (!std_stream)
    return false;

  return ::isatty(fileno(std_stream));
}

void Logger::log(const std::string& m) {
  flush();
  sink->log(m);
}

void Logger::log(const char* m) {
  flush();
  sink->log(m);
}

void Logger::operator|(const char* m) {
  log(m);
}

void Logger::operator|(const std::string& m) {
  log(m);
}

void Logger::log_exception(const std::exception& ex, std::size_t depth)
{
  log(Message() << configure_colors << termcolor::red << "Error: " << termcolor::reset << io::repeat("  ", depth) << ex.what());

  try {
    std::rethrow_if_nested(ex);
  } catch (const std::exception& nested) {
    log_exception(nested, depth + 1);
  }
}

void Logger::pop_context() {
  if (!context.empty())
    context.pop_back();
}

void Logger::flush() {
  for(const auto& m : context) {
    if (!m->isConsumed())
      sink->log(m->getMessage());
  }

  context.clear();
}

void Logger::clear_context() {
  context.clear();
}

ContextMessageGuard::ContextMessageGuard(Logger& logger, std::shared_ptr<ContextMessage> message) noexcept
  : logger(logger)
  , message(std::move(message))
{}

ContextMessageGuard::~ContextMessageGuard() noexcept {
  if (!message)
    return;
  if (std::uncaught_exceptions())
    logger.flush();
  if (!message->isConsumed())
    logger.pop_context();
}

ContextMessageGuard ContextMessageGuardFactory::operator<<=(std::string message) {
  ContextMessageGuard g = logger.make_guard(std::move(message));

  if (flush_immediately)
    logger.flush();

  return g;
}

Logger logger;

bool color_support = false;

} // namespace CTXLogger
