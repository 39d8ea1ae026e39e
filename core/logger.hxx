#ifndef TMPLX_LOGGER_HXX
#define TMPLX_LOGGER_HXX

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <termcolor/termcolor.hpp>

namespace CTXLogger {

enum class severity_level
{
  trace,
  debug,
  info,
  warning,
  error,
  fatal,
  always
};

extern severity_level _severity_level;

// Throws std::invalid_argument on unknown names.
severity_level parse_severity_level(const std::string& s);

const char* to_string(severity_level lvl);

class Message {
private:
  std::stringstream ss;

public:
  Message() = default;
  Message(const Message&) = delete;
  Message(Message&&) = default;
  Message& operator=(const Message&) = delete;
  Message& operator=(Message&&) = default;

  template<typename T>
  Message& operator<<(T&& value) & { ss << std::forward<T>(value); return *this; }

  template<typename T>
  Message&& operator<<(T&& value) && { ss << std::forward<T>(value); return std::move(*this); }

  // Stream manipulators (termcolor::red, std::hex...) are function templates,
  // they need an explicit overload to be deduced.
  Message& operator<<(std::ostream& (*manip)(std::ostream&)) & { ss << manip; return *this; }
  Message&& operator<<(std::ostream& (*manip)(std::ostream&)) && { ss << manip; return std::move(*this); }

  operator std::string() const & { return ss.str(); }
  operator std::string() && { return std::move(ss).str(); }

  std::string to_string() const & { return ss.str(); }
  std::string to_string() && { return std::move(ss).str(); }
};

class Sink {
public:
  virtual ~Sink() = default;
  virtual void log(const std::string& m) = 0;
  virtual void log(const char* m) = 0;
};

class StreamSink : public Sink {
private:
  std::ostream& str;

public:
  explicit StreamSink(std::ostream& str) : Sink(), str(str) {}

  void log(const std::string& m) override;
  void log(const char* m) override;

  static bool is_atty(const std::ostream& stream);

private:
  static FILE* get_standard_stream(const std::ostream& stream);
};

// Keeps every message, mostly useful to inspect logs from tests.
class MemorySink : public Sink {
private:
  std::vector<std::string>& messages;

public:
  explicit MemorySink(std::vector<std::string>& messages) : Sink(), messages(messages) {}

  void log(const std::string& m) override { messages.emplace_back(m); }
  void log(const char* m) override { messages.emplace_back(m); }
};

class ContextMessage {
private:
  std::string message;
  bool consumed = false;

public:
  ContextMessage() noexcept = default;
  ContextMessage(std::string message) noexcept : message(std::move(message)) {}
  ContextMessage(const ContextMessage&) = delete;
  ContextMessage(ContextMessage&& other) noexcept
    : message(std::move(other.message))
    , consumed(std::exchange(other.consumed, true))
  {}
  ContextMessage& operator=(const ContextMessage&) = delete;
  ContextMessage& operator=(ContextMessage&& other) noexcept {
    message = std::move(other.message);
    consumed = std::exchange(other.consumed, true);
    return *this;
  }

  bool isConsumed() const noexcept { return consumed; }

  std::string getMessage() noexcept {
    consumed = true;
    return std::move(message);
  }
};

class Logger;

class ContextMessageGuard {
private:
  Logger& logger;
  std::shared_ptr<ContextMessage> message;

public:
  ContextMessageGuard(Logger& logger, std::shared_ptr<ContextMessage> message) noexcept;
  ContextMessageGuard(const ContextMessageGuard&) = delete;
  ContextMessageGuard(ContextMessageGuard&&) noexcept = default;
  ContextMessageGuard& operator=(const ContextMessageGuard&) = delete;
  ContextMessageGuard& operator=(ContextMessageGuard&&) = delete;
  ~ContextMessageGuard() noexcept;
};

class ContextMessageGuardFactory {
private:
  Logger& logger;
  bool flush_immediately;

public:
  ContextMessageGuardFactory(Logger& logger, bool flush_immediately = false) : logger(logger), flush_immediately(flush_immediately) {}
  ContextMessageGuard operator<<=(std::string message);
};

class Logger {
private:
  std::unique_ptr<Sink> sink;
  std::vector<std::shared_ptr<ContextMessage>> context;

public:
  Logger() : sink(std::make_unique<StreamSink>(std::cerr)) {}

  void set_sink(std::unique_ptr<Sink> sink) {
    this->sink = std::move(sink);
  }

  ContextMessageGuard make_guard(std::string message) {
    return ContextMessageGuard(*this,
                               context.emplace_back(
                                 std::make_shared<ContextMessage>(
                                   std::move(message)
                                 )
                               )
                              );
  }

  void log(const std::string& m);

  void log(const char* m);

  void operator|(const std::string& m);

  void operator|(const char* m);

  void log_exception(const std::exception& ex, std::size_t depth = 0);

  void flush();

  // Drops pending context messages without printing them.
  void clear_context();

private:
  void pop_context();

  friend ContextMessageGuard;
};

extern Logger logger;

// Set once at startup, when stderr is a terminal.
extern bool color_support;

inline std::ostream& configure_colors(std::ostream& os) {
  if (color_support)
    os << termcolor::colorize;
  return os;
}

} // namespace CTXLogger

#define LOG_CONCAT_IMPL(x, y) x ## y
#define LOG_CONCAT(x, y) LOG_CONCAT_IMPL(x, y)

#define LOG_FLUSH() ::CTXLogger::logger.flush()


#define LOG(lvl) \
  for(bool live = ::CTXLogger::_severity_level <= ::CTXLogger::severity_level::lvl; live; live = false) \
    ::CTXLogger::logger | ::CTXLogger::Message() << ::CTXLogger::configure_colors


#define LOG_CTX() \
  [[maybe_unused]] const ::CTXLogger::ContextMessageGuard LOG_CONCAT(__context_message_guard, __LINE__) = \
  ::CTXLogger::ContextMessageGuardFactory(::CTXLogger::logger) <<= ::CTXLogger::Message() << ::CTXLogger::configure_colors

// Also printed right away when lvl is enabled.
#define LOG_CTX_FLUSH(lvl) \
  [[maybe_unused]] const ::CTXLogger::ContextMessageGuard LOG_CONCAT(__context_message_guard, __LINE__) = \
  ::CTXLogger::ContextMessageGuardFactory(::CTXLogger::logger, ::CTXLogger::_severity_level <= ::CTXLogger::severity_level::lvl) <<= ::CTXLogger::Message() << ::CTXLogger::configure_colors


#define LOG_EX(lvl, ex) \
  for(bool live = ::CTXLogger::_severity_level <= ::CTXLogger::severity_level::lvl; live; live = false) \
    LOG_FLUSH(), ::CTXLogger::logger.log_exception(ex)

#endif // TMPLX_LOGGER_HXX
