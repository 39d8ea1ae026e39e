#ifndef TMPLX_PROCESSUTILS_HXX
#define TMPLX_PROCESSUTILS_HXX

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

struct ProcessResult {
  std::string command;
  std::string out, err;
  int code = -1;
  bool timed_out = false;
};

inline bool failed(const ProcessResult& process)
{
  return process.timed_out || process.code != 0;
}

struct RunOptions {
  // Zero disables the timeout.
  std::chrono::milliseconds timeout {0};
  std::string directory;
};

/**
 * Spawns executable with args, captures its standard output and error.
 *
 * The returned result is never a failure by itself, use check_process()
 * to turn timeouts and non-zero exit codes into exceptions.
 *
 * @throw executable_not_found if the process cannot be spawned.
 */
ProcessResult run_command(const std::string& executable,
                          const std::vector<std::string>& args,
                          const RunOptions& options = {});

class process_error : public std::runtime_error {
private:
  ProcessResult mResult;

public:
  process_error(const std::string& what, ProcessResult result)
    : std::runtime_error(what)
    , mResult(std::move(result))
  {}

  const ProcessResult& result() const noexcept { return mResult; }
};

class executable_not_found : public process_error {
public:
  using process_error::process_error;
};

class process_timeout : public process_error {
public:
  using process_error::process_error;
};

class process_failure : public process_error {
public:
  using process_error::process_error;
};

// Throws process_timeout or process_failure when the process did not succeed.
void check_process(const ProcessResult& process);

#endif // TMPLX_PROCESSUTILS_HXX
