#include "process-utils.hxx"

#include <future>
#include <sstream>

#include <boost/asio.hpp>
#include <boost/process.hpp>

#include "logger.hxx"
#include "utils.hxx"

namespace bp = boost::process;

namespace {

std::string format_command(const std::string& executable, const std::vector<std::string>& args)
{
  std::ostringstream ss;
  ss << executable;
  for(const std::string& arg : args)
    ss << ' ' << arg;
  return ss.str();
}

} // anonymous namespace

ProcessResult run_command(const std::string& executable,
                          const std::vector<std::string>& args,
                          const RunOptions& options)
{
  ProcessResult res;
  res.command = format_command(executable, args);

  bool found = false;
  const std::string path = which(executable, found);
  if (!found)
    throw executable_not_found("Unable to locate \"" + executable + "\" executable", res);

  LOG(debug) << "Running " << res.command;

  boost::asio::io_context ios;
  std::future<std::string> out_, err_;
  std::error_code ec;

  bp::child c(bp::exe = path,
              bp::args = args,
              bp::start_dir = options.directory.empty() ? std::string(".") : options.directory,
              bp::std_in.close(),
              bp::std_out > out_,
              bp::std_err > err_,
              ios,
              ec);

  if (ec)
    throw executable_not_found("Unable to run \"" + res.command + "\": " + ec.message(), res);

  if (options.timeout.count() > 0) {
    ios.run_for(options.timeout);

    if (!ios.stopped()) {
      res.timed_out = true;

      std::error_code terminate_ec;
      c.terminate(terminate_ec);
      if (terminate_ec)
        LOG(warning) << "Unable to terminate \"" << res.command << "\": " << terminate_ec.message();

      LOG(debug) << res.command << " timed out after " << options.timeout.count() << " ms";
      return res;
    }
  } else {
    ios.run();
  }

  c.wait(ec);

  res.code = c.exit_code();
  res.out = out_.get();
  res.err = err_.get();

  LOG(trace) << res.command << " exited with code " << res.code;

  return res;
}

void check_process(const ProcessResult& process)
{
  if (process.timed_out)
    throw process_timeout("Command timed out: " + process.command, process);

  if (process.code != 0) {
    std::ostringstream ss;
    ss << "Command failed with exit code " << process.code << ": " << process.command;

    const std::string err = trim_copy(process.err);
    if (!err.empty())
      ss << '\n' << err;

    throw process_failure(ss.str(), process);
  }
}
