#include "task.hxx"

#include <fstream>

#include <boost/program_options.hpp>

#include "logger.hxx"

namespace bpo = boost::program_options;

void Task::parse_args(const std::vector<std::string>& args, const std::string& config_file)
{
  const bpo::options_description opts = options();

  bpo::store(bpo::command_line_parser(args)
             .options(opts)
             .positional(positional_options())
             .run(), vm);

  if (!config_file.empty()) {
    std::ifstream in(config_file);
    if (!in)
      throw bpo::error("Unable to open configuration file \"" + config_file + "\"");

    LOG(debug) << "Loading options from " << config_file;

    bpo::store(bpo::parse_config_file(in, opts, true), vm);
  }

  bpo::notify(vm);

  check_args();
}

boost::program_options::positional_options_description Task::positional_options()
{
  return {};
}
