#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

#include "logger.hxx"
#include "option-validators.hxx"

#include "tasks/groups-task.hxx"
#include "tasks/sections-task.hxx"
#include "tasks/symbols-task.hxx"

namespace bpo = boost::program_options;

namespace {
#define COMMAND_FACTORY(T) [](){ return std::make_unique<T>(); }

using CommandFactory = std::function<std::unique_ptr<Task>()>;
const std::vector<std::pair<std::string, CommandFactory>> commands = {
    {"groups"              , COMMAND_FACTORY(Groups_Task)},
    {"symbols"             , COMMAND_FACTORY(Symbols_Task)},
    {"sections"            , COMMAND_FACTORY(Sections_Task)},
};

std::unique_ptr<Task> get_task(const std::string& command_arg) {
  auto factory = std::find_if(commands.begin(),
                              commands.end(),
                              [&command_arg](const std::pair<std::string, CommandFactory>& cmd){ return cmd.first == command_arg; });
  if (factory == commands.end())
    return nullptr;
  else
    return factory->second();
}

void usage(std::ostream& out,
           const std::string& argv0,
           const bpo::options_description& base_options) {
  out << "Usage: " << argv0 << " [options] command [command options]\n";
  out << base_options;
  out << "Available commands:\n";
  for(const auto& cmd : commands)
    out << "  " << cmd.first << "\n";
}

void usage(std::ostream& out,
           const std::string& argv0,
           const std::string& task_name,
           const bpo::options_description& base_options,
           const bpo::options_description& task_options) {
  out << "Usage: " << argv0 << " [options] " << task_name << " [command options] [elf]\n";
  out << base_options;
  out << task_options;
}

// The verbosity may come from the configuration file when not given on the command line.
void load_common_options(const std::string& config_file,
                         const bpo::options_description& base_options,
                         bpo::variables_map& vm)
{
  std::ifstream in(config_file);
  if (!in)
    throw bpo::error("Unable to open configuration file \"" + config_file + "\"");

  bpo::store(bpo::parse_config_file(in, base_options, true), vm);
}

} // anonymous namespace

int main(int argc, char** argv)
{
  CTXLogger::color_support = CTXLogger::StreamSink::is_atty(std::cerr);

  bool help = false;
  std::string config_file;

  bpo::options_description base_options {"Common options"};
  base_options.add_options()
      ("help,h",
       bpo::bool_switch(&help),
       "Produce help message.")
      ("verbose,v",
       bpo::value<CTXLogger::severity_level>(&CTXLogger::_severity_level)->default_value(CTXLogger::severity_level::warning, "warning"),
       "Verbosity level (trace, debug, info, warning, error, fatal).")
      ("config",
       bpo::value<std::string>(&config_file)->value_name("file"),
       "Read default option values from an INI-style file.")
      ;

  if (argc == 1) {
    usage(std::cerr, argv[0], base_options);
    return -1;
  }

  try {
    const bpo::parsed_options recognized_args = bpo::command_line_parser(argc, argv)
                                                .style(bpo::command_line_style::default_style & ~bpo::command_line_style::allow_guessing)
                                                .options(base_options)
                                                .allow_unregistered()
                                                .run();
    bpo::variables_map vm;
    bpo::store(recognized_args, vm);

    if (vm.count("config"))
      load_common_options(vm["config"].as<std::string>(), base_options, vm);

    vm.notify();

    std::vector<std::string> args = bpo::collect_unrecognized(recognized_args.options, bpo::include_positional);

    if (args.empty()) {
      if (help) {
        usage(std::cout, argv[0], base_options);
        return 0;
      } else {
        throw bpo::error("No command specified");
      }
    }

    std::string task_name = args.front();
    args.erase(args.begin());
    std::unique_ptr<Task> task = get_task(task_name);

    if (!task) {
      throw bpo::error("Unknown command \"" + task_name + "\"");
    }

    if (help) {
      usage(std::cout, argv[0], task_name, base_options, task->options());
      return 0;
    }

    task->parse_args(args, config_file);

    LOG(debug) << "Running " << task_name;

    task->execute(std::cout);
    std::cout.flush();
  }
  catch (const std::exception& ex) {
    LOG_EX(fatal, ex);
    return -1;
  }

  return 0;
}
