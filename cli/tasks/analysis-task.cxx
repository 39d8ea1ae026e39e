#include "analysis-task.hxx"

#include <chrono>

#include <boost/program_options.hpp>

#include "option-validators.hxx"
#include "toolchain.hxx"

namespace bpo = boost::program_options;

boost::program_options::options_description Analysis_Task::options()
{
  bpo::options_description opt("Options");
  opt.add_options()
      ("elf",
       bpo::value<std::string>()->value_name("file"),
       "Binary to analyse.")
      ("toolchain-prefix",
       bpo::value<std::string>()->value_name("prefix")->default_value(default_toolchain_prefix),
       "Prefix of the binutils commands.")
      ("toolchain-dir",
       bpo::value<std::string>()->value_name("dir"),
       "Directory searched for the binutils before PATH.")
      ("timeout",
       bpo::value<unsigned int>()->value_name("ms")->default_value(30000),
       "Maximum duration of each binutils command, 0 to disable.")
      ("line-numbers",
       bpo::bool_switch(),
       "Resolve the source location of symbols (slow).")
      ("format",
       bpo::value<output_format>()->value_name("format")->default_value(output_format::text, "text"),
       "Output format (text, csv).")
      ("nm-output",
       bpo::value<std::string>()->value_name("file"),
       "Read symbols from a previously captured nm output.")
      ("readelf-output",
       bpo::value<std::string>()->value_name("file"),
       "Read sections from a previously captured \"readelf -S -W\" output.")
      ("objdump-output",
       bpo::value<std::string>()->value_name("file"),
       "Read load addresses from a previously captured \"objdump -h\" output.")
      ;

  return opt;
}

boost::program_options::positional_options_description Analysis_Task::positional_options()
{
  bpo::positional_options_description pos;
  pos.add("elf", 1);
  return pos;
}

void Analysis_Task::check_args()
{
  const bool captured = vm.count("nm-output") && vm.count("readelf-output");
  if (!vm.count("elf") && !captured)
    throw bpo::error("No binary specified");
}

AnalysisOptions Analysis_Task::analysis_options() const
{
  AnalysisOptions options;

  if (vm.count("elf"))
    options.elf = vm["elf"].as<std::string>();

  options.toolchain.prefix = vm["toolchain-prefix"].as<std::string>();
  if (vm.count("toolchain-dir"))
    options.toolchain.directory = vm["toolchain-dir"].as<std::string>();

  options.timeout = std::chrono::milliseconds(vm["timeout"].as<unsigned int>());
  options.line_numbers = vm["line-numbers"].as<bool>();

  if (vm.count("nm-output"))
    options.nm_output = vm["nm-output"].as<std::string>();
  if (vm.count("readelf-output"))
    options.readelf_output = vm["readelf-output"].as<std::string>();
  if (vm.count("objdump-output"))
    options.objdump_output = vm["objdump-output"].as<std::string>();

  return options;
}

output_format Analysis_Task::format() const
{
  return vm["format"].as<output_format>();
}
