#include "analysis.hxx"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "logger.hxx"
#include "nm.hxx"
#include "objdump.hxx"
#include "process-utils.hxx"
#include "readelf.hxx"
#include "symbol-assignment.hxx"
#include "utils.hxx"

namespace fs = std::filesystem;

namespace {

std::ifstream open_capture(const std::string& path)
{
  std::ifstream in(path);
  if (!in)
    throw std::runtime_error("Unable to open " + path);
  return in;
}

std::vector<Section> load_sections(const AnalysisOptions& options, const Toolchain& toolchain, const RunOptions& run)
{
  LOG_CTX() << "Reading sections of " << termcolor::blue << options.elf << termcolor::reset;

  std::vector<Section> sections;

  try {
    if (!options.readelf_output.empty()) {
      std::ifstream in = open_capture(options.readelf_output);
      parse_readelf_sections(in, sections);
    } else {
      check_process(readelf_sections(toolchain.readelf, options.elf, sections, run));
    }
  } catch (...) {
    std::throw_with_nested(std::runtime_error("Unable to read section headers from " + options.elf));
  }

  SectionHeaders headers;

  try {
    if (!options.objdump_output.empty()) {
      std::ifstream in = open_capture(options.objdump_output);
      parse_objdump_section_headers(in, headers);
    } else if (options.readelf_output.empty()) {
      check_process(objdump_section_headers(toolchain.objdump, options.elf, headers, run));
    }
  } catch (...) {
    std::throw_with_nested(std::runtime_error("Unable to read load addresses from " + options.elf));
  }

  apply_load_addresses(sections, headers);

  LOG(info) << sections.size() << " sections";

  return sections;
}

std::vector<NmSymbol> load_nm_symbols(const AnalysisOptions& options, const Toolchain& toolchain, const RunOptions& run)
{
  LOG_CTX() << "Reading symbols of " << termcolor::blue << options.elf << termcolor::reset;

  std::vector<NmSymbol> symbols;

  try {
    if (!options.nm_output.empty()) {
      std::ifstream in = open_capture(options.nm_output);
      parse_nm_output(in, symbols);
    } else {
      const int flags = options.line_numbers ? nm_options::line_numbers : 0;
      check_process(nm(toolchain.nm, options.elf, symbols, flags, run));
    }
  } catch (...) {
    std::throw_with_nested(std::runtime_error("Unable to read symbols from " + options.elf));
  }

  LOG(info) << symbols.size() << " symbols";

  return symbols;
}

} // anonymous namespace

Analysis analyse_binary(const AnalysisOptions& options)
{
  LOG_CTX_FLUSH(info) << "Analysing " << termcolor::green << (options.elf.empty() ? std::string("captured tool output") : options.elf) << termcolor::reset;

  const Toolchain toolchain = resolve_toolchain(options.toolchain);

  RunOptions run;
  run.timeout = options.timeout;

  Analysis analysis;
  analysis.elf = options.elf.empty() ? std::string() : fs::absolute(options.elf).string();

  analysis.sections = load_sections(options, toolchain, run);

  SymbolAssignment assignment = assign_symbols_to_sections(load_nm_symbols(options, toolchain, run), analysis.sections);

  for(const std::string& warning : assignment.warnings)
    LOG(warning) << warning;

  analysis.symbols = std::move(assignment.symbols);

  return analysis;
}
