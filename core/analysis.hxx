#ifndef TMPLX_ANALYSIS_HXX
#define TMPLX_ANALYSIS_HXX

#include <chrono>
#include <string>
#include <vector>

#include "Section.hxx"
#include "Symbol.hxx"
#include "toolchain.hxx"

struct AnalysisOptions {
  std::string elf;
  ToolchainOptions toolchain;
  std::chrono::milliseconds timeout {30000};
  bool line_numbers = false;

  // Previously captured tool outputs, used instead of running the tools.
  std::string nm_output;
  std::string readelf_output;
  std::string objdump_output;
};

class Analysis {
public:
  std::string elf;
  std::vector<Section> sections;
  std::vector<Symbol> symbols;
};

/**
 * Collects the sections and symbols of a binary.
 *
 * Tool failures are reported as nested exceptions, the innermost one being
 * a process_error (executable_not_found, process_timeout or process_failure).
 */
Analysis analyse_binary(const AnalysisOptions& options);

#endif // TMPLX_ANALYSIS_HXX
