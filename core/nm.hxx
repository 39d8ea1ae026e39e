#ifndef TMPLX_NM_HXX
#define TMPLX_NM_HXX

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "Symbol.hxx"
#include "process-utils.hxx"

class NmSymbol
{
public:
  std::uint64_t address = 0;
  std::uint64_t size = 0;
  char type = '?';
  // Demangled when possible.
  std::string name;
  // As printed by nm.
  std::string raw_name;
  std::optional<SourceLocation> source;
};

void parse_nm_output(std::istream& stream, std::vector<NmSymbol>& symbols);

// Parses "file:line[:column] [(discriminator N)]", "??:0" is not a location.
std::optional<SourceLocation> parse_source_location(const std::string& value);

// Returns name unchanged when it is not a mangled C++ name.
std::string demangle(const std::string& name);

namespace nm_options {
  constexpr int line_numbers = 1 << 0;
};

std::vector<std::string> nm_arguments(const std::string& file, const int flags);

ProcessResult nm(const std::string& executable,
                 const std::string& file,
                 std::vector<NmSymbol>& symbols,
                 const int flags,
                 const RunOptions& options = {});

#endif // TMPLX_NM_HXX
