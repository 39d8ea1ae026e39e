#ifndef TMPLX_SYMBOL_HXX
#define TMPLX_SYMBOL_HXX

#include <limits>
#include <optional>
#include <string>
#include <vector>

enum class SymbolKind {
  func,
  object,
  section,
  file,
  other
};

const char* to_string(SymbolKind kind);

enum class AddressKind {
  runtime,
  load,
  exec
};

const char* to_string(AddressKind kind);

struct SourceLocation {
  std::string file;
  long line = 0;
};

struct SymbolLocation {
  std::optional<std::string> window_id;
  std::optional<std::string> block_id;
  AddressKind address_type = AddressKind::runtime;
  double addr = std::numeric_limits<double>::quiet_NaN();
};

bool operator==(const SourceLocation& lhs, const SourceLocation& rhs);
bool operator!=(const SourceLocation& lhs, const SourceLocation& rhs);
bool operator==(const SymbolLocation& lhs, const SymbolLocation& rhs);
bool operator!=(const SymbolLocation& lhs, const SymbolLocation& rhs);

/**
 * A located, sized entity of the analysed binary.
 *
 * Sizes and addresses are doubles because they may be missing: a NaN address
 * or a non-finite size is valid input for the aggregation code.
 */
class Symbol
{
public:
  std::string id;
  std::string name;
  std::optional<std::string> mangled_name;
  SymbolKind kind = SymbolKind::other;
  double addr = std::numeric_limits<double>::quiet_NaN();
  double size = 0.0;
  std::optional<std::string> section_id;
  std::optional<std::string> block_id;
  std::optional<std::string> window_id;
  bool weak = false;
  bool local = false;
  std::optional<SourceLocation> source;
  std::optional<SymbolLocation> primary_location;
  std::vector<SymbolLocation> locations;
  std::vector<std::string> aliases;
};

#endif // TMPLX_SYMBOL_HXX
