#ifndef TMPLX_TEMPLATE_GROUPS_HXX
#define TMPLX_TEMPLATE_GROUPS_HXX

#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "Symbol.hxx"

// Group ids of non-template symbols are this prefix, a space and the symbol name.
constexpr const char* non_template_group_prefix = "[non-template]";

struct TemplateGroupSymbolSummary {
  std::string symbol_id;
  std::string name;
  std::optional<std::string> mangled_name;
  double size_bytes = 0.0;
  std::optional<std::string> specialization_key;
  std::optional<std::string> section_id;
  std::optional<std::string> block_id;
  std::optional<std::string> window_id;
  double addr = std::numeric_limits<double>::quiet_NaN();
  std::optional<SymbolLocation> primary_location;
};

struct TemplateGroupSpecializationTotals {
  size_t symbol_count = 0;
  double size_bytes = 0.0;
  double unique_size_bytes = 0.0;
};

struct TemplateGroupSpecializationSummary {
  std::optional<std::string> key;
  std::vector<TemplateGroupSymbolSummary> symbols;
  TemplateGroupSpecializationTotals totals;
};

struct TemplateGroupTotals {
  size_t symbol_count = 0;
  size_t specialization_count = 0;
  double size_bytes = 0.0;
  double unique_size_bytes = 0.0;
  double largest_symbol_size_bytes = 0.0;
  double smallest_symbol_size_bytes = 0.0;
};

struct TemplateGroupSummary {
  std::string id;
  std::string display_name;
  bool is_template = false;
  std::vector<TemplateGroupSymbolSummary> symbols;
  std::vector<TemplateGroupSpecializationSummary> specializations;
  TemplateGroupTotals totals;
};

bool operator==(const TemplateGroupSymbolSummary& lhs, const TemplateGroupSymbolSummary& rhs);
bool operator==(const TemplateGroupSpecializationTotals& lhs, const TemplateGroupSpecializationTotals& rhs);
bool operator==(const TemplateGroupSpecializationSummary& lhs, const TemplateGroupSpecializationSummary& rhs);
bool operator==(const TemplateGroupTotals& lhs, const TemplateGroupTotals& rhs);
bool operator==(const TemplateGroupSummary& lhs, const TemplateGroupSummary& rhs);

/**
 * Groups symbols by template family, then by specialization.
 *
 * Groups are returned in order of first occurrence in symbols, and so are the
 * specializations of a group. Non-template symbols get a group of their own
 * per distinct name, with a single specialization without key.
 *
 * unique_size_bytes counts each (section, address) location once, with the
 * largest size reported for it.
 */
std::vector<TemplateGroupSummary> build_template_groups(const std::vector<Symbol>& symbols);

#endif // TMPLX_TEMPLATE_GROUPS_HXX
