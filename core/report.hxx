#ifndef TMPLX_REPORT_HXX
#define TMPLX_REPORT_HXX

#include <iosfwd>
#include <vector>

#include "Section.hxx"
#include "Symbol.hxx"
#include "template-groups.hxx"

enum class output_format {
  text,
  csv
};

enum class group_order {
  input,
  size,
  unique_size,
  name
};

struct GroupReportOptions {
  output_format format = output_format::text;
  group_order order = group_order::input;
  bool specializations = false;
  bool non_templates = true;
  // Zero prints every group.
  size_t limit = 0;
};

// Stable, ties keep their input order.
std::vector<TemplateGroupSummary> sort_groups(std::vector<TemplateGroupSummary> groups, group_order order);

void print_groups(std::ostream& out,
                  const std::vector<TemplateGroupSummary>& groups,
                  const GroupReportOptions& options);

void print_symbols(std::ostream& out, const std::vector<Symbol>& symbols, output_format format);

void print_sections(std::ostream& out, const std::vector<Section>& sections, output_format format);

#endif // TMPLX_REPORT_HXX
