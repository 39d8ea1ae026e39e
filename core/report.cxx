#include "report.hxx"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

#include <termcolor/termcolor.hpp>

#include "csvprinter.hxx"
#include "utils.hxx"

namespace {

constexpr int number_width = 10;

const char* no_specialization = "(none)";

std::string specialization_label(const std::optional<std::string>& key)
{
  return key ? "<" + *key + ">" : std::string(no_specialization);
}

std::string format_address(const double addr)
{
  if (!std::isfinite(addr) || addr < 0)
    return "?";
  return to_hex(static_cast<std::uint64_t>(addr));
}

// "runtime:0x20000000 load:0x8002188"
std::string format_locations(const std::vector<SymbolLocation>& locations)
{
  std::string s;
  for(const SymbolLocation& location : locations) {
    if (!s.empty())
      s += ' ';
    s += to_string(location.address_type);
    s += ':';
    s += format_address(location.addr);
  }
  return s;
}

std::vector<const TemplateGroupSummary*> select_groups(const std::vector<TemplateGroupSummary>& groups,
                                                       const GroupReportOptions& options)
{
  std::vector<const TemplateGroupSummary*> selected;
  for(const TemplateGroupSummary& group : groups) {
    if (!options.non_templates && !group.is_template)
      continue;
    selected.push_back(&group);
    if (options.limit > 0 && selected.size() == options.limit)
      break;
  }
  return selected;
}

void print_groups_text(std::ostream& out,
                       const std::vector<const TemplateGroupSummary*>& groups,
                       const GroupReportOptions& options)
{
  out << std::right
      << std::setw(number_width) << "Symbols"
      << std::setw(number_width) << "Specs"
      << std::setw(number_width) << "Size"
      << std::setw(number_width) << "Unique"
      << std::setw(number_width) << "Largest"
      << std::setw(number_width) << "Smallest"
      << "  Group" << '\n';

  for(const TemplateGroupSummary* group : groups) {
    const TemplateGroupTotals& totals = group->totals;
    out << std::right
        << std::setw(number_width) << totals.symbol_count
        << std::setw(number_width) << totals.specialization_count
        << std::setw(number_width) << format_number(totals.size_bytes)
        << std::setw(number_width) << format_number(totals.unique_size_bytes)
        << std::setw(number_width) << format_number(totals.largest_symbol_size_bytes)
        << std::setw(number_width) << format_number(totals.smallest_symbol_size_bytes)
        << "  ";

    if (group->is_template)
      out << termcolor::green << group->display_name << termcolor::reset;
    else
      out << group->display_name;
    out << '\n';

    if (!options.specializations || !group->is_template)
      continue;

    for(const TemplateGroupSpecializationSummary& specialization : group->specializations) {
      const TemplateGroupSpecializationTotals& st = specialization.totals;
      out << std::right
          << std::setw(number_width) << st.symbol_count
          << std::setw(number_width) << ""
          << std::setw(number_width) << format_number(st.size_bytes)
          << std::setw(number_width) << format_number(st.unique_size_bytes)
          << std::setw(number_width) << ""
          << std::setw(number_width) << ""
          << "    " << termcolor::blue << specialization_label(specialization.key) << termcolor::reset << '\n';
    }
  }
}

void print_groups_csv(std::ostream& out,
                      const std::vector<const TemplateGroupSummary*>& groups,
                      const GroupReportOptions& options)
{
  csv::printer csv(out);

  csv << "group" << "template" << "symbols" << "specializations"
      << "size" << "unique_size" << "largest" << "smallest";
  if (options.specializations)
    csv << "specialization" << "specialization_symbols" << "specialization_size" << "specialization_unique_size";
  csv << csv::endrow;

  auto print_group_columns = [&csv](const TemplateGroupSummary& group) {
    const TemplateGroupTotals& totals = group.totals;
    csv << group.display_name
        << (group.is_template ? 1 : 0)
        << totals.symbol_count
        << totals.specialization_count
        << format_number(totals.size_bytes)
        << format_number(totals.unique_size_bytes)
        << format_number(totals.largest_symbol_size_bytes)
        << format_number(totals.smallest_symbol_size_bytes);
  };

  for(const TemplateGroupSummary* group : groups) {
    if (!options.specializations) {
      print_group_columns(*group);
      csv << csv::endrow;
      continue;
    }

    for(const TemplateGroupSpecializationSummary& specialization : group->specializations) {
      print_group_columns(*group);

      if (specialization.key)
        csv << *specialization.key;
      else
        csv << csv::empty;

      csv << specialization.totals.symbol_count
          << format_number(specialization.totals.size_bytes)
          << format_number(specialization.totals.unique_size_bytes)
          << csv::endrow;
    }
  }

  csv << csv::flush;
}

} // anonymous namespace

std::vector<TemplateGroupSummary> sort_groups(std::vector<TemplateGroupSummary> groups, const group_order order)
{
  switch (order) {
  case group_order::input:
    break;
  case group_order::size:
    std::stable_sort(groups.begin(), groups.end(), [](const TemplateGroupSummary& lhs, const TemplateGroupSummary& rhs) {
      return lhs.totals.size_bytes > rhs.totals.size_bytes;
    });
    break;
  case group_order::unique_size:
    std::stable_sort(groups.begin(), groups.end(), [](const TemplateGroupSummary& lhs, const TemplateGroupSummary& rhs) {
      return lhs.totals.unique_size_bytes > rhs.totals.unique_size_bytes;
    });
    break;
  case group_order::name:
    std::stable_sort(groups.begin(), groups.end(), [](const TemplateGroupSummary& lhs, const TemplateGroupSummary& rhs) {
      return lhs.display_name < rhs.display_name;
    });
    break;
  }

  return groups;
}

void print_groups(std::ostream& out,
                  const std::vector<TemplateGroupSummary>& groups,
                  const GroupReportOptions& options)
{
  const std::vector<const TemplateGroupSummary*> selected = select_groups(groups, options);

  if (options.format == output_format::csv)
    print_groups_csv(out, selected, options);
  else
    print_groups_text(out, selected, options);
}

void print_symbols(std::ostream& out, const std::vector<Symbol>& symbols, const output_format format)
{
  if (format == output_format::csv) {
    csv::printer csv(out);
    csv << "id" << "address" << "size" << "kind" << "section" << "name" << "mangled_name" << "source" << "locations" << csv::endrow;

    for(const Symbol& symbol : symbols) {
      csv << symbol.id
          << format_address(symbol.addr)
          << format_number(symbol.size)
          << to_string(symbol.kind)
          << symbol.section_id.value_or("")
          << symbol.name
          << symbol.mangled_name.value_or("");
      if (symbol.source)
        csv << (symbol.source->file + ":" + std::to_string(symbol.source->line));
      else
        csv << csv::empty;
      csv << format_locations(symbol.locations) << csv::endrow;
    }

    csv << csv::flush;
    return;
  }

  for(const Symbol& symbol : symbols) {
    out << std::left << std::setw(12) << symbol.id
        << std::setw(20) << format_address(symbol.addr)
        << std::right << std::setw(number_width) << format_number(symbol.size) << ' '
        << std::left << std::setw(8) << to_string(symbol.kind)
        << std::setw(10) << symbol.section_id.value_or("-")
        << symbol.name;
    if (symbol.source)
      out << termcolor::blue << "  " << symbol.source->file << ':' << symbol.source->line << termcolor::reset;
    out << '\n';
  }
}

void print_sections(std::ostream& out, const std::vector<Section>& sections, const output_format format)
{
  if (format == output_format::csv) {
    csv::printer csv(out);
    csv << "id" << "name" << "type" << "vma" << "lma" << "size" << "flags" << csv::endrow;

    for(const Section& section : sections) {
      csv << section.id << section.name << section.type << to_hex(section.vma);
      if (section.lma)
        csv << to_hex(*section.lma);
      else
        csv << csv::empty;
      csv << section.size << flags_string(section.flags) << csv::endrow;
    }

    csv << csv::flush;
    return;
  }

  for(const Section& section : sections) {
    out << std::left << std::setw(8) << section.id
        << std::setw(24) << section.name
        << std::setw(14) << section.type
        << std::setw(20) << to_hex(section.vma)
        << std::setw(20) << (section.lma ? to_hex(*section.lma) : std::string("-"))
        << std::right << std::setw(number_width) << section.size << ' '
        << flags_string(section.flags) << '\n';
  }
}
