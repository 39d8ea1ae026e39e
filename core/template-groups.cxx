#include "template-groups.hxx"

#include <cmath>
#include <limits>
#include <map>

#include "template-signature.hxx"
#include "unique-size-tracker.hxx"

namespace {

struct SpecializationAccumulator {
  std::optional<std::string> key;
  std::vector<TemplateGroupSymbolSummary> symbols;
  UniqueSizeTracker unique_sizes;
};

struct GroupAccumulator {
  std::string id;
  std::string display_name;
  bool is_template = false;
  std::vector<TemplateGroupSymbolSummary> symbols;
  std::vector<SpecializationAccumulator> specializations;
  std::map<std::optional<std::string>, size_t> specialization_index;
  UniqueSizeTracker unique_sizes;
  double largest_symbol_size = 0.0;
  double smallest_symbol_size = std::numeric_limits<double>::infinity();

  SpecializationAccumulator& specialization(const std::optional<std::string>& key) {
    auto it = specialization_index.find(key);
    if (it == specialization_index.end()) {
      it = specialization_index.emplace(key, specializations.size()).first;
      specializations.emplace_back().key = key;
    }
    return specializations[it->second];
  }
};

TemplateGroupSymbolSummary make_symbol_summary(const Symbol& symbol,
                                               const std::optional<std::string>& specialization_key)
{
  TemplateGroupSymbolSummary summary;
  summary.symbol_id = symbol.id;
  summary.name = symbol.name;
  if (symbol.mangled_name && !symbol.mangled_name->empty())
    summary.mangled_name = symbol.mangled_name;
  summary.size_bytes = std::isfinite(symbol.size) ? symbol.size : 0.0;
  summary.specialization_key = specialization_key;
  summary.section_id = symbol.section_id;
  summary.block_id = symbol.block_id;
  summary.window_id = symbol.window_id;
  summary.addr = symbol.addr;
  summary.primary_location = symbol.primary_location;
  return summary;
}

double sum_sizes(const std::vector<TemplateGroupSymbolSummary>& symbols)
{
  double sum = 0.0;
  for(const TemplateGroupSymbolSummary& s : symbols)
    sum += s.size_bytes;
  return sum;
}

TemplateGroupSpecializationSummary finalize(SpecializationAccumulator&& acc)
{
  TemplateGroupSpecializationSummary summary;
  summary.key = std::move(acc.key);
  summary.totals.symbol_count = acc.symbols.size();
  summary.totals.size_bytes = sum_sizes(acc.symbols);
  summary.totals.unique_size_bytes = acc.unique_sizes.total();
  summary.symbols = std::move(acc.symbols);
  return summary;
}

TemplateGroupSummary finalize(GroupAccumulator&& acc)
{
  TemplateGroupSummary summary;
  summary.id = std::move(acc.id);
  summary.display_name = std::move(acc.display_name);
  summary.is_template = acc.is_template;

  summary.specializations.reserve(acc.specializations.size());
  for(SpecializationAccumulator& specialization : acc.specializations)
    summary.specializations.emplace_back(finalize(std::move(specialization)));

  summary.totals.symbol_count = acc.symbols.size();
  summary.totals.specialization_count = summary.specializations.size();
  summary.totals.size_bytes = sum_sizes(acc.symbols);
  summary.totals.unique_size_bytes = acc.unique_sizes.total();
  summary.totals.largest_symbol_size_bytes = acc.largest_symbol_size;
  summary.totals.smallest_symbol_size_bytes = std::isfinite(acc.smallest_symbol_size) ? acc.smallest_symbol_size : 0.0;

  summary.symbols = std::move(acc.symbols);
  return summary;
}

bool same_number(const double lhs, const double rhs)
{
  if (std::isnan(lhs) || std::isnan(rhs))
    return std::isnan(lhs) && std::isnan(rhs);
  return lhs == rhs;
}

} // anonymous namespace

std::vector<TemplateGroupSummary> build_template_groups(const std::vector<Symbol>& symbols)
{
  std::vector<GroupAccumulator> groups;
  std::map<std::string, size_t> group_index;

  for(const Symbol& symbol : symbols) {
    const std::optional<TemplateSignature> signature = parse_template_signature(symbol.name);
    const bool is_template = signature.has_value();

    const std::string group_id = is_template
        ? signature->group_name
        : std::string(non_template_group_prefix) + " " + symbol.name;
    const std::optional<std::string> specialization_key = is_template ? signature->specialization_key : std::nullopt;

    auto it = group_index.find(group_id);
    if (it == group_index.end()) {
      it = group_index.emplace(group_id, groups.size()).first;

      GroupAccumulator& created = groups.emplace_back();
      created.id = group_id;
      created.display_name = is_template ? signature->group_name : symbol.name;
      created.is_template = is_template;
    }
    GroupAccumulator& group = groups[it->second];

    const TemplateGroupSymbolSummary summary = make_symbol_summary(symbol, specialization_key);
    const std::string key = location_key(symbol);

    group.symbols.push_back(summary);
    group.unique_sizes.add(key, summary.size_bytes);
    if (summary.size_bytes > group.largest_symbol_size)
      group.largest_symbol_size = summary.size_bytes;
    if (summary.size_bytes < group.smallest_symbol_size)
      group.smallest_symbol_size = summary.size_bytes;

    SpecializationAccumulator& specialization = group.specialization(specialization_key);
    specialization.symbols.push_back(summary);
    specialization.unique_sizes.add(key, summary.size_bytes);
  }

  std::vector<TemplateGroupSummary> summaries;
  summaries.reserve(groups.size());
  for(GroupAccumulator& group : groups)
    summaries.emplace_back(finalize(std::move(group)));

  return summaries;
}

bool operator==(const TemplateGroupSymbolSummary& lhs, const TemplateGroupSymbolSummary& rhs)
{
  return lhs.symbol_id == rhs.symbol_id
      && lhs.name == rhs.name
      && lhs.mangled_name == rhs.mangled_name
      && lhs.size_bytes == rhs.size_bytes
      && lhs.specialization_key == rhs.specialization_key
      && lhs.section_id == rhs.section_id
      && lhs.block_id == rhs.block_id
      && lhs.window_id == rhs.window_id
      && same_number(lhs.addr, rhs.addr)
      && lhs.primary_location == rhs.primary_location;
}

bool operator==(const TemplateGroupSpecializationTotals& lhs, const TemplateGroupSpecializationTotals& rhs)
{
  return lhs.symbol_count == rhs.symbol_count
      && lhs.size_bytes == rhs.size_bytes
      && lhs.unique_size_bytes == rhs.unique_size_bytes;
}

bool operator==(const TemplateGroupSpecializationSummary& lhs, const TemplateGroupSpecializationSummary& rhs)
{
  return lhs.key == rhs.key
      && lhs.symbols == rhs.symbols
      && lhs.totals == rhs.totals;
}

bool operator==(const TemplateGroupTotals& lhs, const TemplateGroupTotals& rhs)
{
  return lhs.symbol_count == rhs.symbol_count
      && lhs.specialization_count == rhs.specialization_count
      && lhs.size_bytes == rhs.size_bytes
      && lhs.unique_size_bytes == rhs.unique_size_bytes
      && lhs.largest_symbol_size_bytes == rhs.largest_symbol_size_bytes
      && lhs.smallest_symbol_size_bytes == rhs.smallest_symbol_size_bytes;
}

bool operator==(const TemplateGroupSummary& lhs, const TemplateGroupSummary& rhs)
{
  return lhs.id == rhs.id
      && lhs.display_name == rhs.display_name
      && lhs.is_template == rhs.is_template
      && lhs.symbols == rhs.symbols
      && lhs.specializations == rhs.specializations
      && lhs.totals == rhs.totals;
}
