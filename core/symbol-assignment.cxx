#include "symbol-assignment.hxx"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

#include "utils.hxx"

namespace {

const Section* find_section(const std::vector<Section>& sections, const std::uint64_t address)
{
  auto it = std::find_if(sections.begin(), sections.end(),
                         [address](const Section& section) { return section.flags.alloc && section.contains(address); });
  return it == sections.end() ? nullptr : &(*it);
}

std::vector<SymbolLocation> symbol_locations(const NmSymbol& symbol, const Section& section)
{
  std::vector<SymbolLocation> locations;

  SymbolLocation runtime;
  runtime.address_type = AddressKind::runtime;
  runtime.addr = static_cast<double>(symbol.address);
  locations.push_back(runtime);

  if (section.has_distinct_load_address()) {
    SymbolLocation load;
    load.address_type = AddressKind::load;
    load.addr = static_cast<double>(*section.lma + (symbol.address - section.vma));
    locations.push_back(load);
  }

  return locations;
}

Symbol make_symbol(const NmSymbol& nm_symbol, const size_t index, const Section* section)
{
  Symbol symbol;
  symbol.id = "sym_" + std::to_string(index);
  symbol.name = nm_symbol.name;
  if (nm_symbol.raw_name != nm_symbol.name)
    symbol.mangled_name = nm_symbol.raw_name;
  symbol.kind = classify_symbol_kind(nm_symbol.type);
  symbol.addr = static_cast<double>(nm_symbol.address);
  symbol.size = static_cast<double>(nm_symbol.size);
  symbol.weak = is_weak_symbol_type(nm_symbol.type);
  symbol.local = std::islower(static_cast<unsigned char>(nm_symbol.type)) != 0;
  symbol.source = nm_symbol.source;

  if (section) {
    symbol.section_id = section->id;
    symbol.locations = symbol_locations(nm_symbol, *section);
    symbol.primary_location = symbol.locations.front();
  }

  return symbol;
}

void merge_locations(std::vector<SymbolLocation>& into, const std::vector<SymbolLocation>& from)
{
  for(const SymbolLocation& location : from) {
    if (std::find(into.begin(), into.end(), location) == into.end())
      into.push_back(location);
  }
}

void merge_into(Symbol& existing, const Symbol& duplicate)
{
  existing.weak |= duplicate.weak;
  existing.local |= duplicate.local;

  if (duplicate.mangled_name && duplicate.mangled_name != existing.mangled_name
      && std::find(existing.aliases.begin(), existing.aliases.end(), *duplicate.mangled_name) == existing.aliases.end())
    existing.aliases.push_back(*duplicate.mangled_name);

  if (!existing.primary_location && duplicate.primary_location)
    existing.primary_location = duplicate.primary_location;

  merge_locations(existing.locations, duplicate.locations);

  if (!existing.source && duplicate.source)
    existing.source = duplicate.source;
}

std::string duplicate_key(const NmSymbol& symbol)
{
  std::ostringstream ss;
  ss << symbol.address << ':' << symbol.size << ':' << symbol.name;
  return ss.str();
}

} // anonymous namespace

SymbolKind classify_symbol_kind(const char type)
{
  switch (std::toupper(static_cast<unsigned char>(type))) {
  case 'T':
  case 'W':
    return SymbolKind::func;
  case 'D':
  case 'B':
  case 'R':
  case 'G':
  case 'S':
  case 'V':
    return SymbolKind::object;
  case 'N':
    return SymbolKind::section;
  default:
    return SymbolKind::other;
  }
}

SymbolAssignment assign_symbols_to_sections(const std::vector<NmSymbol>& nm_symbols,
                                            const std::vector<Section>& sections)
{
  SymbolAssignment result;
  std::map<std::string, size_t> seen;

  for(size_t i = 0; i < nm_symbols.size(); ++i) {
    const NmSymbol& nm_symbol = nm_symbols[i];

    const Section* section = find_section(sections, nm_symbol.address);
    if (!section) {
      result.warnings.emplace_back("Symbol " + nm_symbol.name + " at " + to_hex(nm_symbol.address)
                                   + " does not fall within any known section.");
    }

    Symbol symbol = make_symbol(nm_symbol, i, section);

    auto inserted = seen.emplace(duplicate_key(nm_symbol), result.symbols.size());
    if (inserted.second)
      result.symbols.emplace_back(std::move(symbol));
    else
      merge_into(result.symbols[inserted.first->second], symbol);
  }

  return result;
}
