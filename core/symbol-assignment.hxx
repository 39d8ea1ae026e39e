#ifndef TMPLX_SYMBOL_ASSIGNMENT_HXX
#define TMPLX_SYMBOL_ASSIGNMENT_HXX

#include <string>
#include <vector>

#include "Section.hxx"
#include "Symbol.hxx"
#include "nm.hxx"

SymbolKind classify_symbol_kind(char type);

inline bool is_weak_symbol_type(const char type) { return type == 'w' || type == 'W' || type == 'v' || type == 'V'; }

struct SymbolAssignment {
  std::vector<Symbol> symbols;
  // One per symbol outside of every section.
  std::vector<std::string> warnings;
};

/**
 * Turns nm symbols into located symbols.
 *
 * Each symbol is attached to the first allocated section containing its address. Its
 * runtime location is its address, sections copied from flash at startup
 * also give it a load location.
 *
 * Entries sharing address, size and name (e.g. an alias printed twice) are
 * merged into the first one.
 */
SymbolAssignment assign_symbols_to_sections(const std::vector<NmSymbol>& nm_symbols,
                                            const std::vector<Section>& sections);

#endif // TMPLX_SYMBOL_ASSIGNMENT_HXX
