#include "Symbol.hxx"

#include <cmath>

namespace {

// NaN addresses compare equal, they all mean "unknown".
bool same_address(const double lhs, const double rhs) {
  if (std::isnan(lhs) || std::isnan(rhs))
    return std::isnan(lhs) && std::isnan(rhs);
  return lhs == rhs;
}

} // anonymous namespace

const char* to_string(const SymbolKind kind) {
  switch (kind) {
  case SymbolKind::func: return "func";
  case SymbolKind::object: return "object";
  case SymbolKind::section: return "section";
  case SymbolKind::file: return "file";
  case SymbolKind::other: return "other";
  }
  return "other";
}

const char* to_string(const AddressKind kind) {
  switch (kind) {
  case AddressKind::runtime: return "runtime";
  case AddressKind::load: return "load";
  case AddressKind::exec: return "exec";
  }
  return "runtime";
}

bool operator==(const SourceLocation& lhs, const SourceLocation& rhs) {
  return lhs.file == rhs.file && lhs.line == rhs.line;
}

bool operator!=(const SourceLocation& lhs, const SourceLocation& rhs) {
  return !(lhs == rhs);
}

bool operator==(const SymbolLocation& lhs, const SymbolLocation& rhs) {
  return lhs.window_id == rhs.window_id
      && lhs.block_id == rhs.block_id
      && lhs.address_type == rhs.address_type
      && same_address(lhs.addr, rhs.addr);
}

bool operator!=(const SymbolLocation& lhs, const SymbolLocation& rhs) {
  return !(lhs == rhs);
}
