#include "Section.hxx"

std::string flags_string(const SectionFlags& flags) {
  std::string s;
  if (flags.write) s += 'W';
  if (flags.alloc) s += 'A';
  if (flags.exec) s += 'X';
  if (flags.tls) s += 'T';
  return s;
}
