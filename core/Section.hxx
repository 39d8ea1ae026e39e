#ifndef TMPLX_SECTION_HXX
#define TMPLX_SECTION_HXX

#include <cstdint>
#include <optional>
#include <string>

struct SectionFlags {
  bool alloc = false;
  bool write = false;
  bool exec = false;
  bool tls = false;
};

class Section
{
public:
  std::string id;
  std::string name;
  std::string type;
  std::uint64_t vma = 0;
  std::uint64_t size = 0;
  // Set from objdump, when it differs from vma the section is copied at startup.
  std::optional<std::uint64_t> lma;
  SectionFlags flags;

  bool contains(const std::uint64_t address) const {
    return address >= vma && address - vma < size;
  }

  bool has_distinct_load_address() const {
    return lma.has_value() && *lma != 0 && *lma != vma;
  }
};

// Concatenated readelf flag letters, e.g. "WA" or "AX".
std::string flags_string(const SectionFlags& flags);

#endif // TMPLX_SECTION_HXX
