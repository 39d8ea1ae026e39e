#ifndef TMPLX_OBJDUMP_HXX
#define TMPLX_OBJDUMP_HXX

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "Section.hxx"
#include "process-utils.hxx"

struct SectionHeader {
  std::string name;
  std::uint64_t size = 0;
  std::uint64_t vma = 0;
  std::uint64_t lma = 0;
};

using SectionHeaders = std::map<std::string, SectionHeader>;

// Parses the section headers printed by "objdump -h".
void parse_objdump_section_headers(std::istream& stream, SectionHeaders& headers);

// Sets the load address of every section found in headers.
void apply_load_addresses(std::vector<Section>& sections, const SectionHeaders& headers);

ProcessResult objdump_section_headers(const std::string& executable,
                                      const std::string& file,
                                      SectionHeaders& headers,
                                      const RunOptions& options = {});

#endif // TMPLX_OBJDUMP_HXX
