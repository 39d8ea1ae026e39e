#ifndef TMPLX_READELF_HXX
#define TMPLX_READELF_HXX

#include <iosfwd>
#include <string>
#include <vector>

#include "Section.hxx"
#include "process-utils.hxx"

// Parses the section table printed by "readelf -S -W".
void parse_readelf_sections(std::istream& stream, std::vector<Section>& sections);

SectionFlags parse_section_flags(const std::string& flags);

ProcessResult readelf_sections(const std::string& executable,
                               const std::string& file,
                               std::vector<Section>& sections,
                               const RunOptions& options = {});

#endif // TMPLX_READELF_HXX
