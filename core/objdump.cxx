#include "objdump.hxx"

#include <regex>
#include <sstream>

#include "utils.hxx"

namespace {

// Idx Name Size VMA LMA File-off Algn
const std::regex section_header_regex(
    R"(^\s*\d+\s+(\S+)\s+([0-9a-fA-F]+)\s+([0-9a-fA-F]+)\s+([0-9a-fA-F]+)\s+([0-9a-fA-F]+)\s+(\S+)\s*$)");

} // anonymous namespace

void parse_objdump_section_headers(std::istream& stream, SectionHeaders& headers)
{
  std::string line;
  while (stream && std::getline(stream, line)) {
    trim(line);
    if (line.empty() || starts_with(line, "Idx") || starts_with(line, "SYMBOL") || starts_with(line, "Sections"))
      continue;

    std::smatch match;
    if (!std::regex_match(line, match, section_header_regex))
      continue;

    SectionHeader header;
    header.name = match[1].str();
    if (!parse_hex(match[2].str(), header.size)
        || !parse_hex(match[3].str(), header.vma)
        || !parse_hex(match[4].str(), header.lma))
      continue;

    headers[header.name] = std::move(header);
  }
}

void apply_load_addresses(std::vector<Section>& sections, const SectionHeaders& headers)
{
  for(Section& section : sections) {
    auto it = headers.find(section.name);
    if (it != headers.end())
      section.lma = it->second.lma;
  }
}

ProcessResult objdump_section_headers(const std::string& executable,
                                      const std::string& file,
                                      SectionHeaders& headers,
                                      const RunOptions& options)
{
  ProcessResult process = run_command(executable, {"-h", file}, options);

  if (!failed(process)) {
    std::istringstream out(process.out);
    parse_objdump_section_headers(out, headers);
  }

  return process;
}
