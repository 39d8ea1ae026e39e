#include "readelf.hxx"

#include <regex>
#include <sstream>

#include "logger.hxx"
#include "utils.hxx"

namespace {

const std::regex section_index_regex(R"(^\[\s*(\d+)\])");

// [Nr] Name Type Address Off Size ES [Flg] Lk Inf Al
bool parse_section_line(const std::string& line, Section& section)
{
  std::smatch match;
  if (!std::regex_search(line, match, section_index_regex))
    return false;

  const std::vector<std::string> parts = split_ws(line.substr(match.length(0)));
  if (parts.size() < 7)
    return false;

  // Flags are optional, Lk Inf Al are not.
  const size_t rest = parts.size() - 6;
  if (rest < 3)
    return false;

  std::uint64_t vma = 0, size = 0, offset = 0;
  if (!parse_hex(parts[2], vma) || !parse_hex(parts[3], offset) || !parse_hex(parts[4], size))
    return false;

  section.id = "sec_" + match[1].str();
  section.name = parts[0];
  section.type = parts[1];
  section.vma = vma;
  section.size = size;
  section.flags = parse_section_flags(rest == 4 ? parts[6] : std::string());

  return true;
}

} // anonymous namespace

SectionFlags parse_section_flags(const std::string& flags)
{
  SectionFlags f;
  f.alloc = flags.find('A') != std::string::npos;
  f.exec  = flags.find('X') != std::string::npos;
  f.write = flags.find('W') != std::string::npos;
  f.tls   = flags.find('T') != std::string::npos;
  return f;
}

void parse_readelf_sections(std::istream& stream, std::vector<Section>& sections)
{
  std::string line;
  while (stream && std::getline(stream, line)) {
    trim(line);
    if (!starts_with(line, "["))
      continue;

    Section section;
    if (parse_section_line(line, section)) {
      sections.emplace_back(std::move(section));
    } else {
      LOG(trace) << "Ignoring readelf line: " << line;
    }
  }
}

ProcessResult readelf_sections(const std::string& executable,
                               const std::string& file,
                               std::vector<Section>& sections,
                               const RunOptions& options)
{
  ProcessResult process = run_command(executable, {"-S", "-W", file}, options);

  if (!failed(process)) {
    std::istringstream out(process.out);
    parse_readelf_sections(out, sections);
  }

  return process;
}
