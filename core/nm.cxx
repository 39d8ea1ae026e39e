#include "nm.hxx"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <regex>
#include <sstream>

#include <cxxabi.h>

#include "logger.hxx"
#include "utils.hxx"

namespace {

const std::regex nm_line_regex(R"(^\s*([0-9a-fA-F]+)\s+([0-9a-fA-F]+)\s+(\S)\s+(.+)$)");

const std::regex location_regex(R"(^(.*?):(\d+)(?::\d+)?(?:\s+\(.*\))?$)");

// nm separates the location from the name with a tab, "??:N" when it is unknown.
void split_name_and_location(const std::string& raw, std::string& name, std::optional<SourceLocation>& location)
{
  name = rtrim_copy(raw);

  const std::string::size_type tab = name.rfind('\t');
  if (tab == std::string::npos)
    return;

  const std::string candidate = trim_copy(name.substr(tab + 1));
  if (!starts_with(candidate, "??:")) {
    std::optional<SourceLocation> parsed = parse_source_location(candidate);
    if (!parsed)
      return;
    location = std::move(parsed);
  }

  name = rtrim_copy(name.substr(0, tab));
}

} // anonymous namespace

std::optional<SourceLocation> parse_source_location(const std::string& value)
{
  const std::string trimmed = trim_copy(value);

  std::smatch match;
  if (!std::regex_match(trimmed, match, location_regex))
    return std::nullopt;

  const std::string file = trim_copy(match[1].str());
  long line = 0;
  try {
    line = std::stol(match[2].str());
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }

  if (file.empty() || (file == "??" && line == 0))
    return std::nullopt;

  SourceLocation location;
  location.file = std::filesystem::path(file).lexically_normal().string();
  location.line = line;
  return location;
}

std::string demangle(const std::string& name)
{
  int status = 0;
  std::unique_ptr<char, decltype(&std::free)> dname(abi::__cxa_demangle(name.c_str(), nullptr, nullptr, &status), &std::free);

  if (status == 0 && dname)
    return dname.get();

  return name;
}

void parse_nm_output(std::istream& stream, std::vector<NmSymbol>& symbols)
{
  // Index of the last symbol whose location may be printed on the next line.
  std::optional<size_t> pending_location;

  std::string line;
  while (stream && std::getline(stream, line)) {
    const std::string trimmed = trim_copy(line);
    if (trimmed.empty() || starts_with(trimmed, "Archive ") || trimmed.find(" .debug") != std::string::npos)
      continue;

    std::smatch match;
    if (!std::regex_match(trimmed, match, nm_line_regex)) {
      if (pending_location) {
        std::optional<SourceLocation> location = parse_source_location(trimmed);
        if (location) {
          symbols[*pending_location].source = std::move(location);
          pending_location.reset();
        }
      } else {
        LOG(trace) << "Ignoring nm line: " << trimmed;
      }
      continue;
    }

    const char type = match[3].str().front();
    if (type == 'U' || type == 'u')
      continue;

    NmSymbol symbol;
    if (!parse_hex(match[1].str(), symbol.address) || !parse_hex(match[2].str(), symbol.size)) {
      LOG(debug) << "Invalid address or size in nm line: " << trimmed;
      continue;
    }
    symbol.type = type;

    split_name_and_location(match[4].str(), symbol.raw_name, symbol.source);
    symbol.name = demangle(symbol.raw_name);

    const bool has_location = symbol.source.has_value();
    symbols.emplace_back(std::move(symbol));

    if (has_location)
      pending_location.reset();
    else
      pending_location = symbols.size() - 1;
  }
}

std::vector<std::string> nm_arguments(const std::string& file, const int flags)
{
  std::vector<std::string> args = {"--print-size", "--size-sort", "--numeric-sort"};

  if (flags & nm_options::line_numbers)
    args.emplace_back("--line-numbers");

  args.push_back(file);

  return args;
}

ProcessResult nm(const std::string& executable,
                 const std::string& file,
                 std::vector<NmSymbol>& symbols,
                 const int flags,
                 const RunOptions& options)
{
  ProcessResult process = run_command(executable, nm_arguments(file, flags), options);

  if (!failed(process)) {
    std::istringstream out(process.out);
    parse_nm_output(out, symbols);
  }

  return process;
}
