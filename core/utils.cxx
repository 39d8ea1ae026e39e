#include "utils.hxx"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <stdlib.h> // mkdtemp()

namespace fs = std::filesystem;

bool starts_with(const std::string& str, const std::string& prefix) {
  if (str.length() >= prefix.length()) {
    return (0 == str.compare(0, prefix.length(), prefix));
  } else {
    return false;
  }
}

void ltrim(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); }));
}

void rtrim(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); }).base(), s.end());
}

void trim(std::string &s) {
  ltrim(s);
  rtrim(s);
}

std::string rtrim_copy(std::string s) {
  rtrim(s);
  return s;
}

std::string trim_copy(std::string s) {
  trim(s);
  return s;
}

std::vector<std::string> split(std::string str, const char delim) {
  std::vector<std::string> tokens;

  size_t pos = 0;
  while ((pos = str.find(delim)) != std::string::npos) {
      tokens.emplace_back(str.substr(0, pos));
      str.erase(0, pos + 1);
  }
  tokens.emplace_back(std::move(str));

  return tokens;
}

std::vector<std::string> split_ws(const std::string& str) {
  std::vector<std::string> tokens;
  std::istringstream ss(str);
  for(std::string token; ss >> token; )
    tokens.emplace_back(std::move(token));
  return tokens;
}

bool parse_hex(const std::string& str, std::uint64_t& value) {
  if (str.empty() || str.size() > 16)
    return false;
  if (!std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isxdigit(c); }))
    return false;

  value = std::stoull(str, nullptr, 16);
  return true;
}

std::string to_hex(std::uint64_t value) {
  std::ostringstream ss;
  ss << "0x" << std::hex << value;
  return ss.str();
}

std::string format_number(double value) {
  std::ostringstream ss;
  if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e18)
    ss << static_cast<long long>(value);
  else
    ss << std::setprecision(17) << value;
  return ss.str();
}

bool is_executable(const fs::path& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return false;

  const fs::perms perms = fs::status(path, ec).permissions();
  if (ec)
    return false;

  return (perms & (fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec)) != fs::perms::none;
}

std::string which(const std::string& executable, bool &found)
{
  if (executable.find('/') != std::string::npos) {
    found = is_executable(executable);
    return executable;
  }

  found = false;

  const char* env_path = std::getenv("PATH");
  if (!env_path)
    return {};

  const std::vector<std::string> paths = split(env_path, ':');
  for(fs::path path : paths) {
    if(path.native().empty())
      path = ".";

    auto candidate = path / executable;
    if (is_executable(candidate)) {
      found = true;
      return candidate;
    }
  }

  return {};
}

fs::path create_temporary_directory()
{
  const fs::path path = fs::temp_directory_path() / "tmplxplore-XXXXXX";

  std::string tmp = path.string();
  if (mkdtemp(tmp.data())) {
    return fs::path(tmp);
  }

  throw std::runtime_error(std::string("Unable to create a temporary directory: ") + std::strerror(errno));
}

FileSystemGuard::FileSystemGuard(const std::filesystem::path& p) : mPath(p) {}

FileSystemGuard::~FileSystemGuard() {
  std::error_code ec;
  std::filesystem::remove_all(mPath, ec);
}

const std::filesystem::path& FileSystemGuard::path() const { return mPath; }

namespace io {

std::ostream& operator<<(std::ostream& os, const io::repeat& m)
{
  for(size_t i = m.n; i > 0; --i)
    os << m.value;
  return os;
}

} // namespace io
