#ifndef TMPLX_UTILS_HXX
#define TMPLX_UTILS_HXX

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

bool starts_with(const std::string& str, const std::string& prefix);

void ltrim(std::string &s);

void rtrim(std::string &s);

void trim(std::string &s);

std::string rtrim_copy(std::string s);

std::string trim_copy(std::string s);

std::vector<std::string> split(std::string str, const char delim);

// Splits on any run of blank characters, empty tokens are dropped.
std::vector<std::string> split_ws(const std::string& str);

// Returns false (and leaves value untouched) if str is not entirely made of hex digits.
bool parse_hex(const std::string& str, std::uint64_t& value);

std::string to_hex(std::uint64_t value);

// Prints integral values without a fractional part, "1.5" otherwise.
std::string format_number(double value);

bool is_executable(const std::filesystem::path& path);

std::string which(const std::string& executable, bool &found);

std::filesystem::path create_temporary_directory();

class FileSystemGuard {
private:
  std::filesystem::path mPath;
public:
  explicit FileSystemGuard(const std::filesystem::path& p);
  FileSystemGuard(const FileSystemGuard&) = delete;
  FileSystemGuard& operator=(const FileSystemGuard&) = delete;
  ~FileSystemGuard();

  const std::filesystem::path& path() const;
};

namespace io {

class repeat {
public:
  const std::string& value;
  const size_t n;
  repeat(const std::string& value, size_t n)
    : value(value), n(n) {}
};

std::ostream& operator<<(std::ostream& os, const io::repeat& m);

} // namespace io

#endif // TMPLX_UTILS_HXX
