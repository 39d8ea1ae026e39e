#ifndef TMPLX_TOOLCHAIN_HXX
#define TMPLX_TOOLCHAIN_HXX

#include <string>

constexpr const char* default_toolchain_prefix = "arm-none-eabi-";

struct ToolchainOptions {
  std::string prefix = default_toolchain_prefix;
  // Searched first, empty means PATH only.
  std::string directory;
};

class Toolchain {
public:
  std::string nm;
  std::string objdump;
  std::string size;
  std::string readelf;
  std::string strings;
};

/**
 * Resolves every binutils command of the toolchain.
 *
 * For each tool, "<directory>/<prefix><tool>" is used when it is an executable
 * file, then "<directory>/<prefix><tool>.exe". When neither exists, the bare
 * "<prefix><tool>" name is kept and resolved through PATH when spawned.
 */
Toolchain resolve_toolchain(const ToolchainOptions& options);

#endif // TMPLX_TOOLCHAIN_HXX
