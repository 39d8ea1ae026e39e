#include "toolchain.hxx"

#include <filesystem>

#include "logger.hxx"
#include "utils.hxx"

namespace fs = std::filesystem;

namespace {

std::string resolve_command(const std::string& command, const std::string& directory)
{
  if (!directory.empty()) {
    const fs::path candidate = fs::path(directory) / command;
    if (is_executable(candidate))
      return candidate.string();

    const fs::path exe_candidate = fs::path(directory) / (command + ".exe");
    if (is_executable(exe_candidate))
      return exe_candidate.string();

    LOG(debug) << command << " not found in " << directory << ", falling back to PATH";
  }

  return command;
}

} // anonymous namespace

Toolchain resolve_toolchain(const ToolchainOptions& options)
{
  LOG_CTX() << "Resolving toolchain " << termcolor::blue << options.prefix << termcolor::reset;

  Toolchain toolchain;
  toolchain.nm      = resolve_command(options.prefix + "nm", options.directory);
  toolchain.objdump = resolve_command(options.prefix + "objdump", options.directory);
  toolchain.size    = resolve_command(options.prefix + "size", options.directory);
  toolchain.readelf = resolve_command(options.prefix + "readelf", options.directory);
  toolchain.strings = resolve_command(options.prefix + "strings", options.directory);

  LOG(debug) << "nm: " << toolchain.nm;
  LOG(debug) << "objdump: " << toolchain.objdump;
  LOG(debug) << "size: " << toolchain.size;
  LOG(debug) << "readelf: " << toolchain.readelf;
  LOG(debug) << "strings: " << toolchain.strings;

  return toolchain;
}
