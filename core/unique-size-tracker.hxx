#ifndef TMPLX_UNIQUE_SIZE_TRACKER_HXX
#define TMPLX_UNIQUE_SIZE_TRACKER_HXX

#include <map>
#include <string>

class Symbol;

/**
 * Sums sizes once per location.
 *
 * Aliases of the same memory (same section and address) may be reported
 * with different sizes, the largest one is kept.
 */
class UniqueSizeTracker
{
private:
  std::map<std::string, double> mSizes;

public:
  void add(const std::string& location_key, double size);

  double total() const;

  size_t locations() const { return mSizes.size(); }
};

constexpr const char* unknown_section_key = "unknown-section";
constexpr const char* unknown_address_key = "unknown-addr";

// "<section id>:<address>", the primary location address is preferred.
std::string location_key(const Symbol& symbol);

#endif // TMPLX_UNIQUE_SIZE_TRACKER_HXX
