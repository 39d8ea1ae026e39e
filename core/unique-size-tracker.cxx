#include "unique-size-tracker.hxx"

#include <cmath>

#include "Symbol.hxx"
#include "utils.hxx"

void UniqueSizeTracker::add(const std::string& location_key, const double size)
{
  auto it = mSizes.find(location_key);
  if (it == mSizes.end())
    mSizes.emplace(location_key, size);
  else if (size > it->second)
    it->second = size;
}

double UniqueSizeTracker::total() const
{
  double sum = 0.0;
  for(const auto& entry : mSizes)
    sum += entry.second;
  return sum;
}

std::string location_key(const Symbol& symbol)
{
  const double addr = symbol.primary_location ? symbol.primary_location->addr : symbol.addr;

  std::string key = symbol.section_id.value_or(unknown_section_key);
  key += ':';
  key += std::isfinite(addr) ? format_number(addr) : unknown_address_key;
  return key;
}
