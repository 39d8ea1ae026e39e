#ifndef TMPLX_CSVPRINTER_HXX
#define TMPLX_CSVPRINTER_HXX

#include <iostream>
#include <sstream>
#include <string>

namespace csv {

// Strings containing the separator, a quote or a line break are quoted, embedded
// quotes are doubled. Other values are printed as is.
class printer
{
  std::ostream& os_;
  bool is_first_;
  const std::string separator_;
public:
  explicit printer(std::ostream& out, std::string separator = ";")
    : os_(out)
    , is_first_(true)
    , separator_(std::move(separator))
  {
  }

  void flush()
  {
    os_.flush();
  }

  void endrow()
  {
    os_ << '\n';
    is_first_ = true;
  }

  template<typename T>
  printer& write(const T& val)
  {
    if (!is_first_)
      os_ << separator_;
    else
      is_first_ = false;

    os_ << val;
    return *this;
  }

  printer& write_escape(const std::string& val)
  {
    if (val.find_first_of("\"\n\r") == std::string::npos && val.find(separator_) == std::string::npos)
      return write(val);

    std::ostringstream result;
    result << '"';
    for(const char c : val) {
      if (c == '"')
        result << '"';
      result << c;
    }
    result << '"';

    return write(result.str());
  }
};

inline printer& endrow(printer& csv)
{
  csv.endrow();
  return csv;
}

inline printer& flush(printer& csv)
{
  csv.flush();
  return csv;
}

inline printer& empty(printer& csv)
{
  csv.write("");
  return csv;
}

inline printer& operator<<(printer& csv, printer& (* val)(printer&))
{
  return val(csv);
}

inline printer& operator<<(printer& csv, const char * val)
{
  return csv.write_escape(val);
}

inline printer& operator<<(printer& csv, const std::string & val)
{
  return csv.write_escape(val);
}

template<typename T>
printer& operator<<(printer& csv, const T& val)
{
  return csv.write(val);
}

} // namespace csv

#endif // TMPLX_CSVPRINTER_HXX
