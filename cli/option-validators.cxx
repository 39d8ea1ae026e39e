#include "option-validators.hxx"

#include <stdexcept>

#include <boost/program_options.hpp>

namespace bpo = boost::program_options;

void validate(boost::any& v,
              const std::vector<std::string>& values,
              output_format* /*target_type*/, int)
{
  // Make sure no previous assignment to 'v' was made.
  bpo::validators::check_first_occurrence(v);

  const std::string& s = bpo::validators::get_single_string(values);

  if (s == "text")
    v = boost::any(output_format::text);
  else if (s == "csv")
    v = boost::any(output_format::csv);
  else
    throw bpo::invalid_option_value(s);
}

void validate(boost::any& v,
              const std::vector<std::string>& values,
              group_order* /*target_type*/, int)
{
  bpo::validators::check_first_occurrence(v);

  const std::string& s = bpo::validators::get_single_string(values);

  if (s == "input")
    v = boost::any(group_order::input);
  else if (s == "size")
    v = boost::any(group_order::size);
  else if (s == "unique-size")
    v = boost::any(group_order::unique_size);
  else if (s == "name")
    v = boost::any(group_order::name);
  else
    throw bpo::invalid_option_value(s);
}

namespace CTXLogger {

void validate(boost::any& v,
              const std::vector<std::string>& values,
              ::CTXLogger::severity_level* /*target_type*/, int)
{
  bpo::validators::check_first_occurrence(v);

  const std::string& s = bpo::validators::get_single_string(values);

  try {
    v = boost::any(parse_severity_level(s));
  } catch (const std::invalid_argument&) {
    throw bpo::invalid_option_value(s);
  }
}

} // namespace CTXLogger
