#ifndef TMPLX_OPTION_VALIDATORS_HXX
#define TMPLX_OPTION_VALIDATORS_HXX

#include <string>
#include <vector>

#include <boost/any.hpp>

#include "logger.hxx"
#include "report.hxx"

// Overloads picked by boost::program_options for enumerated option values.

void validate(boost::any& v,
              const std::vector<std::string>& values,
              output_format* /*target_type*/, int);

void validate(boost::any& v,
              const std::vector<std::string>& values,
              group_order* /*target_type*/, int);

namespace CTXLogger {

void validate(boost::any& v,
              const std::vector<std::string>& values,
              ::CTXLogger::severity_level* /*target_type*/, int);

} // namespace CTXLogger

#endif // TMPLX_OPTION_VALIDATORS_HXX
