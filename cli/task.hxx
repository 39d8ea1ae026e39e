#ifndef TMPLX_TASK_HXX
#define TMPLX_TASK_HXX

#include <iosfwd>
#include <string>
#include <vector>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>

class Task
{
protected:
  boost::program_options::variables_map vm;

public:
  virtual ~Task() = default;

  virtual boost::program_options::options_description options() = 0;

  // Options given on the command line take precedence over the ones from config_file.
  void parse_args(const std::vector<std::string>& args, const std::string& config_file = {});

  virtual void execute(std::ostream& out) = 0;

protected:
  virtual boost::program_options::positional_options_description positional_options();

  virtual void check_args() {}
};

#endif // TMPLX_TASK_HXX
