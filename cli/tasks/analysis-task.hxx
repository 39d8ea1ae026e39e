#ifndef TMPLX_ANALYSIS_TASK_HXX
#define TMPLX_ANALYSIS_TASK_HXX

#include "task.hxx"

#include "analysis.hxx"
#include "report.hxx"

// Base of the tasks working on the sections and symbols of one binary.
class Analysis_Task : public Task {
public:
  boost::program_options::options_description options() override;

protected:
  boost::program_options::positional_options_description positional_options() override;

  void check_args() override;

  AnalysisOptions analysis_options() const;

  output_format format() const;
};

#endif // TMPLX_ANALYSIS_TASK_HXX
