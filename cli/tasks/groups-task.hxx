#ifndef TMPLX_GROUPS_TASK_HXX
#define TMPLX_GROUPS_TASK_HXX

#include "analysis-task.hxx"

class Groups_Task : public Analysis_Task {
public:
  boost::program_options::options_description options() override;
  void execute(std::ostream& out) override;
};

#endif // TMPLX_GROUPS_TASK_HXX
