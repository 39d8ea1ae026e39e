#ifndef TMPLX_SECTIONS_TASK_HXX
#define TMPLX_SECTIONS_TASK_HXX

#include "analysis-task.hxx"

class Sections_Task : public Analysis_Task {
public:
  void execute(std::ostream& out) override;
};

#endif // TMPLX_SECTIONS_TASK_HXX
