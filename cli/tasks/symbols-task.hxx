#ifndef TMPLX_SYMBOLS_TASK_HXX
#define TMPLX_SYMBOLS_TASK_HXX

#include "analysis-task.hxx"

class Symbols_Task : public Analysis_Task {
public:
  void execute(std::ostream& out) override;
};

#endif // TMPLX_SYMBOLS_TASK_HXX
