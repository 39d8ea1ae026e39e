#include "symbols-task.hxx"

void Symbols_Task::execute(std::ostream& out)
{
  const Analysis analysis = analyse_binary(analysis_options());

  print_symbols(out, analysis.symbols, format());
}
