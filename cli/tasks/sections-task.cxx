#include "sections-task.hxx"

void Sections_Task::execute(std::ostream& out)
{
  const Analysis analysis = analyse_binary(analysis_options());

  print_sections(out, analysis.sections, format());
}
