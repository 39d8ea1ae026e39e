#include "groups-task.hxx"

#include <iostream>

#include <boost/program_options.hpp>

#include "logger.hxx"
#include "option-validators.hxx"
#include "template-groups.hxx"

namespace bpo = boost::program_options;

boost::program_options::options_description Groups_Task::options()
{
  bpo::options_description opt = Analysis_Task::options();
  opt.add_options()
      ("specializations,s",
       bpo::bool_switch(),
       "Print the specializations of each template.")
      ("templates-only,t",
       bpo::bool_switch(),
       "Do not print non-template symbols.")
      ("sort",
       bpo::value<group_order>()->value_name("order")->default_value(group_order::input, "input"),
       "Group order (input, size, unique-size, name).")
      ("limit",
       bpo::value<size_t>()->value_name("n")->default_value(0),
       "Print at most n groups, 0 for all.")
      ;

  return opt;
}

void Groups_Task::execute(std::ostream& out)
{
  const Analysis analysis = analyse_binary(analysis_options());

  std::vector<TemplateGroupSummary> groups = build_template_groups(analysis.symbols);

  LOG(info) << groups.size() << " groups";

  GroupReportOptions report;
  report.format = format();
  report.order = vm["sort"].as<group_order>();
  report.specializations = vm["specializations"].as<bool>();
  report.non_templates = !vm["templates-only"].as<bool>();
  report.limit = vm["limit"].as<size_t>();

  print_groups(out, sort_groups(std::move(groups), report.order), report);
}
