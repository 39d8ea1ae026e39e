#include "template-signature.hxx"

#include <cctype>

#include "utils.hxx"

namespace {

bool can_precede_argument_list(const char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0
      || c == '_' || c == '>' || c == ']' || c == ')';
}

} // anonymous namespace

bool operator==(const TemplateSignature& lhs, const TemplateSignature& rhs)
{
  return lhs.group_name == rhs.group_name && lhs.specialization_key == rhs.specialization_key;
}

std::optional<TemplateSignature> parse_template_signature(const std::string& name)
{
  const std::string::size_type open = name.find('<');
  if (open == std::string::npos)
    return std::nullopt;

  std::string group_name = trim_copy(name.substr(0, open));
  if (group_name.empty() || !can_precede_argument_list(group_name.back()))
    return std::nullopt;

  int depth = 0;
  for(std::string::size_type i = open; i < name.size(); ++i) {
    if (name[i] == '<') {
      ++depth;
    } else if (name[i] == '>') {
      --depth;
      if (depth == 0) {
        std::string arguments = trim_copy(name.substr(open + 1, i - open - 1));

        TemplateSignature signature;
        signature.group_name = std::move(group_name);
        if (!arguments.empty())
          signature.specialization_key = std::move(arguments);
        return signature;
      }
    }
  }

  // Unbalanced
  return std::nullopt;
}
