#ifndef TMPLX_TEMPLATE_SIGNATURE_HXX
#define TMPLX_TEMPLATE_SIGNATURE_HXX

#include <optional>
#include <string>

struct TemplateSignature {
  std::string group_name;
  // Empty when the argument list is empty.
  std::optional<std::string> specialization_key;
};

bool operator==(const TemplateSignature& lhs, const TemplateSignature& rhs);

/**
 * Splits a demangled name into its template family and argument list.
 *
 * "Foo<Bar<Baz>>::run()" gives {"Foo", "Bar<Baz>"}. Names without a
 * balanced argument list, or whose text before the first '<' does not end
 * like a template name (as in "a ,<b>"), are not templates. Blanks before
 * the '<' are ignored.
 */
std::optional<TemplateSignature> parse_template_signature(const std::string& name);

#endif // TMPLX_TEMPLATE_SIGNATURE_HXX
