#include "pfverify/report.hpp"

namespace pfverify
{

OrderedJson to_json(const ValidationResult& result)
{
    OrderedJson j = OrderedJson::object();
    j["passed"] = result.passed();
    j["errors"] = result.errors;
    j["warnings"] = result.warnings;
    return j;
}

static void render_section(std::ostream& out, const std::string& title,
                           const std::vector<std::string>& items)
{
    if (items.empty())
        return;
    out << "### " << title << "\n";
    for (const auto& item : items)
        out << "- " << item << "\n";
    out << "\n";
}

void render_markdown(std::ostream& out, const ValidationResult& result)
{
    if (result.passed())
        out << "## ✅ OEP-288 Skeleton Verification Passed\n\n";
    else
        out << "## ❌ OEP-288 Skeleton Verification Failed\n\n";

    render_section(out, "Errors", result.errors);
    render_section(out, "Warnings", result.warnings);
}

void render_json(std::ostream& out, const ValidationResult& result)
{
    out << to_json(result).dump(2, ' ', false, OrderedJson::error_handler_t::replace) << "\n";
}

void render(std::ostream& out, const ValidationResult& result, OutputFormat format)
{
    switch (format)
    {
    case OutputFormat::Json:
        render_json(out, result);
        return;
    case OutputFormat::Markdown:
        render_markdown(out, result);
        return;
    }
}

} // namespace pfverify
