#include "pfverify/verifier.hpp"

#include "pfverify/checks.hpp"
#include "pfverify/log.hpp"

namespace pfverify
{

static std::string join(const std::vector<std::string>& parts, const std::string& sep)
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
            out += sep;
        out += parts[i];
    }
    return out;
}

ValidationResult validate(const Receipt& receipt)
{
    ValidationResult result;

    auto missing = missing_fields(receipt);
    log::debug("required fields: " + std::to_string(missing.size()) + " missing");
    if (!missing.empty())
        result.errors.push_back("missing required fields: " + join(missing, ", "));

    auto problems = check_placeholders(receipt);
    log::debug("placeholder checks: " + std::to_string(problems.size()) + " problem(s)");
    result.errors.insert(result.errors.end(), problems.begin(), problems.end());

    return result;
}

} // namespace pfverify
