#include "pfverify/policy.hpp"

#include "pfverify/loader.hpp"
#include "pfverify/log.hpp"

#include <utility>

namespace pfverify
{

Policy load_policy(const std::optional<std::filesystem::path>& path, const PolicyParser& parser)
{
    Policy policy;
    if (!path)
        return policy;

    const auto text = read_text(*path, "policy");
    auto document = parser.parse(text);
    if (!document.is_object())
    {
        log::debug("policy " + path->string() + " is not a mapping (" + document.type_name() +
                   "); using an empty policy");
        return policy;
    }
    policy.document = std::move(document);

    log::debug("loaded policy " + path->string() + " with " + parser.name() + " parser (" +
               std::to_string(policy.document.size()) + " keys)");
    return policy;
}

} // namespace pfverify
