#include "pfverify/checks.hpp"

#include "pfverify/util/quote.hpp"

namespace pfverify
{

template <size_t N>
static bool starts_with_any(const std::string& value, const std::array<const char*, N>& prefixes)
{
    for (const char* prefix : prefixes)
        if (value.rfind(prefix, 0) == 0)
            return true;
    return false;
}

bool is_placeholder_url(const std::string& value)
{
    return starts_with_any(value, PLACEHOLDER_URL_PREFIXES);
}

bool is_placeholder_kms(const std::string& value)
{
    return starts_with_any(value, PLACEHOLDER_KMS_PREFIXES);
}

std::vector<std::string> missing_fields(const Receipt& receipt)
{
    std::vector<std::string> missing;
    for (const char* key : REQUIRED_FIELDS)
        if (!receipt.has_field(key))
            missing.emplace_back(key);
    return missing;
}

std::vector<std::string> check_placeholders(const Receipt& receipt)
{
    std::vector<std::string> problems;

    if (const auto& trans = receipt.transparency())
    {
        auto url = trans->candidate_url();
        if (url && url->is_string())
        {
            const auto& text = url->get_ref<const std::string&>();
            if (!is_placeholder_url(text))
                problems.push_back("transparency URL must use placeholder domain: " +
                                   util::quote(text));
        }
    }

    const auto& sigs = receipt.signatures();
    for (size_t i = 0; i < sigs.size(); ++i)
    {
        const auto& signer = sigs[i].signer;
        if (!signer.is_string())
            continue;
        const auto& text = signer.get_ref<const std::string&>();
        if (!is_placeholder_kms(text))
            problems.push_back("signatures[" + std::to_string(i) +
                               "].signer must use placeholder KMS: " + util::quote(text));
    }

    return problems;
}

} // namespace pfverify
