#pragma once
#include "pfverify/policy.hpp"

namespace pfverify
{

/// yaml-cpp backed policy parser. Plain scalars are typed the way a YAML
/// safe loader types them (null, bool, integer, float, string); quoted
/// scalars stay strings.
class YamlPolicyParser final : public PolicyParser
{
  public:
    std::string name() const override
    {
        return "yaml";
    }

    Json parse(const std::string& text) const override;
};

} // namespace pfverify
