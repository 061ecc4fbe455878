#pragma once
#include "pfverify/types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace pfverify
{

/// Verification policy. Loaded for forward compatibility; no check reads it yet.
struct Policy
{
    Json document = Json::object();

    bool empty() const
    {
        return document.empty();
    }
};

/// Capability that turns policy text into a mapping.
class PolicyParser
{
  public:
    virtual ~PolicyParser() = default;

    virtual std::string name() const = 0;

    /// Returns the parsed document, of any JSON type. Throws DecodeError on
    /// malformed input.
    virtual Json parse(const std::string& text) const = 0;
};

/// Stands in when no policy format is supported; every policy is empty.
class NullPolicyParser final : public PolicyParser
{
  public:
    std::string name() const override
    {
        return "none";
    }

    Json parse(const std::string&) const override
    {
        return Json::object();
    }
};

/// Empty policy when `path` is unset or the document is not a mapping.
/// Throws NotFoundError when the path is given but missing, DecodeError when
/// the parser rejects the text.
Policy load_policy(const std::optional<std::filesystem::path>& path, const PolicyParser& parser);

} // namespace pfverify
