#include "pfverify/settings.hpp"

#include "pfverify/exceptions.hpp"
#include "pfverify/log.hpp"

namespace pfverify
{

static bool is_flag(const std::string& s)
{
    return !s.empty() && s[0] == '-';
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

// Accepts both "--flag value" and "--flag=value"; the last occurrence wins.
static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    std::optional<std::string> value;
    const std::string inline_prefix = flag + "=";
    size_t i = 0;
    while (i < args.size())
    {
        if (args[i] == flag)
        {
            if (i + 1 >= args.size() || is_flag(args[i + 1]))
                throw UsageError("argument " + flag + ": expected one argument");
            value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            continue;
        }
        if (args[i].rfind(inline_prefix, 0) == 0)
        {
            value = args[i].substr(inline_prefix.size());
            args.erase(args.begin() + static_cast<long long>(i));
            continue;
        }
        ++i;
    }
    return value;
}

Settings Settings::from_args(const std::vector<std::string>& argv)
{
    Settings s;
    std::vector<std::string> args = argv;

    s.show_help = consume_flag(args, "--help") || consume_flag(args, "-h");
    s.show_version = consume_flag(args, "--version");
    if (s.show_help || s.show_version)
        return s;

    if (auto receipt = consume_flag_value(args, "--receipt"))
        s.receipt_path = *receipt;
    // An empty --policy value means no policy.
    if (auto policy = consume_flag_value(args, "--policy"); policy && !policy->empty())
        s.policy_path = *policy;
    if (auto format = consume_flag_value(args, "--format"))
    {
        auto parsed = output_format_from_string(*format);
        if (!parsed)
            throw UsageError("argument --format: invalid choice: '" + *format +
                             "' (choose from 'markdown', 'json')");
        s.format = *parsed;
    }
    if (auto lvl = consume_flag_value(args, "--log-level"))
    {
        if (!log::level_from_string(*lvl))
            throw UsageError("argument --log-level: invalid choice: '" + *lvl + "'");
        s.log_level = *lvl;
    }

    if (!args.empty())
    {
        std::string rest;
        for (const auto& a : args)
            rest += (rest.empty() ? "" : " ") + a;
        throw UsageError("unrecognized arguments: " + rest);
    }
    if (s.receipt_path.empty())
        throw UsageError("the following arguments are required: --receipt");
    return s;
}

} // namespace pfverify
