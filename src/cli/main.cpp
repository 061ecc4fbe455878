#include "pfverify/exceptions.hpp"
#include "pfverify/loader.hpp"
#include "pfverify/log.hpp"
#include "pfverify/policy.hpp"
#include "pfverify/report.hpp"
#include "pfverify/settings.hpp"
#include "pfverify/verifier.hpp"
#include "pfverify/version.hpp"
#include "pfverify/yaml_policy_parser.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace
{

static void print_version(std::ostream& out)
{
    out << "pfverify " << pfverify::VERSION_MAJOR << "." << pfverify::VERSION_MINOR << "."
        << pfverify::VERSION_PATCH << "\n";
}

static int usage(std::ostream& out, int exit_code)
{
    out << "Public-safe skeleton verifier (no cryptography).\n";
    out << "Usage:\n";
    out << "  pfverify --receipt <path> [--policy <path>] [--format markdown|json]\n";
    out << "           [--log-level debug|info|warn|error|off]\n";
    out << "  pfverify --help\n";
    out << "  pfverify --version\n";
    out << "\n";
    out << "Options:\n";
    out << "  --receipt <path>     Path to receipt.json (required)\n";
    out << "  --policy <path>      Path to policy.yml (optional, not enforced)\n";
    out << "  --format <fmt>       Output format: markdown (default) or json\n";
    out << "  --log-level <level>  Diagnostics written to stderr (default: warn)\n";
    out << "\n";
    out << "Exit status: 0 when verification passed, 1 otherwise.\n";
    return exit_code;
}

static int run(const pfverify::Settings& settings)
{
    using namespace pfverify;

    Receipt receipt = [&]
    {
        try
        {
            return load_json(settings.receipt_path);
        }
        catch (const DecodeError& e)
        {
            throw DecodeError(std::string("invalid JSON: ") + e.what());
        }
    }();
    log::info("loaded receipt " + settings.receipt_path);

    std::optional<std::filesystem::path> policy_path;
    if (settings.policy_path)
        policy_path = *settings.policy_path;

    YamlPolicyParser parser;
    try
    {
        // Policy is not enforced yet; loading still rejects a missing or malformed file.
        auto policy = load_policy(policy_path, parser);
        if (policy_path)
            log::info("policy loaded (" + std::to_string(policy.document.size()) +
                      " keys, not enforced)");
    }
    catch (const DecodeError& e)
    {
        throw DecodeError(std::string("invalid policy: ") + e.what());
    }

    auto result = validate(receipt);
    log::info(std::string("verification ") + (result.passed() ? "passed" : "failed") + " with " +
              std::to_string(result.errors.size()) + " error(s)");

    render(std::cout, result, settings.format);
    return result.passed() ? 0 : 1;
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    pfverify::Settings settings;
    try
    {
        settings = pfverify::Settings::from_args(args);
    }
    catch (const pfverify::UsageError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "See: pfverify --help\n";
        return 1;
    }

    if (settings.show_help)
        return usage(std::cout, 0);
    if (settings.show_version)
    {
        print_version(std::cout);
        return 0;
    }

    if (auto lvl = pfverify::log::level_from_string(settings.log_level))
        pfverify::log::set_level(*lvl);

    try
    {
        return run(settings);
    }
    catch (const pfverify::NotFoundError& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
    catch (const pfverify::DecodeError& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
