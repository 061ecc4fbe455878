#pragma once
#include "pfverify/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pfverify
{

struct Settings
{
    std::string receipt_path;
    std::optional<std::string> policy_path;
    OutputFormat format{OutputFormat::Markdown};
    std::string log_level{"WARN"};
    bool show_help{false};
    bool show_version{false};

    /// Parses command-line arguments (without argv[0]).
    /// Throws UsageError on unknown flags, missing values or a missing --receipt.
    static Settings from_args(const std::vector<std::string>& args);
};

} // namespace pfverify
