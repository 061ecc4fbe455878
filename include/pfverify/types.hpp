#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pfverify
{

using Json = nlohmann::json;
/// Insertion-ordered JSON, used where output key order is part of the format.
using OrderedJson = nlohmann::ordered_json;

/// Report rendering selected by --format.
enum class OutputFormat
{
    Markdown, ///< Human-readable heading plus bullet lists
    Json      ///< Single indented JSON object
};

inline std::string to_string(OutputFormat format)
{
    switch (format)
    {
    case OutputFormat::Markdown:
        return "markdown";
    case OutputFormat::Json:
        return "json";
    }
    return "markdown";
}

/// Accepts the canonical names plus the "text" and "structured" aliases.
inline std::optional<OutputFormat> output_format_from_string(const std::string& s)
{
    if (s == "markdown" || s == "text")
        return OutputFormat::Markdown;
    if (s == "json" || s == "structured")
        return OutputFormat::Json;
    return std::nullopt;
}

} // namespace pfverify
