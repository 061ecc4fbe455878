#pragma once
#include "pfverify/types.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace pfverify
{

/// Outcome of one validation run. `passed()` is derived from `errors`, so
/// warnings never change it.
struct ValidationResult
{
    std::vector<std::string> errors;
    std::vector<std::string> warnings; ///< Reserved; no check emits warnings yet

    bool passed() const
    {
        return errors.empty();
    }
};

/// {"passed", "errors", "warnings"} in that key order.
OrderedJson to_json(const ValidationResult& result);

void render_markdown(std::ostream& out, const ValidationResult& result);

/// Two-space indented JSON, non-ASCII left unescaped, trailing newline.
void render_json(std::ostream& out, const ValidationResult& result);

void render(std::ostream& out, const ValidationResult& result, OutputFormat format);

} // namespace pfverify
