#pragma once
#include "pfverify/receipt.hpp"
#include "pfverify/report.hpp"

namespace pfverify
{

/// Runs the field-presence and placeholder checks. Missing fields collapse
/// into a single "missing required fields: a, b" error; each placeholder
/// problem is its own error.
ValidationResult validate(const Receipt& receipt);

} // namespace pfverify
