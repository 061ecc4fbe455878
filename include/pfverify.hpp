#pragma once

/// @file pfverify.hpp
/// @brief Main header for pfverify - includes the loader, checks and reporter
///
/// Usage:
/// @code
/// #include <pfverify.hpp>
///
/// int main() {
///     auto receipt = pfverify::load_json("receipt.json");
///     auto result = pfverify::validate(receipt);
///     pfverify::render(std::cout, result, pfverify::OutputFormat::Json);
///     return result.passed() ? 0 : 1;
/// }
/// @endcode

// Core types and exceptions
#include "pfverify/types.hpp"
#include "pfverify/exceptions.hpp"
#include "pfverify/settings.hpp"
#include "pfverify/log.hpp"

// Documents
#include "pfverify/receipt.hpp"
#include "pfverify/loader.hpp"
#include "pfverify/policy.hpp"
#include "pfverify/yaml_policy_parser.hpp"

// Checks and reporting
#include "pfverify/checks.hpp"
#include "pfverify/report.hpp"
#include "pfverify/verifier.hpp"
