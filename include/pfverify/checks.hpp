#pragma once
#include "pfverify/receipt.hpp"

#include <array>
#include <string>
#include <vector>

namespace pfverify
{

/// Allow-listed transparency/TSA endpoint prefixes.
constexpr std::array<const char*, 3> PLACEHOLDER_URL_PREFIXES = {
    "https://example.invalid",
    "https://rekor.example.invalid",
    "tsa://rfc3161.example.invalid",
};

/// Allow-listed KMS signer prefixes.
constexpr std::array<const char*, 1> PLACEHOLDER_KMS_PREFIXES = {
    "kms+example://",
};

bool is_placeholder_url(const std::string& value);
bool is_placeholder_kms(const std::string& value);

/// Required field names absent from the receipt, in REQUIRED_FIELDS order.
std::vector<std::string> missing_fields(const Receipt& receipt);

/// One message per non-placeholder transparency URL or signer.
/// Non-string values are skipped.
std::vector<std::string> check_placeholders(const Receipt& receipt);

} // namespace pfverify
