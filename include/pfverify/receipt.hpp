#pragma once
#include "pfverify/types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pfverify
{

/// Top-level keys every receipt must carry, in canonical report order.
constexpr std::array<const char*, 10> REQUIRED_FIELDS = {
    "id",  "ts",  "subject",      "input_hash", "output_hash",
    "env", "merkle", "tsa", "transparency", "signatures",
};

/// Typed view of the optional `transparency` block.
/// Values are kept as raw JSON since any type is tolerated.
struct TransparencyBlock
{
    std::optional<Json> rekor_url;
    std::optional<Json> mirror_urls;

    /// rekor_url when truthy, else mirror_urls[0] when that is a non-empty array.
    std::optional<Json> candidate_url() const;
};

/// One element of `signatures`.
struct SignatureEntry
{
    /// Defaults to "" when the entry has no `signer` key.
    Json signer = "";
};

/// A receipt document: the verbatim JSON object plus typed views of the
/// nested blocks the placeholder checks read.
class Receipt
{
  public:
    /// Throws DecodeError when `document` is not a JSON object.
    static Receipt from_json(Json document);

    const Json& document() const
    {
        return document_;
    }

    bool has_field(const std::string& name) const;

    const std::optional<TransparencyBlock>& transparency() const
    {
        return transparency_;
    }

    const std::vector<SignatureEntry>& signatures() const
    {
        return signatures_;
    }

  private:
    Receipt() = default;

    Json document_;
    std::optional<TransparencyBlock> transparency_;
    std::vector<SignatureEntry> signatures_;
};

/// JSON truthiness: false for null, false, zero, and empty strings, arrays and objects.
bool is_truthy(const Json& value);

} // namespace pfverify
