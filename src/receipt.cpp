#include "pfverify/receipt.hpp"

#include "pfverify/exceptions.hpp"

#include <cstdint>
#include <utility>

namespace pfverify
{

bool is_truthy(const Json& value)
{
    switch (value.type())
    {
    case Json::value_t::null:
    case Json::value_t::discarded:
        return false;
    case Json::value_t::boolean:
        return value.get<bool>();
    case Json::value_t::number_integer:
        return value.get<std::int64_t>() != 0;
    case Json::value_t::number_unsigned:
        return value.get<std::uint64_t>() != 0;
    case Json::value_t::number_float:
        return value.get<double>() != 0.0;
    case Json::value_t::string:
        return !value.get_ref<const std::string&>().empty();
    case Json::value_t::array:
    case Json::value_t::object:
    case Json::value_t::binary:
        return !value.empty();
    }
    return false;
}

std::optional<Json> TransparencyBlock::candidate_url() const
{
    if (rekor_url && is_truthy(*rekor_url))
        return *rekor_url;
    if (mirror_urls && mirror_urls->is_array() && !mirror_urls->empty())
        return mirror_urls->front();
    return std::nullopt;
}

static std::optional<TransparencyBlock> parse_transparency(const Json& doc)
{
    auto it = doc.find("transparency");
    if (it == doc.end() || !it->is_object())
        return std::nullopt;

    TransparencyBlock block;
    if (auto url = it->find("rekor_url"); url != it->end())
        block.rekor_url = *url;
    if (auto mirrors = it->find("mirror_urls"); mirrors != it->end())
        block.mirror_urls = *mirrors;
    return block;
}

static std::vector<SignatureEntry> parse_signatures(const Json& doc)
{
    std::vector<SignatureEntry> entries;
    auto it = doc.find("signatures");
    if (it == doc.end() || !it->is_array())
        return entries;

    entries.reserve(it->size());
    for (const auto& sig : *it)
    {
        SignatureEntry entry;
        if (sig.is_object())
        {
            if (auto signer = sig.find("signer"); signer != sig.end())
                entry.signer = *signer;
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

Receipt Receipt::from_json(Json document)
{
    if (!document.is_object())
        throw DecodeError("receipt root must be a JSON object");

    Receipt r;
    r.transparency_ = parse_transparency(document);
    r.signatures_ = parse_signatures(document);
    r.document_ = std::move(document);
    return r;
}

bool Receipt::has_field(const std::string& name) const
{
    return document_.contains(name);
}

} // namespace pfverify
