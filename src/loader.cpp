#include "pfverify/loader.hpp"

#include "pfverify/exceptions.hpp"
#include "pfverify/log.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace pfverify
{

std::string read_text(const std::filesystem::path& path, const std::string& what)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        throw NotFoundError(what + " not found: " + path.string());
    if (std::filesystem::is_directory(path, ec))
        throw DecodeError("is a directory: " + path.string());

    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw DecodeError("cannot open " + what + ": " + path.string());
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        throw DecodeError("cannot read " + what + ": " + path.string());
    return text;
}

Receipt load_json(const std::filesystem::path& path)
{
    const auto text = read_text(path, "receipt");
    log::debug("read " + std::to_string(text.size()) + " bytes from " + path.string());

    Json document;
    try
    {
        document = Json::parse(text);
    }
    catch (const Json::parse_error& e)
    {
        throw DecodeError(e.what());
    }
    return Receipt::from_json(std::move(document));
}

} // namespace pfverify
