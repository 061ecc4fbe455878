#pragma once
#include "pfverify/receipt.hpp"

#include <filesystem>
#include <string>

namespace pfverify
{

/// Reads a whole file. Throws NotFoundError when the path is missing and
/// DecodeError when it is a directory or cannot be read.
std::string read_text(const std::filesystem::path& path, const std::string& what);

/// Loads a receipt. Throws NotFoundError for a missing path and DecodeError
/// for an unreadable file, invalid JSON (NaN and Infinity included) or a
/// non-object root.
Receipt load_json(const std::filesystem::path& path);

} // namespace pfverify
