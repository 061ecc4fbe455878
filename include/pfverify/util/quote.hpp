#pragma once
#include <string>

namespace pfverify::util
{

// Quotes a value for diagnostics:
// - single quotes, or double quotes when the text holds ' but no "
// - backslash and the chosen quote are escaped
// - \n \r \t short escapes
// - other non-printable code points (controls, format characters, separators
//   other than the ASCII space, private use) as \xNN, \uNNNN or \UNNNNNNNN
// - printable UTF-8 passes through; bytes that are not well-formed UTF-8 are
//   escaped one by one as \xNN
std::string quote(const std::string& value);

} // namespace pfverify::util
