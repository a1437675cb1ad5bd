#ifndef LECTERN_TEXT_UTILS_HPP
#define LECTERN_TEXT_UTILS_HPP

#include "../export.hpp"
#include <string>
#include <vector>

namespace lectern
{
namespace document
{

// Number of Unicode code points in a UTF-8 string. Continuation bytes are not
// counted, so malformed input still yields a usable (byte-ish) length.
LECTERN_SERVER_API size_t utf8Length(const std::string& text);

LECTERN_SERVER_API bool isValidUtf8(const std::string& text);

LECTERN_SERVER_API bool isSpace(char c);

LECTERN_SERVER_API std::string trim(const std::string& text);

LECTERN_SERVER_API bool isBlank(const std::string& text);

// Collapses every run of whitespace to one space and trims both ends.
LECTERN_SERVER_API std::string collapseWhitespace(const std::string& text);

LECTERN_SERVER_API std::vector<std::string> splitWords(const std::string& text);

LECTERN_SERVER_API bool isSentenceTerminal(char c);

LECTERN_SERVER_API bool hasSentenceTerminal(const std::string& text);

LECTERN_SERVER_API std::string joinWithSpaces(const std::vector<std::string>& parts);

} // namespace document
} // namespace lectern

#endif // LECTERN_TEXT_UTILS_HPP
