#include "lectern/document/text_utils.hpp"

namespace lectern
{
namespace document
{

size_t utf8Length(const std::string& text)
{
    size_t count = 0;
    for (unsigned char c : text)
    {
        if ((c & 0xC0) != 0x80)
        {
            ++count;
        }
    }
    return count;
}

bool isValidUtf8(const std::string& text)
{
    size_t i = 0;
    const size_t n = text.size();
    while (i < n)
    {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        unsigned int codepoint = 0;

        if (c < 0x80)
        {
            ++i;
            continue;
        }
        else if ((c & 0xE0) == 0xC0)
        {
            extra = 1;
            codepoint = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            extra = 2;
            codepoint = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            extra = 3;
            codepoint = c & 0x07;
        }
        else
        {
            return false;
        }

        if (i + extra >= n)
        {
            return false;
        }

        for (size_t k = 1; k <= extra; ++k)
        {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80)
            {
                return false;
            }
            codepoint = (codepoint << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates and out-of-range code points
        if ((extra == 1 && codepoint < 0x80) ||
            (extra == 2 && codepoint < 0x800) ||
            (extra == 3 && codepoint < 0x10000) ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF) ||
            codepoint > 0x10FFFF)
        {
            return false;
        }

        i += extra + 1;
    }
    return true;
}

bool isSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(const std::string& text)
{
    size_t begin = 0;
    while (begin < text.size() && isSpace(text[begin]))
    {
        ++begin;
    }
    size_t end = text.size();
    while (end > begin && isSpace(text[end - 1]))
    {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool isBlank(const std::string& text)
{
    for (char c : text)
    {
        if (!isSpace(c))
        {
            return false;
        }
    }
    return true;
}

std::string collapseWhitespace(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text)
    {
        if (isSpace(c))
        {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace)
        {
            out += ' ';
            pendingSpace = false;
        }
        out += c;
    }
    return out;
}

std::vector<std::string> splitWords(const std::string& text)
{
    std::vector<std::string> words;
    size_t i = 0;
    while (i < text.size())
    {
        while (i < text.size() && isSpace(text[i]))
        {
            ++i;
        }
        size_t start = i;
        while (i < text.size() && !isSpace(text[i]))
        {
            ++i;
        }
        if (i > start)
        {
            words.push_back(text.substr(start, i - start));
        }
    }
    return words;
}

bool isSentenceTerminal(char c)
{
    return c == '.' || c == '!' || c == '?';
}

bool hasSentenceTerminal(const std::string& text)
{
    for (char c : text)
    {
        if (isSentenceTerminal(c))
        {
            return true;
        }
    }
    return false;
}

std::string joinWithSpaces(const std::vector<std::string>& parts)
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
        {
            out += ' ';
        }
        out += parts[i];
    }
    return out;
}

} // namespace document
} // namespace lectern
