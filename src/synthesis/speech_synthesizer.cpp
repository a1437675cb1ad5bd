#include "lectern/synthesis/speech_synthesizer.hpp"
#include "lectern/document/text_utils.hpp"
#include "lectern/errors.hpp"
#include <cctype>

namespace lectern
{
namespace synthesis
{

namespace
{

// Parses [+-]digits followed by '%'. Returns false on any other shape.
bool parsePercentage(const std::string& value, long& number)
{
    if (value.size() < 2 || value.back() != '%')
    {
        return false;
    }

    size_t pos = 0;
    bool negative = false;
    if (value[0] == '+' || value[0] == '-')
    {
        negative = value[0] == '-';
        pos = 1;
    }

    const size_t end = value.size() - 1;
    if (pos >= end || end - pos > 6)
    {
        return false;
    }

    long parsed = 0;
    for (; pos < end; ++pos)
    {
        if (!std::isdigit(static_cast<unsigned char>(value[pos])))
        {
            return false;
        }
        parsed = parsed * 10 + (value[pos] - '0');
    }

    number = negative ? -parsed : parsed;
    return true;
}

} // namespace

void validatePercentage(const std::string& value, const std::string& name)
{
    if (value.empty() || value.back() != '%')
    {
        throw ValidationError(name + " must be a percentage value (e.g. '+20%')");
    }

    long number = 0;
    if (!parsePercentage(value, number))
    {
        throw ValidationError(name + " must be a valid percentage (e.g. '+20%')");
    }
    if (number < -100 || number > 100)
    {
        throw ValidationError(name + " must be between -100% and +100%");
    }
}

bool isValidPercentage(const std::string& value)
{
    long number = 0;
    return parsePercentage(value, number) && number >= -100 && number <= 100;
}

std::string audioContentType(const std::string& format)
{
    if (format == "wav")
        return "audio/wav";
    if (format == "opus" || format == "ogg")
        return "audio/ogg";
    if (format == "aac")
        return "audio/aac";
    if (format == "flac")
        return "audio/flac";
    if (format == "pcm")
        return "audio/pcm";
    return "audio/mpeg";
}

void validateSynthesisRequest(const SynthesisRequest& request)
{
    if (document::isBlank(request.text))
    {
        throw ValidationError("Text cannot be empty");
    }
    validatePercentage(request.rate, "Rate");
    validatePercentage(request.volume, "Volume");
}

} // namespace synthesis
} // namespace lectern
