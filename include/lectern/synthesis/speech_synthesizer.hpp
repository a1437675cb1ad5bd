#ifndef LECTERN_SPEECH_SYNTHESIZER_HPP
#define LECTERN_SPEECH_SYNTHESIZER_HPP

#include "../export.hpp"
#include <string>

namespace lectern
{
namespace synthesis
{

constexpr const char* kDefaultVoice = "en-US-AriaNeural";
constexpr const char* kDefaultRate = "+0%";
constexpr const char* kDefaultVolume = "+0%";
constexpr const char* kDefaultFormat = "mp3";

struct SynthesisRequest
{
    std::string text;
    std::string voice = kDefaultVoice;
    std::string rate = kDefaultRate;
    std::string volume = kDefaultVolume;
    std::string format = kDefaultFormat;
};

/**
 * @brief Turns text into audio bytes.
 *
 * Implementations must be callable from several request threads at once.
 * synthesize() throws ValidationError for input the backend would refuse
 * (empty text, malformed rate or volume) and SynthesisFailed when the backend
 * itself fails.
 */
class LECTERN_SERVER_API ISpeechSynthesizer
{
public:
    virtual ~ISpeechSynthesizer() = default;

    virtual std::string synthesize(const SynthesisRequest& request) = 0;
};

// Accepts "+20%", "-5%", "0%"; the value must lie in [-100, 100].
// `name` prefixes the error message ("Rate", "Volume").
LECTERN_SERVER_API void validatePercentage(const std::string& value, const std::string& name);

LECTERN_SERVER_API bool isValidPercentage(const std::string& value);

// MIME type for an audio format name; unknown formats map to audio/mpeg.
LECTERN_SERVER_API std::string audioContentType(const std::string& format);

// Text must be non-blank and rate/volume valid percentages.
LECTERN_SERVER_API void validateSynthesisRequest(const SynthesisRequest& request);

} // namespace synthesis
} // namespace lectern

#endif // LECTERN_SPEECH_SYNTHESIZER_HPP
