#pragma once

#include "../export.hpp"
#include "speech_synthesizer.hpp"
#include <memory>
#include <string>

namespace lectern
{
namespace synthesis
{

/**
 * @brief Speech synthesis through an HTTP text-to-speech endpoint.
 *
 * Each call POSTs {"input", "voice", "rate", "volume", "response_format"} as
 * JSON to the configured URL and returns the response body as the audio. Any
 * transport error, non-2xx status or empty body is reported as SynthesisFailed.
 */
class LECTERN_SERVER_API HttpSpeechSynthesizer : public ISpeechSynthesizer
{
public:
    struct Config
    {
        std::string url = "http://127.0.0.1:5050/v1/audio/speech";
        int timeout = 60; // seconds
        std::string apiKey;
    };

    explicit HttpSpeechSynthesizer(const Config& config);
    ~HttpSpeechSynthesizer() override;

    HttpSpeechSynthesizer(const HttpSpeechSynthesizer&) = delete;
    HttpSpeechSynthesizer& operator=(const HttpSpeechSynthesizer&) = delete;

    std::string synthesize(const SynthesisRequest& request) override;

    const Config& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace synthesis
} // namespace lectern
