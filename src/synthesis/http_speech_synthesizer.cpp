#include "lectern/synthesis/http_speech_synthesizer.hpp"
#include "lectern/errors.hpp"
#include "lectern/logger.hpp"
#include <curl/curl.h>
#include <json.hpp>
#include <mutex>

namespace lectern
{
namespace synthesis
{

// Callback for libcurl to write response data
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp)
{
    size_t totalSize = size * nmemb;
    userp->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

class HttpSpeechSynthesizer::Impl
{
public:
    Config config_;

    explicit Impl(const Config& config) : config_(config)
    {
        static std::once_flag curlInit;
        std::call_once(curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

        ServerLogger::logInfo("Speech synthesis endpoint: %s (timeout %ds)",
                              config_.url.c_str(), config_.timeout);
    }

    std::string buildBody(const SynthesisRequest& request) const
    {
        nlohmann::json body;
        body["input"] = request.text;
        body["voice"] = request.voice;
        body["rate"] = request.rate;
        body["volume"] = request.volume;
        body["response_format"] = request.format;
        return body.dump();
    }

    static std::string describeFailure(long status, const std::string& responseBody)
    {
        std::string message = "HTTP error " + std::to_string(status);
        try
        {
            auto json = nlohmann::json::parse(responseBody);
            if (json.contains("detail") && json["detail"].is_string())
            {
                return message + ": " + json["detail"].get<std::string>();
            }
            if (json.contains("error"))
            {
                const auto& error = json["error"];
                if (error.is_string())
                {
                    return message + ": " + error.get<std::string>();
                }
                if (error.is_object() && error.contains("message") && error["message"].is_string())
                {
                    return message + ": " + error["message"].get<std::string>();
                }
            }
        }
        catch (const nlohmann::json::exception&)
        {
            // Not JSON; the raw body is appended below
        }
        if (!responseBody.empty() && responseBody.size() <= 512)
        {
            message += ": " + responseBody;
        }
        return message;
    }

    std::string execute(const SynthesisRequest& request)
    {
        CURL* curl = curl_easy_init();
        if (!curl)
        {
            throw SynthesisFailed("Failed to initialize CURL");
        }

        const std::string body = buildBody(request);
        std::string responseBody;
        long responseCode = 0;

        curl_easy_setopt(curl, CURLOPT_URL, config_.url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout));
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");
        headers = curl_slist_append(headers, "Accept: audio/mpeg");
        if (!config_.apiKey.empty())
        {
            std::string auth = "Authorization: Bearer " + config_.apiKey;
            headers = curl_slist_append(headers, auth.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

        CURLcode res = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &responseCode);

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK)
        {
            throw SynthesisFailed("CURL error: " + std::string(curl_easy_strerror(res)));
        }
        if (responseCode < 200 || responseCode >= 300)
        {
            throw SynthesisFailed(describeFailure(responseCode, responseBody));
        }
        if (responseBody.empty())
        {
            throw SynthesisFailed("Speech service returned no audio");
        }
        return responseBody;
    }
};

HttpSpeechSynthesizer::HttpSpeechSynthesizer(const Config& config)
    : pImpl(std::make_unique<Impl>(config))
{
}

HttpSpeechSynthesizer::~HttpSpeechSynthesizer() = default;

std::string HttpSpeechSynthesizer::synthesize(const SynthesisRequest& request)
{
    validateSynthesisRequest(request);

    ServerLogger::logDebug("Synthesizing %zu bytes of text with voice %s",
                           request.text.size(), request.voice.c_str());
    std::string audio = pImpl->execute(request);
    ServerLogger::logDebug("Received %zu bytes of audio", audio.size());
    return audio;
}

const HttpSpeechSynthesizer::Config& HttpSpeechSynthesizer::config() const
{
    return pImpl->config_;
}

} // namespace synthesis
} // namespace lectern
