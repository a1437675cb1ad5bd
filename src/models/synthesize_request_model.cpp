#include "lectern/models/synthesize_request_model.hpp"
#include "lectern/errors.hpp"
#include "lectern/logger.hpp"

namespace lectern
{

std::string SynthesizeRequest::validationError() const
{
    if (text.empty())
    {
        return "Field 'text' must contain at least 1 character";
    }
    if (voice.empty())
    {
        return "Field 'voice' must not be empty";
    }
    if (!synthesis::isValidPercentage(rate))
    {
        return "Rate must be a percentage between -100% and +100% (e.g. '+20%')";
    }
    if (!synthesis::isValidPercentage(volume))
    {
        return "Volume must be a percentage between -100% and +100% (e.g. '+20%')";
    }
    if (format.empty())
    {
        return "Field 'format' must not be empty";
    }
    return "";
}

bool SynthesizeRequest::validate() const
{
    std::string error = validationError();
    if (!error.empty())
    {
        ServerLogger::logDebug("Validation failed: %s", error.c_str());
        return false;
    }
    return true;
}

nlohmann::json SynthesizeRequest::to_json() const
{
    nlohmann::json j;
    j["text"] = text;
    j["voice"] = voice;
    j["rate"] = rate;
    j["volume"] = volume;
    j["format"] = format;
    return j;
}

void SynthesizeRequest::from_json(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        throw ValidationError("Request body must be a JSON object");
    }

    if (!j.contains("text") || !j["text"].is_string())
    {
        throw ValidationError("Missing or invalid 'text' field - must be a string");
    }
    text = j["text"].get<std::string>();

    auto readString = [&j](const char* name, std::string& field) {
        if (!j.contains(name) || j[name].is_null())
        {
            return;
        }
        if (!j[name].is_string())
        {
            throw ValidationError(std::string("Field '") + name + "' must be a string");
        }
        field = j[name].get<std::string>();
    };

    readString("voice", voice);
    readString("rate", rate);
    readString("volume", volume);
    readString("format", format);
}

synthesis::SynthesisRequest SynthesizeRequest::toSynthesisRequest() const
{
    synthesis::SynthesisRequest request;
    request.text = text;
    request.voice = voice;
    request.rate = rate;
    request.volume = volume;
    request.format = format;
    return request;
}

} // namespace lectern
