#include "lectern/routes/synthesize_route.hpp"
#include "lectern/errors.hpp"
#include "lectern/logger.hpp"
#include "lectern/models/synthesize_request_model.hpp"
#include "lectern/utils.hpp"
#include <json.hpp>

using json = nlohmann::json;

namespace lectern
{

    SynthesizeRoute::SynthesizeRoute(synthesis::ISpeechSynthesizer &synthesizer,
                                     synthesis::SynthesisRequest voiceDefaults)
        : synthesizer_(synthesizer), voiceDefaults_(std::move(voiceDefaults))
    {
    }

    bool SynthesizeRoute::match(const std::string &method, const std::string &path)
    {
        return method == "POST" && (path == "/tts" || path == "/synth");
    }

    void SynthesizeRoute::handle(SocketType sock, const HttpRequest &request)
    {
        SynthesizeRequest body;
        body.voice = voiceDefaults_.voice;
        body.rate = voiceDefaults_.rate;
        body.volume = voiceDefaults_.volume;
        body.format = voiceDefaults_.format;

        try
        {
            body.from_json(json::parse(request.body));
        }
        catch (const json::parse_error &ex)
        {
            send_error(sock, 422, std::string("Invalid JSON: ") + ex.what());
            return;
        }
        catch (const ValidationError &ex)
        {
            send_error(sock, 422, ex.what());
            return;
        }

        if (!body.validate())
        {
            send_error(sock, 422, body.validationError());
            return;
        }

        std::string audio;
        try
        {
            audio = synthesizer_.synthesize(body.toSynthesisRequest());
        }
        catch (const ValidationError &ex)
        {
            send_error(sock, 422, ex.what());
            return;
        }
        catch (const std::exception &ex)
        {
            ServerLogger::logError("Synthesis failed: %s", ex.what());
            send_error(sock, 500, ex.what());
            return;
        }

        send_response(sock, 200, audio, {{"Content-Type", synthesis::audioContentType(body.format)}});
        ServerLogger::logInfo("Synthesized %zu bytes of text into %zu bytes of audio",
                              body.text.size(), audio.size());
    }

} // namespace lectern
