#include "lectern/routes/chunk_read_route.hpp"
#include "lectern/errors.hpp"
#include "lectern/logger.hpp"
#include "lectern/session/session_store.hpp"
#include "lectern/utils.hpp"
#include <stdexcept>

namespace lectern
{

    ChunkReadRoute::ChunkReadRoute(session::SessionStore &sessions,
                                   synthesis::ISpeechSynthesizer &synthesizer,
                                   synthesis::SynthesisRequest voiceDefaults)
        : sessions_(sessions), synthesizer_(synthesizer), voiceDefaults_(std::move(voiceDefaults))
    {
    }

    bool ChunkReadRoute::match(const std::string &method, const std::string &path)
    {
        if (method != "GET")
            return false;
        auto segments = split_path(path);
        return segments.size() == 4 && segments[0] == "pdf" && segments[2] == "read";
    }

    void ChunkReadRoute::handle(SocketType sock, const HttpRequest &request)
    {
        auto segments = split_path(request.path);
        const std::string sessionId = url_decode(segments[1]);
        const std::string indexText = url_decode(segments[3]);

        long long index = 0;
        try
        {
            size_t consumed = 0;
            index = std::stoll(indexText, &consumed);
            if (consumed != indexText.size())
            {
                throw std::invalid_argument("trailing characters");
            }
        }
        catch (const std::logic_error &)
        {
            send_error(sock, 422, "chunk_index must be an integer");
            return;
        }

        session::ChunkReadResult chunk;
        try
        {
            chunk = sessions_.readChunk(sessionId, index);
        }
        catch (const SessionNotFound &ex)
        {
            send_error(sock, 404, ex.what());
            return;
        }
        catch (const IndexOutOfRange &ex)
        {
            send_error(sock, 400, ex.what());
            return;
        }

        // No session lock is held past this point
        synthesis::SynthesisRequest synth = voiceDefaults_;
        synth.text = chunk.text;

        std::string audio;
        try
        {
            audio = synthesizer_.synthesize(synth);
        }
        catch (const ValidationError &ex)
        {
            send_error(sock, 400, ex.what());
            return;
        }
        catch (const std::exception &ex)
        {
            ServerLogger::logError("Synthesis failed for session %s chunk %lld: %s",
                                   sessionId.c_str(), index, ex.what());
            send_error(sock, 500, std::string("Error generating audio: ") + ex.what());
            return;
        }

        send_response(sock, 200, audio, {{"Content-Type", synthesis::audioContentType(synth.format)}});
        ServerLogger::logInfo("Served chunk %lld (page %d) of session %s, %zu bytes of audio",
                              index, chunk.pageNumber, sessionId.c_str(), audio.size());
    }

} // namespace lectern
