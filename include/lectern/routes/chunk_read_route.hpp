#ifndef LECTERN_CHUNK_READ_ROUTE_HPP
#define LECTERN_CHUNK_READ_ROUTE_HPP

#include "route_interface.hpp"
#include "../synthesis/speech_synthesizer.hpp"

namespace lectern {

    namespace session { class SessionStore; }

    /**
     * @brief GET /pdf/{session_id}/read/{chunk_index}
     *
     * Moves the session cursor to the chunk and answers with its audio. The
     * cursor is committed before synthesis starts, so a failed synthesis still
     * leaves the session positioned on the requested chunk.
     */
    class LECTERN_SERVER_API ChunkReadRoute : public IRoute {
    public:
        ChunkReadRoute(session::SessionStore& sessions,
                       synthesis::ISpeechSynthesizer& synthesizer,
                       synthesis::SynthesisRequest voiceDefaults = {});

        bool match(const std::string& method, const std::string& path) override;
        void handle(SocketType sock, const HttpRequest& request) override;

    private:
        session::SessionStore& sessions_;
        synthesis::ISpeechSynthesizer& synthesizer_;
        synthesis::SynthesisRequest voiceDefaults_;
    };

} // namespace lectern

#endif // LECTERN_CHUNK_READ_ROUTE_HPP
