#ifndef LECTERN_SYNTHESIZE_ROUTE_HPP
#define LECTERN_SYNTHESIZE_ROUTE_HPP

#include "route_interface.hpp"
#include "../synthesis/speech_synthesizer.hpp"

namespace lectern {

    // POST /tts and POST /synth: speaks arbitrary text.
    class LECTERN_SERVER_API SynthesizeRoute : public IRoute {
    public:
        SynthesizeRoute(synthesis::ISpeechSynthesizer& synthesizer,
                        synthesis::SynthesisRequest voiceDefaults = {});

        bool match(const std::string& method, const std::string& path) override;
        void handle(SocketType sock, const HttpRequest& request) override;

    private:
        synthesis::ISpeechSynthesizer& synthesizer_;
        synthesis::SynthesisRequest voiceDefaults_;
    };

} // namespace lectern

#endif // LECTERN_SYNTHESIZE_ROUTE_HPP
