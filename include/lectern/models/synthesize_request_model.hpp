#ifndef LECTERN_SYNTHESIZE_REQUEST_MODEL_HPP
#define LECTERN_SYNTHESIZE_REQUEST_MODEL_HPP

#include "model_interface.hpp"
#include "../synthesis/speech_synthesizer.hpp"
#include <json.hpp>
#include <string>

namespace lectern
{

/**
 * @brief Request body of POST /tts and POST /synth
 */
class LECTERN_SERVER_API SynthesizeRequest : public IModel
{
public:
    // Text to speak (required, at least one character)
    std::string text;

    std::string voice = synthesis::kDefaultVoice;

    // Signed percentages such as "+20%"
    std::string rate = synthesis::kDefaultRate;
    std::string volume = synthesis::kDefaultVolume;

    std::string format = synthesis::kDefaultFormat;

    SynthesizeRequest() = default;
    virtual ~SynthesizeRequest() = default;

    bool validate() const override;

    /**
     * @brief First problem found with the request, or an empty string when valid
     */
    std::string validationError() const;

    nlohmann::json to_json() const override;

    /**
     * @brief Populates the request from JSON
     * @throws ValidationError when a field is missing or has the wrong type
     */
    void from_json(const nlohmann::json& j) override;

    synthesis::SynthesisRequest toSynthesisRequest() const;
};

} // namespace lectern

#endif // LECTERN_SYNTHESIZE_REQUEST_MODEL_HPP
