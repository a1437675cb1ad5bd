#pragma once

#include "../export.hpp"
#include "model_interface.hpp"
#include <string>
#include <json.hpp>

namespace lectern
{

/**
 * @brief Response body of POST /pdf/upload
 */
class LECTERN_SERVER_API UploadResponse : public IModel
{
public:
    std::string session_id;
    size_t total_chunks = 0;

    bool validate() const override
    {
        return !session_id.empty() && total_chunks > 0;
    }

    void from_json(const nlohmann::json& j) override
    {
        if (j.contains("session_id")) j.at("session_id").get_to(session_id);
        if (j.contains("total_chunks")) j.at("total_chunks").get_to(total_chunks);
    }

    nlohmann::json to_json() const override
    {
        return nlohmann::json{
            {"session_id", session_id},
            {"total_chunks", total_chunks}};
    }
};

} // namespace lectern
