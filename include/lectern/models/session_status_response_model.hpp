#pragma once

#include "../export.hpp"
#include "model_interface.hpp"
#include "../session/session_store.hpp"
#include <json.hpp>

namespace lectern
{

/**
 * @brief Response body of GET /pdf/{session_id}/status
 */
class LECTERN_SERVER_API SessionStatusResponse : public IModel
{
public:
    long long current_index = 0;
    size_t total_chunks = 0;
    int current_page = 0;

    SessionStatusResponse() = default;

    explicit SessionStatusResponse(const session::SessionStatus& status)
        : current_index(status.currentIndex), total_chunks(status.totalChunks), current_page(status.currentPage) {}

    bool validate() const override
    {
        return current_index >= 0 && static_cast<size_t>(current_index) < total_chunks && current_page >= 1;
    }

    void from_json(const nlohmann::json& j) override
    {
        if (j.contains("current_index")) j.at("current_index").get_to(current_index);
        if (j.contains("total_chunks")) j.at("total_chunks").get_to(total_chunks);
        if (j.contains("current_page")) j.at("current_page").get_to(current_page);
    }

    nlohmann::json to_json() const override
    {
        return nlohmann::json{
            {"current_index", current_index},
            {"total_chunks", total_chunks},
            {"current_page", current_page}};
    }
};

} // namespace lectern
