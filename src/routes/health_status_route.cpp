#include "lectern/routes/health_status_route.hpp"
#include "lectern/session/session_store.hpp"
#include "lectern/utils.hpp"
#include "lectern/logger.hpp"
#include <json.hpp>

using json = nlohmann::json;

namespace lectern
{

    HealthStatusRoute::HealthStatusRoute(const session::SessionStore &sessions) : sessions_(sessions)
    {
    }

    bool HealthStatusRoute::match(const std::string &method, const std::string &path)
    {
        return method == "GET" && path == "/health";
    }

    void HealthStatusRoute::handle(SocketType sock, const HttpRequest &)
    {
        json response = {
            {"status", "ok"},
            {"active_sessions", sessions_.size()}};
        send_json(sock, 200, response);
        ServerLogger::logDebug("Health check answered, %zu active sessions", sessions_.size());
    }

} // namespace lectern
