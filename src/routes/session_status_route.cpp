#include "lectern/routes/session_status_route.hpp"
#include "lectern/errors.hpp"
#include "lectern/logger.hpp"
#include "lectern/models/session_status_response_model.hpp"
#include "lectern/session/session_store.hpp"
#include "lectern/utils.hpp"

namespace lectern
{

    SessionStatusRoute::SessionStatusRoute(const session::SessionStore &sessions) : sessions_(sessions)
    {
    }

    bool SessionStatusRoute::match(const std::string &method, const std::string &path)
    {
        if (method != "GET")
            return false;
        auto segments = split_path(path);
        return segments.size() == 3 && segments[0] == "pdf" && segments[2] == "status";
    }

    void SessionStatusRoute::handle(SocketType sock, const HttpRequest &request)
    {
        const std::string sessionId = url_decode(split_path(request.path)[1]);

        try
        {
            SessionStatusResponse response(sessions_.getStatus(sessionId));
            send_json(sock, 200, response.to_json());
            ServerLogger::logInfo("Reported status of session %s: chunk %lld of %zu",
                                  sessionId.c_str(), response.current_index, response.total_chunks);
        }
        catch (const SessionNotFound &ex)
        {
            send_error(sock, 404, ex.what());
        }
        catch (const NoContent &ex)
        {
            send_error(sock, 404, ex.what());
        }
    }

} // namespace lectern
