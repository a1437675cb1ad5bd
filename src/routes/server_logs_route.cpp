#include "lectern/routes/server_logs_route.hpp"
#include "lectern/logger.hpp"
#include "lectern/utils.hpp"
#include <json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace lectern
{

    bool ServerLogsRoute::match(const std::string &method, const std::string &path)
    {
        return method == "GET" && (path == "/logs" || path == "/server/logs");
    }

    void ServerLogsRoute::handle(SocketType sock, const HttpRequest &)
    {
        const auto logs = ServerLogger::instance().getLogs();

        json logsList = json::array();
        for (const auto &entry : logs)
        {
            logsList.push_back({{"level", ServerLogger::levelToString(entry.level)},
                                {"timestamp", entry.timestamp},
                                {"message", entry.message}});
        }

        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm localTm{};
#ifdef _WIN32
        localtime_s(&localTm, &now);
#else
        localtime_r(&now, &localTm);
#endif
        std::ostringstream retrievedAt;
        retrievedAt << std::put_time(&localTm, "%Y-%m-%d %H:%M:%S");

        json response = {
            {"logs", logsList},
            {"total_count", logsList.size()},
            {"retrieved_at", retrievedAt.str()}};
        send_json(sock, 200, response);
        ServerLogger::logDebug("Returned %zu log entries", logsList.size());
    }

} // namespace lectern
