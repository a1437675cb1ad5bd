#ifndef LECTERN_SERVER_LOGS_ROUTE_HPP
#define LECTERN_SERVER_LOGS_ROUTE_HPP

#include "route_interface.hpp"

namespace lectern {

    // GET /logs: the entries ServerLogger keeps in memory
    class LECTERN_SERVER_API ServerLogsRoute : public IRoute {
    public:
        bool match(const std::string& method, const std::string& path) override;
        void handle(SocketType sock, const HttpRequest& request) override;
    };

} // namespace lectern

#endif // LECTERN_SERVER_LOGS_ROUTE_HPP
