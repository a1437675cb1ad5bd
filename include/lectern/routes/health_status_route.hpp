#ifndef LECTERN_HEALTH_STATUS_ROUTE_HPP
#define LECTERN_HEALTH_STATUS_ROUTE_HPP

#include "route_interface.hpp"

namespace lectern {

    namespace session { class SessionStore; }

    class LECTERN_SERVER_API HealthStatusRoute : public IRoute {
    public:
        explicit HealthStatusRoute(const session::SessionStore& sessions);

        bool match(const std::string& method, const std::string& path) override;
        void handle(SocketType sock, const HttpRequest& request) override;

    private:
        const session::SessionStore& sessions_;
    };

} // namespace lectern

#endif // LECTERN_HEALTH_STATUS_ROUTE_HPP
