#ifndef LECTERN_SESSION_STATUS_ROUTE_HPP
#define LECTERN_SESSION_STATUS_ROUTE_HPP

#include "route_interface.hpp"

namespace lectern {

    namespace session { class SessionStore; }

    // GET /pdf/{session_id}/status
    class LECTERN_SERVER_API SessionStatusRoute : public IRoute {
    public:
        explicit SessionStatusRoute(const session::SessionStore& sessions);

        bool match(const std::string& method, const std::string& path) override;
        void handle(SocketType sock, const HttpRequest& request) override;

    private:
        const session::SessionStore& sessions_;
    };

} // namespace lectern

#endif // LECTERN_SESSION_STATUS_ROUTE_HPP
