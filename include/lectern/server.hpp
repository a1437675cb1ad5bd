#pragma once

#include "routes/route_interface.hpp"
#include "export.hpp"

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace lectern {

    class LECTERN_SERVER_API Server {
    public:
        explicit Server(const std::string& port, const std::string& host = "0.0.0.0",
                        size_t maxBodyBytes = 52428800);
        ~Server();

        bool init();
        void addRoute(std::unique_ptr<IRoute> route);
        void run();
        void stop();

        // Reads one request from client_sock, dispatches it and closes the socket.
        void handleConnection(SocketType client_sock, const std::string& clientIP);

        // Blocks until every connection accepted by run() has been answered.
        void waitForConnections();

        int openConnections() const;

    private:
        void dispatch(SocketType client_sock, const HttpRequest& request);
        void connectionFinished();

#pragma warning(push)
#pragma warning(disable: 4251)
        std::string port;
        std::string host;
#pragma warning(pop)
        size_t maxBodyBytes;
        SocketType listen_sock;
#pragma warning(push)
#pragma warning(disable: 4251)
        std::vector<std::unique_ptr<IRoute>> routes;
        std::atomic<bool> running;
        mutable std::mutex connectionMutex;
        std::condition_variable connectionsDone;
#pragma warning(pop)
        int activeConnections;
    };

} // namespace lectern
