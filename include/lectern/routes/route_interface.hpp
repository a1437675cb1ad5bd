#pragma once

#include "../export.hpp"

#include <map>
#include <string>

#ifdef _WIN32
#include <winsock2.h>
using SocketType = SOCKET;
#else
#include <sys/socket.h>
#include <unistd.h>
using SocketType = int;
#endif

namespace lectern {

// A parsed request. Header names are lower-cased; the query string is kept apart from the path.
struct HttpRequest {
    std::string method;
    std::string path;
    std::string query;
    std::map<std::string, std::string> headers;
    std::string body;

    // Case-insensitive header lookup; empty when absent.
    std::string header(const std::string& name) const;
};

class LECTERN_SERVER_API IRoute {
public:
    // Returns true if this route should handle the given method and path.
    virtual bool match(const std::string& method,
        const std::string& path) = 0;
    // Handle the request and write exactly one response to sock.
    virtual void handle(SocketType sock, const HttpRequest& request) = 0;
    virtual ~IRoute() {}
};

} // namespace lectern
