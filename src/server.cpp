#include "lectern/server.hpp"
#include "lectern/utils.hpp"
#include "lectern/logger.hpp"
#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>
#include <map>
#include <algorithm>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
#else
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <netdb.h>
#endif

namespace lectern
{

	std::string HttpRequest::header(const std::string &name) const
	{
		auto it = headers.find(to_lower(name));
		return it == headers.end() ? std::string() : it->second;
	}

	static void close_socket(SocketType sock)
	{
#ifdef _WIN32
		closesocket(sock);
#else
		close(sock);
#endif
	}

	// Helper: parse HTTP headers from the header block of a request
	static std::map<std::string, std::string> parseHeaders(const std::string &request)
	{
		std::map<std::string, std::string> headers;

		// Skip the request line
		size_t start = request.find("\r\n");
		if (start == std::string::npos)
			return headers;
		start += 2;

		size_t end = request.find("\r\n\r\n", start);
		if (end == std::string::npos)
			end = request.length();

		std::istringstream headerStream(request.substr(start, end - start));
		std::string line;

		while (std::getline(headerStream, line))
		{
			line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
			if (line.empty())
				continue;

			size_t colonPos = line.find(':');
			if (colonPos == std::string::npos)
				continue;

			std::string name = line.substr(0, colonPos);
			std::string value = line.substr(colonPos + 1);

			name.erase(0, name.find_first_not_of(" \t"));
			name.erase(name.find_last_not_of(" \t") + 1);
			value.erase(0, value.find_first_not_of(" \t"));
			value.erase(value.find_last_not_of(" \t") + 1);

			// Header names are case-insensitive
			headers[to_lower(name)] = value;
		}

		return headers;
	}

	// Helper: parse the first line of the HTTP request
	static bool parse_request_line(const std::string &requestLine,
								   std::string &method, std::string &target)
	{
		size_t first = requestLine.find(' ');
		if (first == std::string::npos)
			return false;
		method = requestLine.substr(0, first);
		size_t second = requestLine.find(' ', first + 1);
		if (second == std::string::npos)
			return false;
		target = requestLine.substr(first + 1, second - first - 1);
		return !method.empty() && !target.empty();
	}

	Server::Server(const std::string &port, const std::string &host, size_t maxBodyBytes)
		: port(port), host(host), maxBodyBytes(maxBodyBytes), running(false), activeConnections(0)
	{
#ifdef _WIN32
		listen_sock = INVALID_SOCKET;
#else
		listen_sock = -1;
#endif
	}

	Server::~Server()
	{
		stop();

		// Detached connection threads still use the routes
		waitForConnections();
#ifdef _WIN32
		if (listen_sock != INVALID_SOCKET)
			closesocket(listen_sock);
		WSACleanup();
#else
		if (listen_sock != -1)
			close(listen_sock);
#endif
	}

	bool Server::init()
	{
#ifdef _WIN32
		WSADATA wsaData;
		if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0)
		{
			ServerLogger::logError("WSAStartup failed");
			return false;
		}
#endif

		struct addrinfo hints, *servinfo, *p;
		std::memset(&hints, 0, sizeof(hints));
		hints.ai_family = AF_INET;
		hints.ai_socktype = SOCK_STREAM;
		hints.ai_flags = AI_PASSIVE;
		int rv;
		const char *bind_host = (host == "0.0.0.0") ? NULL : host.c_str();
		if ((rv = getaddrinfo(bind_host, port.c_str(), &hints, &servinfo)) != 0)
		{
#ifdef _WIN32
			ServerLogger::logError("getaddrinfo: %s", gai_strerrorA(rv));
#else
			ServerLogger::logError("getaddrinfo: %s", gai_strerror(rv));
#endif
			return false;
		}

		for (p = servinfo; p != nullptr; p = p->ai_next)
		{
			listen_sock = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
#ifdef _WIN32
			if (listen_sock == INVALID_SOCKET)
				continue;
#else
			if (listen_sock == -1)
				continue;
#endif

			int yes = 1;
			if (setsockopt(listen_sock, SOL_SOCKET, SO_REUSEADDR,
						   reinterpret_cast<const char *>(&yes),
						   sizeof(yes)) == -1)
			{
				close_socket(listen_sock);
				continue;
			}

			if (bind(listen_sock, p->ai_addr, static_cast<int>(p->ai_addrlen)) == -1)
			{
				close_socket(listen_sock);
				continue;
			}
			break;
		}
		freeaddrinfo(servinfo);

		if (p == nullptr)
		{
#ifdef _WIN32
			listen_sock = INVALID_SOCKET;
#else
			listen_sock = -1;
#endif
			ServerLogger::logError("Failed to bind socket on %s:%s", host.c_str(), port.c_str());
			return false;
		}

		if (listen(listen_sock, 64) == -1)
		{
			ServerLogger::logError("Listen failed");
			return false;
		}

		// Armed here so that a stop() issued before run() starts is not lost
		running = true;
		ServerLogger::logInfo("Server initialized and listening on %s:%s",
							  host.c_str(), port.c_str());
		return true;
	}

	void Server::addRoute(std::unique_ptr<IRoute> route)
	{
		routes.push_back(std::move(route));
	}

	void Server::run()
	{
		ServerLogger::logInfo("Server entering main loop with concurrent request handling");

		while (running)
		{
			struct sockaddr_storage client_addr;
#ifdef _WIN32
			int sin_size = sizeof(client_addr);
#else
			socklen_t sin_size = sizeof(client_addr);
#endif

			// Setup select for timeout to check running flag periodically
			fd_set readfds;
			FD_ZERO(&readfds);
			FD_SET(listen_sock, &readfds);

			struct timeval tv;
			tv.tv_sec = 1;
			tv.tv_usec = 0;

			int select_result = select(static_cast<int>(listen_sock) + 1, &readfds, NULL, NULL, &tv);

			if (select_result == -1)
			{
				if (errno == EINTR)
					continue;
				ServerLogger::logError("Select failed");
				break;
			}

			if (select_result == 0 || !FD_ISSET(listen_sock, &readfds))
			{
				continue;
			}

			SocketType client_sock = accept(listen_sock,
											reinterpret_cast<struct sockaddr *>(&client_addr),
											&sin_size);
#ifdef _WIN32
			if (client_sock == INVALID_SOCKET)
#else
			if (client_sock == -1)
#endif
			{
				ServerLogger::logError("Accept failed");
				continue;
			}

			char clientIP[INET6_ADDRSTRLEN] = {0};
			inet_ntop(client_addr.ss_family,
					  client_addr.ss_family == AF_INET ? (void *)&(((struct sockaddr_in *)&client_addr)->sin_addr) : (void *)&(((struct sockaddr_in6 *)&client_addr)->sin6_addr),
					  clientIP, sizeof(clientIP));

			ServerLogger::logInfo("New client connection from %s", clientIP);

			{
				std::lock_guard<std::mutex> lock(connectionMutex);
				++activeConnections;
			}
			try
			{
				std::thread([this, client_sock, ip = std::string(clientIP)]()
							{
					handleConnection(client_sock, ip);
					connectionFinished(); })
					.detach();
			}
			catch (const std::system_error &ex)
			{
				ServerLogger::logError("Failed to start connection thread: %s", ex.what());
				close_socket(client_sock);
				connectionFinished();
			}
		}

		ServerLogger::logInfo("Server main loop exited");
	}

	void Server::handleConnection(SocketType client_sock, const std::string &clientIP)
	{
		const size_t headerLimit = 16384;
		std::vector<char> buffer(headerLimit);
		size_t totalBytesReceived = 0;
		size_t headerEnd = std::string::npos;

		// Set socket timeout to prevent hanging
		struct timeval timeout;
		timeout.tv_sec = 30;
		timeout.tv_usec = 0;
		setsockopt(client_sock, SOL_SOCKET, SO_RCVTIMEO, (const char *)&timeout, sizeof(timeout));

		while (headerEnd == std::string::npos && totalBytesReceived < headerLimit)
		{
			auto bytesReceived = recv(client_sock, buffer.data() + totalBytesReceived,
									  static_cast<int>(headerLimit - totalBytesReceived), 0);
			if (bytesReceived <= 0)
			{
				break;
			}
			totalBytesReceived += static_cast<size_t>(bytesReceived);

			std::string received(buffer.data(), totalBytesReceived);
			headerEnd = received.find("\r\n\r\n");
		}

		if (totalBytesReceived == 0)
		{
			ServerLogger::logWarning("No data received from %s", clientIP.c_str());
			close_socket(client_sock);
			return;
		}

		std::string raw(buffer.data(), totalBytesReceived);
		if (headerEnd == std::string::npos)
		{
			ServerLogger::logWarning("Malformed or oversized request headers from %s", clientIP.c_str());
			send_error(client_sock, 400, "Bad Request");
			close_socket(client_sock);
			return;
		}

		HttpRequest request;
		std::string target;
		if (!parse_request_line(raw.substr(0, raw.find("\r\n")), request.method, target))
		{
			ServerLogger::logWarning("Malformed request line from %s", clientIP.c_str());
			send_error(client_sock, 400, "Bad Request");
			close_socket(client_sock);
			return;
		}

		size_t queryPos = target.find('?');
		request.path = target.substr(0, queryPos);
		if (queryPos != std::string::npos)
			request.query = target.substr(queryPos + 1);
		request.headers = parseHeaders(raw.substr(0, headerEnd + 4));

		ServerLogger::logInfo("Processing request %s %s from %s",
							  request.method.c_str(), request.path.c_str(), clientIP.c_str());

		size_t contentLength = 0;
		auto it = request.headers.find("content-length");
		if (it != request.headers.end())
		{
			try
			{
				contentLength = static_cast<size_t>(std::stoull(it->second));
			}
			catch (const std::exception &)
			{
				ServerLogger::logWarning("Invalid Content-Length header: %s", it->second.c_str());
				send_error(client_sock, 400, "Invalid Content-Length header");
				close_socket(client_sock);
				return;
			}
		}

		if (contentLength > maxBodyBytes)
		{
			ServerLogger::logWarning("Rejected %zu byte body from %s (limit %zu)",
									 contentLength, clientIP.c_str(), maxBodyBytes);
			send_error(client_sock, 413, "Request body too large");
			close_socket(client_sock);
			return;
		}

		request.body = raw.substr(headerEnd + 4);
		if (request.body.size() > contentLength)
		{
			request.body.resize(contentLength);
		}

		if (request.body.size() < contentLength)
		{
			size_t remaining = contentLength - request.body.size();
			std::vector<char> bodyBuffer(remaining);
			size_t totalRead = 0;
			while (totalRead < remaining)
			{
				auto bytesRead = recv(client_sock, bodyBuffer.data() + totalRead,
									  static_cast<int>(remaining - totalRead), 0);
				if (bytesRead <= 0)
				{
					break;
				}
				totalRead += static_cast<size_t>(bytesRead);
			}
			request.body.append(bodyBuffer.data(), totalRead);

			if (request.body.size() < contentLength)
			{
				ServerLogger::logWarning("Incomplete body from %s: %zu of %zu bytes",
										 clientIP.c_str(), request.body.size(), contentLength);
				send_error(client_sock, 400, "Incomplete request body");
				close_socket(client_sock);
				return;
			}
		}

		dispatch(client_sock, request);

		close_socket(client_sock);
		ServerLogger::logInfo("Completed request %s %s", request.method.c_str(), request.path.c_str());
	}

	void Server::dispatch(SocketType client_sock, const HttpRequest &request)
	{
		for (auto &route : routes)
		{
			if (!route->match(request.method, request.path))
				continue;

			try
			{
				route->handle(client_sock, request);
			}
			catch (const std::exception &ex)
			{
				ServerLogger::logError("Error in route handler for %s %s: %s",
									   request.method.c_str(), request.path.c_str(), ex.what());
				send_error(client_sock, 500, std::string("Internal error: ") + ex.what());
			}
			return;
		}

		ServerLogger::logWarning("No route found for %s %s", request.method.c_str(), request.path.c_str());
		send_error(client_sock, 404, "Not Found");
	}

	void Server::connectionFinished()
	{
		std::lock_guard<std::mutex> lock(connectionMutex);
		if (--activeConnections == 0)
		{
			connectionsDone.notify_all();
		}
	}

	void Server::waitForConnections()
	{
		std::unique_lock<std::mutex> lock(connectionMutex);
		if (activeConnections > 0)
		{
			ServerLogger::logInfo("Waiting for %d open connections to finish", activeConnections);
		}
		connectionsDone.wait(lock, [this]
							 { return activeConnections == 0; });
	}

	int Server::openConnections() const
	{
		std::lock_guard<std::mutex> lock(connectionMutex);
		return activeConnections;
	}

	void Server::stop()
	{
		if (running)
		{
			ServerLogger::logInfo("Stopping server");
			running = false;
		}
	}

} // namespace lectern
