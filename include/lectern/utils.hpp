#pragma once

#include "export.hpp"

#include <json.hpp>
#include <string>
#include <sstream>
#include <map>
#include <vector>
#include <stdexcept>
#include <cstring>
#include <algorithm>
#include <cctype>

#ifdef _WIN32
#include <winsock2.h>
using SocketType = SOCKET;
#else
#include <sys/socket.h>
#include <unistd.h>
using SocketType = int;
#endif

// Get standard status text for HTTP status code
inline std::string get_status_text(int status_code) {
    switch (status_code) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 415: return "Unsupported Media Type";
    case 422: return "Unprocessable Entity";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    default:  return "Error";
    }
}

// Writes the whole buffer, retrying on short writes. Returns false if the peer went away.
inline bool send_all(SocketType sock, const char* data, size_t length) {
    size_t sent = 0;
    while (sent < length) {
#ifdef _WIN32
        int n = send(sock, data + sent, static_cast<int>(length - sent), 0);
#elif defined(MSG_NOSIGNAL)
        ssize_t n = send(sock, data + sent, length - sent, MSG_NOSIGNAL);
#else
        ssize_t n = send(sock, data + sent, length - sent, 0);
#endif
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

// Regular response helper with support for custom headers. The body may be binary.
inline bool send_response(
    SocketType sock,
    int status_code,
    const std::string& body,
    const std::map<std::string, std::string>& headers = { {"Content-Type", "application/json"} }) {

    std::ostringstream response;
    response << "HTTP/1.1 " << status_code << " " << get_status_text(status_code) << "\r\n";
    response << "Content-Length: " << body.size() << "\r\n";
    response << "Connection: close\r\n";

    for (const auto& [name, value] : headers) {
        response << name << ": " << value << "\r\n";
    }

    response << "\r\n";
    response << body;

    const std::string payload = response.str();
    return send_all(sock, payload.data(), payload.size());
}

// Error body shape shared by every route: {"detail": "..."}
inline bool send_error(SocketType sock, int status_code, const std::string& detail) {
    nlohmann::json body = { {"detail", detail} };
    return send_response(sock, status_code, body.dump());
}

inline bool send_json(SocketType sock, int status_code, const nlohmann::json& body) {
    return send_response(sock, status_code, body.dump());
}

// ASCII lower-casing; bytes outside ASCII are left alone.
inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Splits "/a/b/c" into {"a","b","c"}; empty segments are dropped.
inline std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

// Percent-decodes a URL path segment. '+' is left alone (it only means space in query strings).
inline std::string url_decode(const std::string& encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c == '%' && i + 2 < encoded.size()) {
            auto hex = [](char h) -> int {
                if (h >= '0' && h <= '9') return h - '0';
                if (h >= 'a' && h <= 'f') return h - 'a' + 10;
                if (h >= 'A' && h <= 'F') return h - 'A' + 10;
                return -1;
            };
            int hi = hex(encoded[i + 1]);
            int lo = hex(encoded[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        decoded += c;
    }
    return decoded;
}

// Base64 decoding; whitespace is ignored, any other non-alphabet character throws.
inline std::vector<unsigned char> base64_decode(const std::string& encoded) {
    static const unsigned char table[256] = {
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 62, 64, 64, 64, 63,
        52, 53, 54, 55, 56, 57, 58, 59, 60, 61, 64, 64, 64, 64, 64, 64,
        64, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14,
        15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, 64, 64, 64, 64, 64,
        64, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40,
        41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64};

    std::vector<unsigned char> decoded;
    decoded.reserve((encoded.size() * 3) / 4);

    unsigned int buffer = 0;
    int bits_collected = 0;
    bool padding = false;

    for (char c : encoded) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            continue;
        }
        if (c == '=') {
            padding = true;
            continue;
        }
        if (padding) {
            throw std::invalid_argument("Invalid base64 padding");
        }
        unsigned char value = table[static_cast<unsigned char>(c)];
        if (value == 64) {
            throw std::invalid_argument("Invalid base64 character");
        }

        buffer = (buffer << 6) | value;
        bits_collected += 6;

        if (bits_collected >= 8) {
            decoded.push_back(static_cast<unsigned char>((buffer >> (bits_collected - 8)) & 0xFF));
            bits_collected -= 8;
        }
    }

    return decoded;
}
