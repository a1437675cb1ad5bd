#include "test_common.h"
#include "lectern/synthesis/http_speech_synthesizer.hpp"
#include "lectern/errors.hpp"
#include "lectern/logger.hpp"
#include <json.hpp>
#include <cctype>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace lectern;
using lectern::synthesis::HttpSpeechSynthesizer;
using json = nlohmann::json;

namespace {

// Accepts one connection on 127.0.0.1, records the request and answers with a canned reply.
class CannedSpeechService {
public:
    CannedSpeechService(int status, std::string body, std::string contentType = "audio/mpeg")
        : status_(status), body_(std::move(body)), contentType_(std::move(contentType)) {
        listen_ = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (listen_ < 0 || bind(listen_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
            listen(listen_, 1) != 0 || getsockname(listen_, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
            std::cerr << "[TEST] could not open loopback listener\n";
            return;
        }
        port_ = ntohs(addr.sin_port);
        worker_ = std::thread([this]() { serveOne(); });
    }

    ~CannedSpeechService() {
        finish();
        if (listen_ >= 0) close(listen_);
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_) + "/v1/audio/speech"; }

    // Joins the worker; request fields are safe to read afterwards.
    void finish() {
        if (worker_.joinable()) worker_.join();
    }

    std::string requestHead;
    std::string requestBody;

private:
    void serveOne() {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(listen_, &readfds);
        timeval tv{10, 0};
        if (select(listen_ + 1, &readfds, nullptr, nullptr, &tv) <= 0) return;

        int client = accept(listen_, nullptr, nullptr);
        if (client < 0) return;

        std::string raw;
        char buf[4096];
        size_t headEnd = std::string::npos;
        ssize_t n;
        while (headEnd == std::string::npos && (n = recv(client, buf, sizeof(buf), 0)) > 0) {
            raw.append(buf, static_cast<size_t>(n));
            headEnd = raw.find("\r\n\r\n");
        }
        if (headEnd != std::string::npos) {
            requestHead = raw.substr(0, headEnd);
            size_t length = 0;
            std::string lowerHead = requestHead;
            for (auto &c : lowerHead) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            size_t pos = lowerHead.find("content-length:");
            if (pos != std::string::npos) length = std::stoul(requestHead.substr(pos + 15));
            requestBody = raw.substr(headEnd + 4);
            while (requestBody.size() < length && (n = recv(client, buf, sizeof(buf), 0)) > 0) {
                requestBody.append(buf, static_cast<size_t>(n));
            }
        }

        std::string reply = "HTTP/1.1 " + std::to_string(status_) + " Canned\r\n"
                            "Content-Type: " + contentType_ + "\r\n"
                            "Content-Length: " + std::to_string(body_.size()) + "\r\n"
                            "Connection: close\r\n\r\n" + body_;
        send(client, reply.data(), reply.size(), 0);
        close(client);
    }

    int status_;
    std::string body_;
    std::string contentType_;
    int listen_ = -1;
    int port_ = 0;
    std::thread worker_;
};

HttpSpeechSynthesizer::Config config_for(const CannedSpeechService &service) {
    HttpSpeechSynthesizer::Config config;
    config.url = service.url();
    config.timeout = 5;
    return config;
}

// Message of the SynthesisFailed thrown by synthesize(), empty when something else happened.
std::string failure_message(HttpSpeechSynthesizer &synth, const synthesis::SynthesisRequest &request) {
    try {
        synth.synthesize(request);
    } catch (const SynthesisFailed &e) {
        return e.what();
    } catch (const std::exception &) {
    }
    return "";
}

} // namespace

int main() {
    int failures = 0;
    ServerLogger::instance().setLevel(LogLevel::SERVER_ERROR);

    synthesis::SynthesisRequest request;
    request.text = "Hello there.";
    request.voice = "en-GB-SoniaNeural";
    request.rate = "+10%";
    request.volume = "-5%";
    request.format = "wav";

    // audio comes back byte for byte; the request carries the voice settings as JSON
    {
        const std::string audio("ID3\0\x01\xff" "frames", 12);
        CannedSpeechService service(200, audio);
        auto config = config_for(service);
        config.apiKey = "secret-token";
        HttpSpeechSynthesizer synth(config);

        CHECK(synth.synthesize(request) == audio);
        service.finish();

        CHECK(service.requestHead.rfind("POST /v1/audio/speech HTTP/1.1", 0) == 0);
        CHECK(service.requestHead.find("Content-Type: application/json") != std::string::npos);
        CHECK(service.requestHead.find("Authorization: Bearer secret-token") != std::string::npos);
        auto body = json::parse(service.requestBody);
        CHECK(body["input"] == "Hello there.");
        CHECK(body["voice"] == "en-GB-SoniaNeural");
        CHECK(body["rate"] == "+10%");
        CHECK(body["volume"] == "-5%");
        CHECK(body["response_format"] == "wav");
    }

    // no key, no authorization header
    {
        CannedSpeechService service(200, "audio");
        HttpSpeechSynthesizer synth(config_for(service));
        CHECK(synth.synthesize(request) == "audio");
        service.finish();
        CHECK(service.requestHead.find("Authorization") == std::string::npos);
    }

    // error status with a {"detail"} body
    {
        CannedSpeechService service(500, R"({"detail": "voice not installed"})", "application/json");
        HttpSpeechSynthesizer synth(config_for(service));
        auto message = failure_message(synth, request);
        CHECK(message.find("HTTP error 500") != std::string::npos);
        CHECK(message.find("voice not installed") != std::string::npos);
    }

    // error status with an {"error": {"message"}} body
    {
        CannedSpeechService service(429, R"({"error": {"message": "slow down", "type": "rate_limit"}})", "application/json");
        HttpSpeechSynthesizer synth(config_for(service));
        auto message = failure_message(synth, request);
        CHECK(message.find("HTTP error 429") != std::string::npos);
        CHECK(message.find("slow down") != std::string::npos);
        CHECK(message.find("rate_limit") == std::string::npos);
    }

    // error status with a plain text body
    {
        CannedSpeechService service(503, "warming up", "text/plain");
        HttpSpeechSynthesizer synth(config_for(service));
        CHECK(failure_message(synth, request) == "HTTP error 503: warming up");
    }

    // success without audio
    {
        CannedSpeechService service(200, "");
        HttpSpeechSynthesizer synth(config_for(service));
        CHECK(failure_message(synth, request) == "Speech service returned no audio");
    }

    // nothing listens on port 1
    {
        HttpSpeechSynthesizer::Config config;
        config.url = "http://127.0.0.1:1/v1/audio/speech";
        config.timeout = 5;
        HttpSpeechSynthesizer synth(config);
        CHECK(synth.config().url == config.url);
        CHECK(failure_message(synth, request).rfind("CURL error", 0) == 0);
    }

    // input is rejected before any request is made
    {
        HttpSpeechSynthesizer::Config config;
        config.url = "http://127.0.0.1:1/v1/audio/speech";
        HttpSpeechSynthesizer synth(config);
        synthesis::SynthesisRequest bad;
        bad.text = "   ";
        CHECK_THROWS(synth.synthesize(bad), ValidationError);
        bad.text = "Hello.";
        bad.rate = "+250%";
        CHECK_THROWS(synth.synthesize(bad), ValidationError);
    }

    return report("http_synthesizer", failures);
}
