#include "test_common.h"
#include "lectern/server_config.hpp"
#include <fstream>

using lectern::ServerConfig;

namespace {

bool load_args(ServerConfig &config, std::vector<std::string> args) {
    args.insert(args.begin(), "lectern-server");
    std::vector<char *> argv;
    for (auto &a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return config.loadFromArgs(static_cast<int>(args.size()), argv.data());
}

void write_file(const std::filesystem::path &path, const std::string &content) {
    std::ofstream out(path);
    out << content;
}

} // namespace

int main() {
    int failures = 0;
    auto dir = make_temp_dir("lectern_config_test");
    const auto yamlPath = dir / "config.yaml";

    // defaults
    {
        ServerConfig config;
        CHECK(config.port == "8080");
        CHECK(config.maxChunkSize == 2000);
        CHECK(config.sessionIdleTimeout == std::chrono::seconds(3600));
        CHECK(config.synthesis.voice == "en-US-AriaNeural");
        CHECK(config.synthesis.rate == "+0%");
        CHECK(config.validate());
    }

    write_file(yamlPath,
               "server:\n"
               "  port: \"9090\"\n"
               "  host: 127.0.0.1\n"
               "  max_upload_bytes: 1048576\n"
               "logging:\n"
               "  level: DEBUG\n"
               "  quiet_mode: true\n"
               "chunking:\n"
               "  max_chunk_size: 500\n"
               "sessions:\n"
               "  idle_timeout: 120\n"
               "  max_sessions: 16\n"
               "synthesis:\n"
               "  url: http://tts.local:5050/v1/audio/speech\n"
               "  voice: en-GB-SoniaNeural\n"
               "  rate: \"+20%\"\n"
               "  volume: \"-10%\"\n"
               "  format: ogg\n"
               "  timeout: 15\n"
               "  api_key: secret-key\n"
               "upload:\n"
               "  temp_dir: /tmp/lectern-uploads\n");

    {
        ServerConfig config;
        CHECK(config.loadFromFile(yamlPath.string()));
        CHECK(config.port == "9090");
        CHECK(config.host == "127.0.0.1");
        CHECK(config.maxUploadBytes == 1048576);
        CHECK(config.logLevel == "DEBUG");
        CHECK(config.quietMode);
        CHECK(config.maxChunkSize == 500);
        CHECK(config.sessionIdleTimeout == std::chrono::seconds(120));
        CHECK(config.maxSessions == 16);
        CHECK(config.synthesis.url == "http://tts.local:5050/v1/audio/speech");
        CHECK(config.synthesis.voice == "en-GB-SoniaNeural");
        CHECK(config.synthesis.rate == "+20%");
        CHECK(config.synthesis.volume == "-10%");
        CHECK(config.synthesis.format == "ogg");
        CHECK(config.synthesis.timeout == 15);
        CHECK(config.synthesis.apiKey == "secret-key");
        CHECK(config.tempDir == "/tmp/lectern-uploads");
    }

    // command line overrides the named file
    {
        ServerConfig config;
        CHECK(load_args(config, {"-c", yamlPath.string(), "--port", "7000", "--max-chunk-size", "42",
                                 "--session-timeout", "0", "--voice", "en-US-GuyNeural", "--quiet"}));
        CHECK(config.port == "7000");
        CHECK(config.maxChunkSize == 42);
        CHECK(config.sessionIdleTimeout == std::chrono::seconds(0));
        CHECK(config.synthesis.voice == "en-US-GuyNeural");
        CHECK(config.synthesis.rate == "+20%");
        CHECK(config.getCurrentConfigFilePath().find("config.yaml") != std::string::npos);
    }

    {
        ServerConfig config;
        CHECK(!load_args(config, {"-c", yamlPath.string(), "--bogus"}));
        CHECK(!config.helpOrVersionShown);
    }
    {
        ServerConfig config;
        CHECK(!load_args(config, {"-c", yamlPath.string(), "--max-chunk-size", "many"}));
    }
    {
        ServerConfig config;
        CHECK(!load_args(config, {"-c", yamlPath.string(), "--help"}));
        CHECK(config.helpOrVersionShown);
    }
    {
        ServerConfig config;
        CHECK(!load_args(config, {"-c", (dir / "missing.yaml").string()}));
    }

    // validation
    {
        ServerConfig config;
        config.maxChunkSize = 0;
        CHECK(!config.validate());
    }
    {
        ServerConfig config;
        config.port = "";
        CHECK(!config.validate());
        config.port = "70000";
        CHECK(!config.validate());
    }
    {
        ServerConfig config;
        config.sessionIdleTimeout = std::chrono::seconds(-5);
        CHECK(!config.validate());
    }
    {
        ServerConfig config;
        config.synthesis.rate = "+150%";
        CHECK(!config.validate());
        config.synthesis.rate = "fast";
        CHECK(!config.validate());
        config.synthesis.rate = "-100%";
        CHECK(config.validate());
        config.synthesis.volume = "10";
        CHECK(!config.validate());
    }
    {
        ServerConfig config;
        config.logLevel = "LOUD";
        CHECK(!config.validate());
        config.logLevel = "warn";
        CHECK(config.validate());
    }

    // malformed YAML is reported, not thrown
    {
        write_file(dir / "broken.yaml", "server: [unterminated\n");
        ServerConfig config;
        CHECK(!config.loadFromFile((dir / "broken.yaml").string()));
    }

    // saved settings load back
    {
        ServerConfig config;
        config.port = "8181";
        config.maxSessions = 3;
        config.synthesis.volume = "+5%";
        config.synthesis.apiKey = "token";
        const auto saved = dir / "saved.yaml";
        CHECK(config.saveToFile(saved.string()));
        ServerConfig reloaded;
        CHECK(reloaded.loadFromFile(saved.string()));
        CHECK(reloaded.port == "8181");
        CHECK(reloaded.maxSessions == 3);
        CHECK(reloaded.synthesis.volume == "+5%");
        CHECK(reloaded.synthesis.apiKey == "token");
    }

    std::filesystem::remove_all(dir);
    return report("server_config", failures);
}
