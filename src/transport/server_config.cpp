#include <recordsvc/transport/server_config.h>

#include <stdexcept>

namespace recordsvc::transport {

namespace {

long parseNumber(const std::string& text, const char* what,
                 long minValue, long maxValue) {
    size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("invalid ") + what +
                                    ": '" + text + "'");
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(std::string("invalid ") + what +
                                    ": '" + text + "'");
    }
    if (value < minValue || value > maxValue) {
        throw std::invalid_argument(std::string(what) + " out of range: " +
                                    text);
    }
    return value;
}

} // namespace

std::string ServerConfig::address() const {
    return "0.0.0.0:" + std::to_string(port);
}

ServerConfig parseServerArgs(int argc, const char* const argv[]) {
    ServerConfig config;

    if (argc > 4) {
        throw std::invalid_argument("too many arguments");
    }
    if (argc > 1) {
        config.port = static_cast<int>(parseNumber(argv[1], "port", 0, 65535));
    }
    if (argc > 2) {
        config.service.stream_interval = std::chrono::milliseconds(
            parseNumber(argv[2], "stream interval", 0, 60000));
    }
    if (argc > 3) {
        config.seed_file = argv[3];
    }
    return config;
}

std::string serverUsage(const std::string& program) {
    return "Usage: " + program + " [port] [stream-interval-ms] [seed-file]";
}

} // namespace recordsvc::transport
