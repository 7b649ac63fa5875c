#pragma once

#include <chrono>
#include <string>

namespace recordsvc::transport {

/// Tunables of RecordServiceImpl.
struct ServiceOptions {
    /// Pause between two ListRecordsStream messages. Zero disables it.
    std::chrono::milliseconds stream_interval{100};
};

/// Settings of the record-server executable.
struct ServerConfig {
    int            port = 50051;
    std::string    seed_file;        // optional JSON seed, empty = none
    ServiceOptions service;

    /// Listening address, e.g. "0.0.0.0:50051".
    std::string address() const;
};

/// Parse `record-server [port] [stream-interval-ms] [seed-file]`.
/// Omitted arguments keep their defaults.
/// Throws std::invalid_argument on a malformed or out-of-range number
/// or on extra arguments.
ServerConfig parseServerArgs(int argc, const char* const argv[]);

/// One-line usage text for the server executable.
std::string serverUsage(const std::string& program);

} // namespace recordsvc::transport
