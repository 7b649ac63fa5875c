// ═══════════════════════════════════════════════════════════════════════════
// Record gRPC Server
//
// Starts a gRPC server exposing the in-memory record store.
//
// Usage:  ./record-server [port] [stream-interval-ms] [seed-file]
//         Defaults: port=50051, stream-interval-ms=100, no seed file
// ═══════════════════════════════════════════════════════════════════════════

#include <recordsvc/core/record_store.h>
#include <recordsvc/serial/json_serializer.h>
#include <recordsvc/transport/grpc_service.h>
#include <recordsvc/transport/server_config.h>
#include <recordsvc/util/logger.h>

#include <iostream>
#include <stdexcept>
#include <string>

using namespace recordsvc;
using namespace recordsvc::transport;

int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = parseServerArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << serverUsage(argv[0]) << "\n";
        return 1;
    }

    Logger logger;
    RecordStore store;
    store.seedDefaults();

    if (!config.seed_file.empty()) {
        try {
            auto seed = JsonSerializer::loadSeedFile(config.seed_file);
            store.createBatch(seed);
            logger.info("Server", "Loaded " + std::to_string(seed.size()) +
                                  " record(s) from " + config.seed_file);
        } catch (const std::exception& e) {
            logger.error("Server", "Seed file " + config.seed_file + ": " +
                                   e.what());
            return 1;
        }
    }

    logger.info("Server", "Store holds " + std::to_string(store.size()) +
                          " record(s), stream interval " +
                          std::to_string(config.service.stream_interval.count()) +
                          "ms");

    try {
        RunServer(config, store, logger);
    } catch (const std::runtime_error& e) {
        logger.error("Server", e.what());
        return 1;
    }
    return 0;
}
