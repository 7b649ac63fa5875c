// ═══════════════════════════════════════════════════════════════════════════
// Record gRPC Client Demo
//
// Runs one call of each RecordService pattern and prints the results.
//
// Usage:  ./record-client-demo [server-address]
//         Default: localhost:50051
// ═══════════════════════════════════════════════════════════════════════════

#include <recordsvc/serial/json_serializer.h>
#include <recordsvc/transport/grpc_client.h>

#include <iostream>
#include <string>
#include <vector>

using namespace recordsvc;
using recordsvc::transport::BatchResult;
using recordsvc::transport::RecordClient;

static void printSep(const std::string& title) {
    std::cout << "\n═══ " << title << " ";
    for (size_t i = title.size(); i < 60; i++) std::cout << "═";
    std::cout << "\n\n";
}

static void printError(const grpc::Status& status) {
    std::cout << "gRPC error " << status.error_code() << ": "
              << status.error_message() << "\n";
}

int main(int argc, char* argv[]) {
    std::string address = "localhost:50051";
    if (argc > 1) address = argv[1];

    std::cout << "Connecting to RecordService at " << address << "...\n";
    RecordClient client(address);
    bool failed = false;

    // ── GetRecord ─────────────────────────────────────────────────────
    printSep("GetRecord (1)");
    Record found;
    auto status = client.getRecord(1, found);
    if (status.ok()) {
        std::cout << JsonSerializer::toJson(found);
    } else {
        printError(status);
        failed = true;
    }

    // ── CreateRecord ──────────────────────────────────────────────────
    printSep("CreateRecord");
    Record created;
    status = client.createRecord({"Bob Johnson", "bob@example.com", 35}, created);
    if (status.ok()) {
        std::cout << JsonSerializer::toJson(created);
    } else {
        printError(status);
        failed = true;
    }

    // ── ListRecordsStream ─────────────────────────────────────────────
    printSep("ListRecordsStream");
    status = client.listRecords([](const Record& r) {
        std::cout << "  " << JsonSerializer::toJson(r, false) << "\n";
        return true;
    });
    if (!status.ok()) {
        printError(status);
        failed = true;
    }

    // ── BatchCreateRecords ────────────────────────────────────────────
    printSep("BatchCreateRecords");
    std::vector<NewRecord> batch = {
        {"Alice Brown",    "alice@example.com",   28},
        {"Charlie Wilson", "charlie@example.com", 42},
        {"Diana Prince",   "diana@example.com",   31},
    };
    BatchResult result;
    status = client.batchCreate(batch, result);
    if (status.ok()) {
        std::cout << "Created " << result.created_count << " record(s):\n"
                  << JsonSerializer::toJson(result.records);
    } else {
        printError(status);
        failed = true;
    }

    std::cout << (failed ? "\nSome calls failed.\n"
                         : "\nAll calls completed successfully.\n");
    return failed ? 1 : 0;
}
