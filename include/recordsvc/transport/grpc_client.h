#pragma once

#include <recordsvc/core/record.h>
#include "record_service.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace recordsvc::transport {

/// Result of a BatchCreateRecords call.
struct BatchResult {
    int32_t                           created_count = 0;
    std::vector<::recordsvc::Record>  records;
};

/// Client wrapper for the RecordService gRPC service.
///
/// Every call returns the RPC status; outputs are only meaningful when
/// the status is OK.
///
/// Example usage:
///   RecordClient client("localhost:50051");
///
///   recordsvc::Record rec;
///   auto status = client.getRecord(1, rec);
///   if (status.error_code() == grpc::StatusCode::NOT_FOUND) { ... }
///
///   // Stop after the first two records
///   int seen = 0;
///   client.listRecords([&](const recordsvc::Record&) { return ++seen < 2; });
class RecordClient {
public:
    /// Connect to a gRPC server at the given address.
    explicit RecordClient(const std::string& address);

    /// Connect using an existing channel (useful for testing).
    explicit RecordClient(std::shared_ptr<grpc::Channel> channel);

    // ── Unary ─────────────────────────────────────────────────────────

    grpc::Status getRecord(int32_t id, ::recordsvc::Record& out);

    grpc::Status createRecord(const ::recordsvc::NewRecord& request,
                              ::recordsvc::Record& out);

    // ── Streaming ─────────────────────────────────────────────────────

    /// Called for each streamed record. Return false to cancel the call.
    using RecordCallback = std::function<bool(const ::recordsvc::Record&)>;

    /// Receive the server's record stream. If the callback asks to stop,
    /// the call is cancelled and the returned status is CANCELLED.
    grpc::Status listRecords(const RecordCallback& onRecord);

    /// Send all requests on one client stream, then wait for the reply.
    grpc::Status batchCreate(const std::vector<::recordsvc::NewRecord>& requests,
                             BatchResult& out);

private:
    std::unique_ptr<RecordService::Stub> stub_;
};

} // namespace recordsvc::transport
