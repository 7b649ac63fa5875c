#pragma once

#include <recordsvc/core/record_store.h>
#include <recordsvc/transport/server_config.h>
#include <recordsvc/util/logger.h>
#include "record_service.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

namespace recordsvc::transport {

/// gRPC service implementation for the RecordService.
///
/// Provides remote access to a shared RecordStore:
///   - GetRecord / CreateRecord (unary)
///   - ListRecordsStream (server streaming, paced, honours cancellation)
///   - BatchCreateRecords (client streaming, all-or-nothing commit)
///
/// The store and logger are owned by the caller and must outlive the
/// service. Every handler may run concurrently with every other one.
class RecordServiceImpl final : public RecordService::Service {
public:
    RecordServiceImpl(RecordStore& store, Logger& logger,
                      ServiceOptions options = {});

    // ── Unary RPCs ────────────────────────────────────────────────────

    grpc::Status GetRecord(grpc::ServerContext* context,
                           const GetRecordRequest* request,
                           Record* response) override;

    grpc::Status CreateRecord(grpc::ServerContext* context,
                              const CreateRecordRequest* request,
                              Record* response) override;

    // ── Streaming RPCs ────────────────────────────────────────────────

    grpc::Status ListRecordsStream(
        grpc::ServerContext* context,
        const ListRecordsRequest* request,
        grpc::ServerWriter<Record>* writer) override;

    grpc::Status BatchCreateRecords(
        grpc::ServerContext* context,
        grpc::ServerReader<CreateRecordRequest>* reader,
        BatchCreateResponse* response) override;

private:
    RecordStore&   store_;
    Logger&        logger_;
    ServiceOptions options_;
};

/// Start a gRPC server on config.address().
/// Blocks until the server is shut down.
/// Throws std::runtime_error if the port cannot be bound.
void RunServer(const ServerConfig& config, RecordStore& store, Logger& logger);

} // namespace recordsvc::transport
