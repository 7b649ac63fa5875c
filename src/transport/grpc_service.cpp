#include <recordsvc/transport/grpc_service.h>
#include <recordsvc/transport/record_codec.h>
#include <recordsvc/transport/stream_adapters.h>

#include <stdexcept>
#include <vector>

namespace recordsvc::transport {

namespace {
const char* const kComponent = "RecordService";
}

RecordServiceImpl::RecordServiceImpl(RecordStore& store, Logger& logger,
                                     ServiceOptions options)
    : store_(store), logger_(logger), options_(options) {}

// ── GetRecord ─────────────────────────────────────────────────────────────

grpc::Status RecordServiceImpl::GetRecord(
        grpc::ServerContext* /*context*/,
        const GetRecordRequest* request,
        Record* response) {
    logger_.info(kComponent,
                 "GetRecord called with ID: " + std::to_string(request->id()));

    auto record = store_.get(request->id());
    if (!record) {
        return grpc::Status(grpc::StatusCode::NOT_FOUND,
                            "Record with ID " + std::to_string(request->id()) +
                            " not found");
    }

    toProto(*record, response);
    return grpc::Status::OK;
}

// ── CreateRecord ──────────────────────────────────────────────────────────

grpc::Status RecordServiceImpl::CreateRecord(
        grpc::ServerContext* /*context*/,
        const CreateRecordRequest* request,
        Record* response) {
    logger_.info(kComponent,
                 "CreateRecord called with name: " + request->name());

    auto record = store_.create(fromProto(*request));
    toProto(record, response);
    return grpc::Status::OK;
}

// ── ListRecordsStream ─────────────────────────────────────────────────────

grpc::Status RecordServiceImpl::ListRecordsStream(
        grpc::ServerContext* context,
        const ListRecordsRequest* /*request*/,
        grpc::ServerWriter<Record>* writer) {
    auto snapshot = store_.list();
    logger_.info(kComponent, "ListRecordsStream called - streaming " +
                             std::to_string(snapshot.size()) + " record(s)");

    auto result = emitSnapshot(
        snapshot,
        [writer](const ::recordsvc::Record& record) {
            Record msg;
            toProto(record, &msg);
            return writer->Write(msg);
        },
        [context] { return context->IsCancelled(); },
        options_.stream_interval);

    if (result.outcome != StreamOutcome::Completed) {
        logger_.info(kComponent,
                     std::string("ListRecordsStream ") +
                     streamOutcomeName(result.outcome) + " after " +
                     std::to_string(result.messages) + " of " +
                     std::to_string(snapshot.size()) + " record(s)");
    }

    // A stopped stream is a normal end for the producer side.
    return grpc::Status::OK;
}

// ── BatchCreateRecords ────────────────────────────────────────────────────

grpc::Status RecordServiceImpl::BatchCreateRecords(
        grpc::ServerContext* context,
        grpc::ServerReader<CreateRecordRequest>* reader,
        BatchCreateResponse* response) {
    logger_.info(kComponent, "BatchCreateRecords called - receiving record stream");

    // Nothing reaches the store until the client half-closes.
    std::vector<::recordsvc::NewRecord> staged;

    auto result = consumeStream<CreateRecordRequest>(
        [reader](CreateRecordRequest& msg) { return reader->Read(&msg); },
        [&staged](const CreateRecordRequest& msg) {
            staged.push_back(fromProto(msg));
        },
        [context] { return context->IsCancelled(); });

    if (result.outcome != StreamOutcome::Completed) {
        logger_.warning(kComponent,
                        std::string("BatchCreateRecords ") +
                        streamOutcomeName(result.outcome) + " after " +
                        std::to_string(result.messages) +
                        " message(s); nothing created");
        return grpc::Status(grpc::StatusCode::CANCELLED,
                            "BatchCreateRecords aborted before end of input");
    }

    auto created = store_.createBatch(staged);

    response->set_created_count(static_cast<int32_t>(created.size()));
    for (const auto& record : created) {
        toProto(record, response->add_records());
        logger_.info(kComponent, "Batch created record: " + record.name +
                                 " (ID " + std::to_string(record.id) + ")");
    }
    return grpc::Status::OK;
}

// ── Server startup ────────────────────────────────────────────────────────

void RunServer(const ServerConfig& config, RecordStore& store, Logger& logger) {
    RecordServiceImpl service(store, logger, config.service);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(config.address(), grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    auto server = builder.BuildAndStart();
    if (!server) {
        throw std::runtime_error("failed to listen on " + config.address());
    }
    logger.info("Server", "RecordService listening on " + config.address());
    server->Wait();
}

} // namespace recordsvc::transport
