#include <recordsvc/transport/grpc_client.h>
#include <recordsvc/transport/record_codec.h>

namespace recordsvc::transport {

RecordClient::RecordClient(const std::string& address)
    : stub_(RecordService::NewStub(
          grpc::CreateChannel(address, grpc::InsecureChannelCredentials()))) {}

RecordClient::RecordClient(std::shared_ptr<grpc::Channel> channel)
    : stub_(RecordService::NewStub(channel)) {}

// ── GetRecord ─────────────────────────────────────────────────────────────

grpc::Status RecordClient::getRecord(int32_t id, ::recordsvc::Record& out) {
    GetRecordRequest req;
    req.set_id(id);

    Record resp;
    grpc::ClientContext ctx;
    auto status = stub_->GetRecord(&ctx, req, &resp);

    if (status.ok()) {
        out = fromProto(resp);
    }
    return status;
}

// ── CreateRecord ──────────────────────────────────────────────────────────

grpc::Status RecordClient::createRecord(const ::recordsvc::NewRecord& request,
                                        ::recordsvc::Record& out) {
    CreateRecordRequest req;
    toProto(request, &req);

    Record resp;
    grpc::ClientContext ctx;
    auto status = stub_->CreateRecord(&ctx, req, &resp);

    if (status.ok()) {
        out = fromProto(resp);
    }
    return status;
}

// ── ListRecordsStream ─────────────────────────────────────────────────────

grpc::Status RecordClient::listRecords(const RecordCallback& onRecord) {
    grpc::ClientContext ctx;
    auto reader = stub_->ListRecordsStream(&ctx, ListRecordsRequest());

    // After a cancel, keep reading (and discarding) until the stream
    // reports its end so Finish() does not block.
    Record msg;
    bool stopped = false;
    while (reader->Read(&msg)) {
        if (!stopped && !onRecord(fromProto(msg))) {
            ctx.TryCancel();
            stopped = true;
        }
    }
    return reader->Finish();
}

// ── BatchCreateRecords ────────────────────────────────────────────────────

grpc::Status RecordClient::batchCreate(
        const std::vector<::recordsvc::NewRecord>& requests,
        BatchResult& out) {
    grpc::ClientContext ctx;
    BatchCreateResponse resp;
    auto writer = stub_->BatchCreateRecords(&ctx, &resp);

    for (const auto& request : requests) {
        CreateRecordRequest req;
        toProto(request, &req);
        if (!writer->Write(req)) {
            break;   // stream is broken; Finish() reports why
        }
    }
    writer->WritesDone();

    auto status = writer->Finish();
    if (status.ok()) {
        out.created_count = resp.created_count();
        out.records.clear();
        for (const auto& r : resp.records()) {
            out.records.push_back(fromProto(r));
        }
    }
    return status;
}

} // namespace recordsvc::transport
