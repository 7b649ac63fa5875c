#include <recordsvc/transport/record_codec.h>

namespace recordsvc::transport {

void toProto(const ::recordsvc::Record& record, Record* out) {
    out->set_id(record.id);
    out->set_name(record.name);
    out->set_contact(record.contact);
    out->set_numeric_attribute(record.numeric_attribute);
    out->set_created_at(record.created_at);
}

::recordsvc::Record fromProto(const Record& msg) {
    ::recordsvc::Record record;
    record.id                = msg.id();
    record.name              = msg.name();
    record.contact           = msg.contact();
    record.numeric_attribute = msg.numeric_attribute();
    record.created_at        = msg.created_at();
    return record;
}

void toProto(const ::recordsvc::NewRecord& request, CreateRecordRequest* out) {
    out->set_name(request.name);
    out->set_contact(request.contact);
    out->set_numeric_attribute(request.numeric_attribute);
}

::recordsvc::NewRecord fromProto(const CreateRecordRequest& msg) {
    ::recordsvc::NewRecord request;
    request.name              = msg.name();
    request.contact           = msg.contact();
    request.numeric_attribute = msg.numeric_attribute();
    return request;
}

} // namespace recordsvc::transport
