#pragma once

#include <recordsvc/core/record.h>
#include "record_service.pb.h"

namespace recordsvc::transport {

// Conversions between the store's structs and the protobuf messages.
// The core types are spelled ::recordsvc::Record here because the
// generated message of the same name lives in this namespace.

void toProto(const ::recordsvc::Record& record, Record* out);

::recordsvc::Record fromProto(const Record& msg);

void toProto(const ::recordsvc::NewRecord& request, CreateRecordRequest* out);

::recordsvc::NewRecord fromProto(const CreateRecordRequest& msg);

} // namespace recordsvc::transport
