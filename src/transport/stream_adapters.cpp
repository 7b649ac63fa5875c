#include <recordsvc/transport/stream_adapters.h>

namespace recordsvc::transport {

const char* streamOutcomeName(StreamOutcome outcome) {
    switch (outcome) {
        case StreamOutcome::Completed: return "completed";
        case StreamOutcome::Cancelled: return "cancelled";
        case StreamOutcome::Aborted:   return "aborted";
    }
    return "unknown";
}

} // namespace recordsvc::transport
