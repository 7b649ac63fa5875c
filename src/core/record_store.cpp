#include <recordsvc/core/record_store.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace recordsvc {

RecordStore::RecordStore(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return formatUtc(std::chrono::system_clock::now()); };
    }
}

// ── Lookup ────────────────────────────────────────────────────────────────

std::optional<Record> RecordStore::get(std::int32_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    // Ids are strictly increasing, so the sequence is sorted by id.
    auto it = std::lower_bound(
        records_.begin(), records_.end(), id,
        [](const Record& r, std::int32_t value) { return r.id < value; });
    if (it == records_.end() || it->id != id) {
        return std::nullopt;
    }
    return *it;
}

std::vector<Record> RecordStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

size_t RecordStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::int32_t RecordStore::nextId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextId_;
}

// ── Mutation ──────────────────────────────────────────────────────────────

Record RecordStore::create(const NewRecord& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    return appendLocked(request);
}

std::vector<Record> RecordStore::createBatch(
        const std::vector<NewRecord>& requests) {
    std::vector<Record> created;
    created.reserve(requests.size());

    std::lock_guard<std::mutex> lock(mutex_);
    records_.reserve(records_.size() + requests.size());
    for (const auto& req : requests) {
        created.push_back(appendLocked(req));
    }
    return created;
}

void RecordStore::seedDefaults() {
    createBatch({
        {"John Doe",   "john@example.com", 30},
        {"Jane Smith", "jane@example.com", 25},
    });
}

Record RecordStore::appendLocked(const NewRecord& request) {
    Record rec;
    rec.id                = nextId_++;
    rec.name              = request.name;
    rec.contact           = request.contact;
    rec.numeric_attribute = request.numeric_attribute;
    rec.created_at        = clock_();
    records_.push_back(rec);
    return rec;
}

// ── Helpers ───────────────────────────────────────────────────────────────

std::string RecordStore::formatUtc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

} // namespace recordsvc
