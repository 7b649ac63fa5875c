#pragma once

#include <recordsvc/core/record.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace recordsvc {

/// Append-only, in-memory record store shared by every RPC call.
///
/// All access goes through one mutex: id allocation and append happen in
/// the same critical section, and list() copies the sequence under that
/// lock, so a listing never observes a half-applied create.
///
/// Example:
///   RecordStore store;
///   store.seedDefaults();                       // ids 1 and 2
///   auto rec = store.create({"X", "x@e", 30});  // rec.id == 3
///   auto hit = store.get(3);                    // hit->name == "X"
///   auto all = store.list();                    // ids {1, 2, 3}
class RecordStore {
public:
    /// Produces the `created_at` stamp for a new record.
    using Clock = std::function<std::string()>;

    /// If no clock is given, records are stamped with the current UTC time.
    explicit RecordStore(Clock clock = nullptr);

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    /// Look up a record by id. Empty if no record has that id.
    std::optional<Record> get(std::int32_t id) const;

    /// Allocate the next id, stamp the creation time and append.
    Record create(const NewRecord& request);

    /// Create several records under a single lock acquisition.
    /// The returned records have contiguous ids in input order.
    std::vector<Record> createBatch(const std::vector<NewRecord>& requests);

    /// Snapshot of all records in insertion order.
    std::vector<Record> list() const;

    size_t size() const;

    /// Id the next create() will assign.
    std::int32_t nextId() const;

    /// Append the two fixed startup records (John Doe, Jane Smith).
    void seedDefaults();

    /// Format a time point as YYYY-MM-DDTHH:MM:SSZ.
    static std::string formatUtc(std::chrono::system_clock::time_point tp);

private:
    Record appendLocked(const NewRecord& request);

    Clock                clock_;
    mutable std::mutex   mutex_;
    std::vector<Record>  records_;
    std::int32_t         nextId_ = 1;
};

} // namespace recordsvc
