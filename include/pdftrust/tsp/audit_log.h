/**
 * @file audit_log.h
 * @brief Append-only timestamp audit trail
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "types.h"

namespace pdftrust::tsp {

class ITimestampAuditLog {
public:
    virtual ~ITimestampAuditLog() = default;

    virtual void append(const TimestampAuditEntry& entry) = 0;
    /// Snapshot in insertion order
    virtual std::vector<TimestampAuditEntry> entries() const = 0;
    virtual void clear() = 0;
};

/**
 * @brief Mutex-guarded in-memory audit log
 *
 * processWide() returns the instance shared by every manager that is not
 * given its own log.
 */
class InMemoryTimestampAuditLog : public ITimestampAuditLog {
public:
    void append(const TimestampAuditEntry& entry) override;
    std::vector<TimestampAuditEntry> entries() const override;
    void clear() override;

    size_t size() const;

    static std::shared_ptr<InMemoryTimestampAuditLog> processWide();

private:
    mutable std::mutex mutex_;
    std::vector<TimestampAuditEntry> entries_;
};

} // namespace pdftrust::tsp
