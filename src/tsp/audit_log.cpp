/**
 * @file audit_log.cpp
 * @brief In-memory audit log implementation
 */

#include "pdftrust/tsp/audit_log.h"

namespace pdftrust::tsp {

void InMemoryTimestampAuditLog::append(const TimestampAuditEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
}

std::vector<TimestampAuditEntry> InMemoryTimestampAuditLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

void InMemoryTimestampAuditLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t InMemoryTimestampAuditLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::shared_ptr<InMemoryTimestampAuditLog> InMemoryTimestampAuditLog::processWide() {
    static std::shared_ptr<InMemoryTimestampAuditLog> instance = std::make_shared<InMemoryTimestampAuditLog>();
    return instance;
}

} // namespace pdftrust::tsp
