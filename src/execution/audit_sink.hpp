#pragma once

#include <cstdint>
#include <string>

#include "utils/logging.hpp"

namespace codebox::execution {

struct AuditEntry {
    std::string language;
    bool success = false;
    std::int64_t execution_time_ms = 0;
    std::string status;
    std::string error;  // truncated, empty on success
};

class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void Record(const AuditEntry& entry) = 0;
};

class LogAuditSink : public AuditSink {
public:
    explicit LogAuditSink(utils::LogConfig config = {});

    void Record(const AuditEntry& entry) override;

    static utils::LogMessage ToLogMessage(const AuditEntry& entry);

private:
    utils::LogConfig config_;
};

}  // namespace codebox::execution
