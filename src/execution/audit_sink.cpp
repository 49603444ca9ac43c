#include "execution/audit_sink.hpp"

namespace codebox::execution {

LogAuditSink::LogAuditSink(utils::LogConfig config)
    : config_(config) {}

utils::LogMessage LogAuditSink::ToLogMessage(const AuditEntry& entry) {
    utils::LogMessage msg{};
    msg.tag = "audit";
    msg.level = entry.success ? utils::LogLevel::kInfo : utils::LogLevel::kWarn;
    msg.message = entry.success ? "CODE_EXECUTION_SUCCESS" : "CODE_EXECUTION_FAILURE";
    msg.fields["language"] = entry.language;
    msg.fields["status"] = entry.status;
    msg.fields["time_ms"] = std::to_string(entry.execution_time_ms);
    if (!entry.success && !entry.error.empty()) {
        std::string error = entry.error;
        for (auto& c : error) {
            if (c == '\n' || c == '\r') {
                c = ' ';
            }
        }
        msg.fields["error"] = "\"" + error + "\"";
    }
    return msg;
}

void LogAuditSink::Record(const AuditEntry& entry) {
    utils::Log(config_, ToLogMessage(entry));
}

}  // namespace codebox::execution
