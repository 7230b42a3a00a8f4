#include "core/audit.hpp"
#include "observability/logger.hpp"

namespace remit {
namespace core {

void emitAudit(LedgerStore& store, const std::string& operation, const std::string& username,
               const std::string& details, Timestamp timestamp) {
  try {
    store.appendAudit(AuditLogEntry{0, operation, username, details, timestamp});
  } catch (const std::exception& e) {
    LOG_BUILDER(observability::LogLevel::WARN, "Audit append failed")
        .field("operation", operation)
        .field("username", username)
        .field("error", e.what());
  }
}

}  // namespace core
}  // namespace remit
