#ifndef AUDIT_HPP_
#define AUDIT_HPP_

#include "ledger_store.hpp"

#include <string>

namespace remit {
namespace core {

/**
 * Appends one audit entry. Fire-and-forget: a store failure is logged and
 * swallowed so that auditing never changes the outcome being audited.
 */
void emitAudit(LedgerStore& store, const std::string& operation, const std::string& username,
               const std::string& details, Timestamp timestamp);

}  // namespace core
}  // namespace remit

#endif  // AUDIT_HPP_
