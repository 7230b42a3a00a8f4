#include "ledger_store.hpp"

namespace remit {

std::string applyOutcomeToString(ApplyOutcome outcome) {
  switch (outcome) {
    case ApplyOutcome::COMMITTED: return "COMMITTED";
    case ApplyOutcome::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
    case ApplyOutcome::ACCOUNT_MISSING: return "ACCOUNT_MISSING";
    case ApplyOutcome::TRANSFER_NOT_PENDING: return "TRANSFER_NOT_PENDING";
    default: return "UNKNOWN";
  }
}

}  // namespace remit
