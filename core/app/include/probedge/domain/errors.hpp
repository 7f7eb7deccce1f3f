#pragma once

#include <stdexcept>
#include <string>

namespace probedge {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// Policy rejections (edge, confidence, liquidity, exposure, drawdown) are NOT
// errors and never travel as exceptions; they are RejectReason values. The
// types below cover everything else:
//
//   CollaboratorError  - a market data, model or persistence call failed
//                        (network, timeout, remote error). Retried at most
//                        once per market by the coordinator.
//   InputError         - a collaborator returned structurally invalid data
//                        (price outside [0,1], missing end date, id
//                        mismatch). Fails that market only, never retried.
//   ConfigError        - the configuration file is unreadable or holds an
//                        out-of-range value. Raised at startup.
//   InvariantViolation - a commit would break a ledger invariant (negative
//                        size, exposure above the cap). Fatal to the
//                        pipeline; the ledger refuses the commit before
//                        touching state.
// -----------------------------------------------------------------------------

class CollaboratorError : public std::runtime_error {
 public:
  explicit CollaboratorError(const std::string& what)
      : std::runtime_error(what) {}
};

class InputError : public std::runtime_error {
 public:
  explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& what)
      : std::logic_error(what) {}
};

}  // namespace probedge
