#pragma once

#include "batchsync/ledger/v1/ledger.pb.h"

namespace batchsync::model {

using Phase = batchsync::ledger::v1::Phase;

constexpr bool IsTerminal(Phase phase) {
  return phase == batchsync::ledger::v1::PHASE_COMPLETED || phase == batchsync::ledger::v1::PHASE_FAILED;
}

/*
  Per (run, batch) ordering:

      STARTED → FILE_COPIED* → VERIFIED → COMPLETED
                     ↘            ↘
                          FAILED

  STARTED is only valid as the first record of a transaction.
*/
constexpr bool CanTransition(Phase from, Phase to) {
  using namespace batchsync::ledger::v1;

  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case PHASE_STARTED:
      return from == PHASE_UNSPECIFIED;
    case PHASE_FILE_COPIED:
      return from == PHASE_STARTED || from == PHASE_FILE_COPIED;
    case PHASE_VERIFIED:
      return from == PHASE_STARTED || from == PHASE_FILE_COPIED;
    case PHASE_COMPLETED:
      return from == PHASE_VERIFIED;
    case PHASE_FAILED:
      return from != PHASE_UNSPECIFIED;
    default:
      return false;
  }
}

inline const char* PhaseName(Phase phase) {
  using namespace batchsync::ledger::v1;

  switch (phase) {
    case PHASE_STARTED:
      return "started";
    case PHASE_FILE_COPIED:
      return "file-copied";
    case PHASE_VERIFIED:
      return "verified";
    case PHASE_COMPLETED:
      return "completed";
    case PHASE_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

} // namespace batchsync::model
