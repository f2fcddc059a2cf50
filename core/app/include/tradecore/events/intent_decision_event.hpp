#pragma once

#include "tradecore/domain/admission.hpp"
#include "tradecore/domain/intent.hpp"
#include "tradecore/events/event_types.hpp"

#include <string>

namespace tradecore {

// Audit record of one admission decision. Published for telemetry only; the
// strategy already received the decision synchronously.
struct IntentDecisionEvent {
  std::string strategy_id;
  domain::Intent intent;
  domain::AdmissionDecision decision;
  Timestamp timestamp{};
};

}  // namespace tradecore
