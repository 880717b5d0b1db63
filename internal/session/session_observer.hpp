#pragma once

#include <cstddef>
#include <string>

#include "internal/model/types.hpp"
#include "internal/session/session_types.hpp"

namespace stockcount::session {

struct CompletionSummary;

/*
  Engine event sink. All callbacks default to no-ops.

  Callbacks run synchronously on the thread that caused the event, after
  the engine has released its lock. They may query the SessionEngine.
  OnPendingCountChanged() reports the size at delivery time, so several
  queue changes can arrive as one call.
*/
class SessionObserver {
 public:
  virtual ~SessionObserver() = default;

  virtual void OnSessionChanged(const model::StockSession& /*session*/) {
  }
  virtual void OnPendingCountChanged(std::size_t /*count*/) {
  }
  virtual void OnDecisionWarning(const std::string& /*item_id*/, DecisionWarning /*warning*/) {
  }
  virtual void OnSessionCompleted(const CompletionSummary& /*summary*/) {
  }
  virtual void OnConnectivityChanged(bool /*online*/) {
  }
};

} // namespace stockcount::session
