#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/types.hpp"
#include "internal/network/network_monitor.hpp"
#include "internal/session/check_schedule.hpp"
#include "internal/session/completion_aggregator.hpp"
#include "internal/session/item_queue.hpp"
#include "internal/session/pending_update_queue.hpp"
#include "internal/session/session_context.hpp"
#include "internal/session/session_observer.hpp"
#include "internal/session/session_types.hpp"

namespace stockcount::session {

/*
  SessionEngine

  Owns the single active counting session of this device.

  Responsibilities:
    - session lifecycle (start, pause, resume, complete, abandon)
    - decision recording: local state first, then a durable queued write
    - draining the pending queue after writes and on reconnect

  Thread-safety:
    Every public method may be called from any thread. The engine lock is
    never held across a remote call; photo uploads and drains run unlocked.
    Observers are always called with the engine lock released.

  Errors (util/errors.hpp):
    InvalidQuantity, InvalidState, NotFound, SessionConflict,
    NoPausedSession, IncompleteDecisions, Unavailable, StorageError.
    Remote write failures are never thrown; they stay queued.
*/
class SessionEngine {
 public:
  SessionEngine(SessionContext context, EngineOptions options = {});
  ~SessionEngine();

  SessionEngine(const SessionEngine&)            = delete;
  SessionEngine& operator=(const SessionEngine&) = delete;

  // Loads queued writes left by a previous run and drains them when online.
  void Hydrate();

  // ---------------------------------------------------------------------
  // Lifecycle
  // ---------------------------------------------------------------------

  model::StockSession StartSession(const std::string& area_id, model::UpdateMethod method);

  model::StockSession PauseSession(const std::optional<std::string>& return_location_id = std::nullopt);

  model::StockSession ResumeSession(const std::string& area_id);

  CompletionSummary CompleteSession();

  // Terminal. Queued writes already made stay queued.
  model::StockSession AbandonSession();
  model::StockSession AbandonPausedSession(const std::string& area_id);

  // ---------------------------------------------------------------------
  // Decisions
  // ---------------------------------------------------------------------

  DecisionOutcome RecordDecision(const std::string& item_id, double quantity, model::UpdateMethod method, const DecisionOptions& options = {});

  // Moves the item to the end of the queue. A never-counted item is recorded as skipped.
  void SkipItem(const std::string& item_id);

  // Revises a counted entry before completion.
  DecisionOutcome SetSessionItemQuantity(const std::string& item_id, double quantity);

  // ---------------------------------------------------------------------
  // Navigation
  // ---------------------------------------------------------------------

  bool NextItem();
  bool PreviousItem();
  bool GoToItem(std::size_t index);

  // ---------------------------------------------------------------------
  // Sync
  // ---------------------------------------------------------------------

  // Drains the pending queue. Does nothing while offline.
  DrainReport SyncPending();

  bool                           AbandonPending(const std::string& pending_id);
  std::size_t                    PendingCount() const;
  std::vector<PendingUpdate>     PendingSnapshot() const;
  std::optional<util::TimePoint> LastSyncAt() const;
  bool                           IsOnline() const;

  // ---------------------------------------------------------------------
  // Queries
  // ---------------------------------------------------------------------

  std::optional<model::StockSession> CurrentSession() const;
  std::optional<model::StorageArea>  CurrentArea() const;
  std::optional<model::AreaItem>     CurrentItem() const;
  bool                               IsLastItem() const;

  std::vector<model::AreaItem> Items() const;
  std::vector<std::string>     ItemOrder() const;
  uint32_t                     SkipCount(const std::string& item_id) const;
  bool                         SkippedRepeatedly(const std::string& item_id) const;

  std::optional<model::SessionItemUpdate> ItemUpdate(const std::string& item_id) const;
  std::vector<model::SessionItemUpdate>   ItemUpdates() const;
  std::optional<model::QuantityBand>      BandOf(const std::string& item_id) const;

  std::vector<std::string> PausedAreas() const;

  // Status of the active area's check schedule, if a session is active.
  std::optional<CheckStatus> CurrentCheckStatus() const;

  void AddObserver(std::shared_ptr<SessionObserver> observer);

 private:
  struct ActiveSession {
    model::StockSession session;
    model::StorageArea  area;
    ItemQueue           queue;

    std::map<std::string, model::SessionItemUpdate> updates;
    BandIndex                                       bands;
  };

  ActiveSession&       RequireActiveLocked();
  const ActiveSession& RequireActiveLocked() const;

  model::AreaSnapshot LoadArea(const std::string& area_id);
  void                CacheArea(const model::AreaSnapshot& snapshot);

  double      BaselineLocked(const ActiveSession& active, const std::string& item_id) const;
  void        RefreshCountsLocked(ActiveSession& active);
  void        ClassifyLocked(ActiveSession& active, const std::string& item_id);
  std::string EnqueueItemWriteLocked(const ActiveSession& active, const std::string& item_id);

  void                         ArchiveLocked(const ActiveSession& active, model::SessionStatus status, const CompletionSummary* summary);
  static ActiveSession         RestoreSnapshot(const std::string& snapshot_bytes);
  std::string                  SerializeSnapshot(const ActiveSession& active, const std::optional<std::string>& return_location_id) const;
  std::vector<model::AreaItem> ItemsLocked(const ActiveSession& active) const;

  DecisionOutcome FinishDecision(const std::string& item_id, const std::string& pending_id, DecisionOutcome outcome);

  void OnConnectivity(bool online);

  // reports the queue size to observers if it changed; call without mutex_ held
  void PublishPendingCount();

  // observer fan-out; call without mutex_ held
  template <typename Fn>
  void Notify(Fn&& fn);

  SessionContext       context_;
  EngineOptions        options_;
  PendingUpdateQueue   pending_;
  CompletionAggregator aggregator_;

  mutable std::mutex           mutex_;
  std::optional<ActiveSession> active_;

  std::atomic<bool> pending_count_dirty_{false};

  std::mutex                                    observers_mutex_;
  std::vector<std::shared_ptr<SessionObserver>> observers_;

  network::Subscription network_subscription_;
};

} // namespace stockcount::session
