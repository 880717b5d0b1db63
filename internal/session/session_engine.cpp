#include "internal/session/session_engine.hpp"

#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>

#include "internal/model/proto_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/remote_result.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace stockcount::session {

using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

void ValidateQuantity(double quantity) {
  if (!std::isfinite(quantity) || quantity < 0.0) {
    throw util::InvalidQuantity("quantity must be a finite number >= 0");
  }
}

void Transition(model::StockSession& session, model::SessionStatus to) {
  if (!model::CanTransition(session.status, to)) {
    throw util::InvalidState("session " + session.id + " cannot go from " + std::string(model::ToString(session.status)) + " to " +
                             std::string(model::ToString(to)));
  }
  session.status = to;
}

SessionContext Validated(SessionContext context) {
  if (!context.repository || !context.inventory || !context.blob_store || !context.notifications || !context.network || !context.clock) {
    throw std::invalid_argument("session engine: missing collaborator");
  }
  return context;
}

} // namespace

SessionEngine::SessionEngine(SessionContext context, EngineOptions options)
    : context_(Validated(std::move(context))),
      options_(std::move(options)),
      pending_(context_.repository, context_.clock),
      aggregator_(context_.repository, context_.notifications, context_.clock, options_.healthy_factor) {
  // the queue may report from under mutex_; observers hear about it in PublishPendingCount()
  pending_.SetSizeListener([this](std::size_t) { pending_count_dirty_ = true; });
  network_subscription_ = context_.network->Subscribe([this](bool online) { OnConnectivity(online); });
}

SessionEngine::~SessionEngine() {
  network_subscription_.Reset();
  pending_.SetSizeListener(nullptr);
}

void SessionEngine::Hydrate() {
  pending_.Hydrate();
  if (IsOnline() && pending_.Size() > 0) {
    SyncPending();
  }
  PublishPendingCount();
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

model::StockSession SessionEngine::StartSession(const std::string& area_id, model::UpdateMethod method) {
  {
    std::scoped_lock lock(mutex_);
    if (active_) {
      if (active_->area.id == area_id) {
        return active_->session;
      }
      throw util::SessionConflict("session already active for area " + active_->area.id);
    }
  }

  {
    auto tx     = context_.repository->Begin();
    auto paused = context_.repository->GetPausedSession(*tx, area_id);
    tx->Commit();
    if (paused) {
      throw util::SessionConflict("area " + area_id + " has a paused session; resume it instead");
    }
  }

  // suspension point: remote fetch, engine unlocked
  auto snapshot = LoadArea(area_id);

  ActiveSession active;
  active.queue              = ItemQueue(snapshot.items);
  active.area               = std::move(snapshot.area);
  active.session.id         = util::NewId();
  active.session.area_id    = area_id;
  active.session.method     = method;
  active.session.started_at = context_.clock->Now();
  active.session.items_total = static_cast<uint32_t>(active.queue.Size());
  Transition(active.session, model::SessionStatus::kActive);

  model::StockSession started;
  {
    std::scoped_lock lock(mutex_);
    if (active_) {
      throw util::SessionConflict("session already active for area " + active_->area.id);
    }
    for (const auto& item : ItemsLocked(active)) {
      ClassifyLocked(active, item.id);
    }
    active_ = std::move(active);
    started = active_->session;
  }

  STOCKCOUNT_LOG_INFO("session started", {StringField("session_id", started.id), StringField("area_id", area_id),
                                          IntField("items", started.items_total), StringField("method", model::ToString(method))});
  Notify([&](SessionObserver& o) { o.OnSessionChanged(started); });
  return started;
}

model::StockSession SessionEngine::PauseSession(const std::optional<std::string>& return_location_id) {
  model::StockSession paused;
  {
    std::scoped_lock lock(mutex_);
    if (!active_) {
      throw util::InvalidState("no active session to pause");
    }

    db::model::PausedSessionRecord record;
    record.area_id            = active_->area.id;
    record.session_id         = active_->session.id;
    record.snapshot           = SerializeSnapshot(*active_, return_location_id);
    record.paused_at_ms       = util::ToUnixMillis(context_.clock->Now());
    record.return_location_id = return_location_id.value_or("");

    auto tx = context_.repository->Begin();
    db::ThrowIfFailed(context_.repository->UpsertPausedSession(*tx, record), "persist paused session");
    tx->Commit();

    paused        = active_->session;
    Transition(paused, model::SessionStatus::kPaused);
    active_.reset();
  }

  STOCKCOUNT_LOG_INFO("session paused", {StringField("session_id", paused.id), StringField("area_id", paused.area_id),
                                         IntField("cursor", static_cast<int64_t>(paused.cursor))});
  Notify([&](SessionObserver& o) { o.OnSessionChanged(paused); });
  return paused;
}

model::StockSession SessionEngine::ResumeSession(const std::string& area_id) {
  model::StockSession resumed;
  {
    std::scoped_lock lock(mutex_);
    if (active_) {
      if (active_->area.id != area_id) {
        throw util::SessionConflict("session already active for area " + active_->area.id);
      }
      return active_->session;
    }

    auto tx     = context_.repository->Begin();
    auto record = context_.repository->GetPausedSession(*tx, area_id);
    if (!record) {
      throw util::NoPausedSession("no paused session for area " + area_id);
    }

    auto active = RestoreSnapshot(record->snapshot);
    db::ThrowIfFailed(context_.repository->DeletePausedSession(*tx, area_id), "clear paused session");
    tx->Commit();

    for (const auto& item : ItemsLocked(active)) {
      ClassifyLocked(active, item.id);
    }
    Transition(active.session, model::SessionStatus::kActive);
    active_               = std::move(active);
    resumed               = active_->session;
  }

  STOCKCOUNT_LOG_INFO("session resumed", {StringField("session_id", resumed.id), StringField("area_id", area_id),
                                          IntField("cursor", static_cast<int64_t>(resumed.cursor))});
  Notify([&](SessionObserver& o) { o.OnSessionChanged(resumed); });
  return resumed;
}

CompletionSummary SessionEngine::CompleteSession() {
  CompletionSummary   summary;
  model::StockSession completed;
  std::string         area_name;
  {
    std::scoped_lock lock(mutex_);
    auto&            active = RequireActiveLocked();

    std::vector<std::string> unresolved_ids;
    std::vector<std::string> unresolved_names;
    const auto               items = ItemsLocked(active);
    for (const auto& item : items) {
      if (!active.updates.contains(item.id)) {
        unresolved_ids.push_back(item.id);
        unresolved_names.push_back(item.name);
      }
    }
    if (!unresolved_ids.empty()) {
      throw util::IncompleteDecisions(std::move(unresolved_ids), std::move(unresolved_names));
    }

    summary = aggregator_.Summarize(active.session.id, active.area.id, items, active.updates);

    const auto now = context_.clock->Now();

    v1::PendingPayload payload;
    auto*              commit = payload.mutable_session_commit();
    commit->set_session_id(active.session.id);
    commit->set_area_id(active.area.id);
    commit->set_method(model::ToProto(active.session.method));
    *commit->mutable_started_at()   = util::ToProto(active.session.started_at);
    *commit->mutable_completed_at() = util::ToProto(now);
    commit->set_items_checked(active.session.items_checked);
    commit->set_items_skipped(active.session.items_skipped);
    commit->set_items_total(active.session.items_total);
    commit->set_device_id(options_.device_id);
    for (const auto& item : items) {
      *commit->add_updates() = model::ToProto(active.updates.at(item.id));
    }
    pending_.Enqueue(active.session.id, "", std::move(payload));

    ArchiveLocked(active, model::SessionStatus::kCompleted, &summary);

    completed        = active.session;
    Transition(completed, model::SessionStatus::kCompleted);
    area_name        = active.area.name;
    active_.reset();
  }

  PublishPendingCount();

  // the session is archived by now; alert failures are only logged
  try {
    aggregator_.NotifyIfCritical(summary, area_name);
  } catch (const std::exception& e) {
    summary.alert_sent = false;
    STOCKCOUNT_LOG_WARN("critical alert failed", {StringField("session_id", completed.id), StringField("error", e.what())});
  }

  STOCKCOUNT_LOG_INFO("session completed",
                      {StringField("session_id", completed.id), StringField("area_id", completed.area_id),
                       IntField("counted", static_cast<int64_t>(summary.counted_count)),
                       IntField("skipped", static_cast<int64_t>(summary.skipped_count)),
                       IntField("critical", static_cast<int64_t>(summary.critical.size())), BoolField("alert_sent", summary.alert_sent)});

  // best effort; completion never waits on the network
  try {
    SyncPending();
  } catch (const std::exception& e) {
    STOCKCOUNT_LOG_WARN("post-completion sync failed", {StringField("session_id", completed.id), StringField("error", e.what())});
  }

  Notify([&](SessionObserver& o) {
    o.OnSessionChanged(completed);
    o.OnSessionCompleted(summary);
  });
  return summary;
}

model::StockSession SessionEngine::AbandonSession() {
  model::StockSession abandoned;
  {
    std::scoped_lock lock(mutex_);
    auto&            active = RequireActiveLocked();

    ArchiveLocked(active, model::SessionStatus::kAbandoned, nullptr);
    abandoned        = active.session;
    Transition(abandoned, model::SessionStatus::kAbandoned);
    active_.reset();
  }

  STOCKCOUNT_LOG_INFO("session abandoned", {StringField("session_id", abandoned.id), StringField("area_id", abandoned.area_id)});
  Notify([&](SessionObserver& o) { o.OnSessionChanged(abandoned); });
  return abandoned;
}

model::StockSession SessionEngine::AbandonPausedSession(const std::string& area_id) {
  model::StockSession abandoned;
  {
    std::scoped_lock lock(mutex_);

    std::optional<db::model::PausedSessionRecord> record;
    {
      auto tx = context_.repository->Begin();
      record  = context_.repository->GetPausedSession(*tx, area_id);
      tx->Commit();
    }
    if (!record) {
      throw util::NoPausedSession("no paused session for area " + area_id);
    }

    auto active = RestoreSnapshot(record->snapshot);
    RefreshCountsLocked(active);
    ArchiveLocked(active, model::SessionStatus::kAbandoned, nullptr);
    abandoned        = active.session;
    Transition(abandoned, model::SessionStatus::kAbandoned);
  }

  STOCKCOUNT_LOG_INFO("paused session abandoned", {StringField("session_id", abandoned.id), StringField("area_id", area_id)});
  Notify([&](SessionObserver& o) { o.OnSessionChanged(abandoned); });
  return abandoned;
}

// ------------------------------------------------------------------
// Decisions
// ------------------------------------------------------------------

DecisionOutcome SessionEngine::RecordDecision(const std::string& item_id, double quantity, model::UpdateMethod method,
                                              const DecisionOptions& options) {
  ValidateQuantity(quantity);

  std::string         session_id;
  std::string         pending_id;
  model::StockSession changed;
  {
    std::scoped_lock lock(mutex_);
    auto&            active = RequireActiveLocked();
    auto&            item   = active.queue.MutableItem(item_id);

    model::SessionItemUpdate update;
    update.area_item_id      = item_id;
    update.previous_quantity = BaselineLocked(active, item_id);
    update.new_quantity      = quantity;
    update.status            = model::ItemStatus::kCounted;
    update.method            = method;

    // note and photo carry over from an earlier decision unless replaced
    if (auto previous = active.updates.find(item_id); previous != active.updates.end()) {
      update.note      = previous->second.note;
      update.photo_url = previous->second.photo_url;
    }
    if (options.note) {
      update.note = options.note;
    }

    item.current_quantity   = quantity;
    active.updates[item_id] = std::move(update);
    ClassifyLocked(active, item_id);
    RefreshCountsLocked(active);

    pending_id = EnqueueItemWriteLocked(active, item_id);
    session_id = active.session.id;
    changed    = active.session;
  }

  STOCKCOUNT_LOG_DEBUG("decision recorded", {StringField("session_id", session_id), StringField("item_id", item_id), DoubleField("quantity", quantity)});
  Notify([&](SessionObserver& o) { o.OnSessionChanged(changed); });

  DecisionOutcome outcome;
  if (options.photo_uri) {
    std::optional<DecisionWarning> warning;

    if (!IsOnline()) {
      warning = DecisionWarning::kPhotoUnavailableOffline;
    } else {
      // suspension point: photo upload, engine unlocked
      remote::UploadResult upload;
      try {
        upload = context_.blob_store->UploadPhoto(*options.photo_uri);
      } catch (const std::exception& e) {
        upload.status = remote::RemoteResult::Err(remote::RemoteError::Internal, e.what());
      }

      if (!upload.status) {
        warning = DecisionWarning::kPhotoUploadFailed;
        STOCKCOUNT_LOG_WARN("photo upload failed", {StringField("item_id", item_id), StringField("error", upload.status.message)});
      } else {
        std::scoped_lock lock(mutex_);
        if (active_ && active_->session.id == session_id) {
          auto update = active_->updates.find(item_id);
          if (update != active_->updates.end() && update->second.status == model::ItemStatus::kCounted) {
            update->second.photo_url = upload.url;
            pending_id               = EnqueueItemWriteLocked(*active_, item_id);
          }
        }
      }
    }

    if (warning) {
      outcome.warnings.push_back(*warning);
      Notify([&](SessionObserver& o) { o.OnDecisionWarning(item_id, *warning); });
    }
  }

  return FinishDecision(item_id, pending_id, std::move(outcome));
}

void SessionEngine::SkipItem(const std::string& item_id) {
  model::StockSession changed;
  uint32_t            skip_count = 0;
  {
    std::scoped_lock lock(mutex_);
    auto&            active = RequireActiveLocked();

    active.queue.Skip(item_id);

    if (!active.updates.contains(item_id)) {
      model::SessionItemUpdate update;
      update.area_item_id      = item_id;
      update.previous_quantity = active.queue.Item(item_id).current_quantity;
      update.new_quantity      = update.previous_quantity;
      update.status            = model::ItemStatus::kSkipped;
      update.method            = active.session.method;
      active.updates[item_id]  = std::move(update);
      ClassifyLocked(active, item_id);
    }

    RefreshCountsLocked(active);
    changed    = active.session;
    skip_count = active.queue.SkipCount(item_id);
  }

  STOCKCOUNT_LOG_DEBUG("item skipped", {StringField("item_id", item_id), IntField("skip_count", skip_count)});
  Notify([&](SessionObserver& o) { o.OnSessionChanged(changed); });
}

DecisionOutcome SessionEngine::SetSessionItemQuantity(const std::string& item_id, double quantity) {
  ValidateQuantity(quantity);

  std::string         pending_id;
  model::StockSession changed;
  {
    std::scoped_lock lock(mutex_);
    auto&            active = RequireActiveLocked();

    auto update = active.updates.find(item_id);
    if (update == active.updates.end()) {
      throw util::NotFound("no decision recorded for item " + item_id);
    }
    if (update->second.status != model::ItemStatus::kCounted) {
      throw util::InvalidState("item " + item_id + " was skipped; count it before editing");
    }

    update->second.new_quantity                      = quantity;
    active.queue.MutableItem(item_id).current_quantity = quantity;
    ClassifyLocked(active, item_id);

    pending_id = EnqueueItemWriteLocked(active, item_id);
    changed    = active.session;
  }

  STOCKCOUNT_LOG_DEBUG("decision revised", {StringField("item_id", item_id), DoubleField("quantity", quantity)});
  Notify([&](SessionObserver& o) { o.OnSessionChanged(changed); });
  return FinishDecision(item_id, pending_id, {});
}

DecisionOutcome SessionEngine::FinishDecision(const std::string& item_id, const std::string& pending_id, DecisionOutcome outcome) {
  PublishPendingCount();

  // phase 2: remote, only when there is a network to try
  if (IsOnline()) {
    const auto report = SyncPending();
    if (report.failed > 0) {
      STOCKCOUNT_LOG_DEBUG("write left queued", {StringField("item_id", item_id), StringField("error", report.last_error.message)});
    }
  }

  outcome.synced        = !pending_.Contains(pending_id);
  outcome.pending_count = pending_.Size();
  return outcome;
}

// ------------------------------------------------------------------
// Navigation
// ------------------------------------------------------------------

bool SessionEngine::NextItem() {
  std::scoped_lock lock(mutex_);
  auto&            active = RequireActiveLocked();
  const bool       moved  = active.queue.Next();
  active.session.cursor   = active.queue.Cursor();
  return moved;
}

bool SessionEngine::PreviousItem() {
  std::scoped_lock lock(mutex_);
  auto&            active = RequireActiveLocked();
  const bool       moved  = active.queue.Previous();
  active.session.cursor   = active.queue.Cursor();
  return moved;
}

bool SessionEngine::GoToItem(std::size_t index) {
  std::scoped_lock lock(mutex_);
  auto&            active = RequireActiveLocked();
  const bool       moved  = active.queue.GoTo(index);
  active.session.cursor   = active.queue.Cursor();
  return moved;
}

// ------------------------------------------------------------------
// Sync
// ------------------------------------------------------------------

DrainReport SessionEngine::SyncPending() {
  DrainReport report;
  if (IsOnline()) {
    report = pending_.Drain(*context_.inventory);
  }
  PublishPendingCount();
  return report;
}

bool SessionEngine::AbandonPending(const std::string& pending_id) {
  const bool abandoned = pending_.Abandon(pending_id);
  PublishPendingCount();
  return abandoned;
}

void SessionEngine::PublishPendingCount() {
  if (!pending_count_dirty_.exchange(false)) {
    return;
  }
  const auto count = pending_.Size();
  Notify([count](SessionObserver& o) { o.OnPendingCountChanged(count); });
}

std::size_t SessionEngine::PendingCount() const {
  return pending_.Size();
}

std::vector<PendingUpdate> SessionEngine::PendingSnapshot() const {
  return pending_.Snapshot();
}

std::optional<util::TimePoint> SessionEngine::LastSyncAt() const {
  return pending_.LastSyncAt();
}

bool SessionEngine::IsOnline() const {
  return context_.network->IsOnline();
}

void SessionEngine::OnConnectivity(bool online) {
  STOCKCOUNT_LOG_INFO("network state", {BoolField("online", online), IntField("pending", static_cast<int64_t>(pending_.Size()))});
  Notify([online](SessionObserver& o) { o.OnConnectivityChanged(online); });

  if (!online) {
    return;
  }
  try {
    SyncPending();
  } catch (const std::exception& e) {
    STOCKCOUNT_LOG_ERROR("reconnect sync failed", {StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::optional<model::StockSession> SessionEngine::CurrentSession() const {
  std::scoped_lock lock(mutex_);
  if (!active_) return std::nullopt;
  return active_->session;
}

std::optional<model::StorageArea> SessionEngine::CurrentArea() const {
  std::scoped_lock lock(mutex_);
  if (!active_) return std::nullopt;
  return active_->area;
}

std::optional<model::AreaItem> SessionEngine::CurrentItem() const {
  std::scoped_lock lock(mutex_);
  if (!active_) return std::nullopt;
  const auto* item = active_->queue.Current();
  if (!item) return std::nullopt;
  return *item;
}

bool SessionEngine::IsLastItem() const {
  std::scoped_lock lock(mutex_);
  return active_ && active_->queue.IsLast();
}

std::vector<model::AreaItem> SessionEngine::Items() const {
  std::scoped_lock lock(mutex_);
  if (!active_) return {};
  return ItemsLocked(*active_);
}

std::vector<std::string> SessionEngine::ItemOrder() const {
  std::scoped_lock lock(mutex_);
  if (!active_) return {};
  return active_->queue.Order();
}

uint32_t SessionEngine::SkipCount(const std::string& item_id) const {
  std::scoped_lock lock(mutex_);
  return RequireActiveLocked().queue.SkipCount(item_id);
}

bool SessionEngine::SkippedRepeatedly(const std::string& item_id) const {
  return options_.skip_hint_threshold > 0 && SkipCount(item_id) >= options_.skip_hint_threshold;
}

std::optional<model::SessionItemUpdate> SessionEngine::ItemUpdate(const std::string& item_id) const {
  std::scoped_lock lock(mutex_);
  if (!active_) return std::nullopt;
  auto it = active_->updates.find(item_id);
  if (it == active_->updates.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SessionItemUpdate> SessionEngine::ItemUpdates() const {
  std::scoped_lock                      lock(mutex_);
  std::vector<model::SessionItemUpdate> out;
  if (!active_) return out;
  for (const auto& id : active_->queue.Order()) {
    auto it = active_->updates.find(id);
    if (it != active_->updates.end()) out.push_back(it->second);
  }
  return out;
}

std::optional<model::QuantityBand> SessionEngine::BandOf(const std::string& item_id) const {
  std::scoped_lock lock(mutex_);
  if (!active_) return std::nullopt;
  return active_->bands.Get(item_id);
}

std::vector<std::string> SessionEngine::PausedAreas() const {
  auto tx      = context_.repository->Begin();
  auto records = context_.repository->ListPausedSessions(*tx);
  tx->Commit();

  std::vector<std::string> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(record.area_id);
  }
  return out;
}

std::optional<CheckStatus> SessionEngine::CurrentCheckStatus() const {
  auto area = CurrentArea();
  if (!area) return std::nullopt;
  return CheckStatusOf(*area, context_.clock->Now());
}

void SessionEngine::AddObserver(std::shared_ptr<SessionObserver> observer) {
  std::scoped_lock lock(observers_mutex_);
  observers_.push_back(std::move(observer));
}

// ------------------------------------------------------------------
// Internals
// ------------------------------------------------------------------

SessionEngine::ActiveSession& SessionEngine::RequireActiveLocked() {
  if (!active_) {
    throw util::InvalidState("no active session");
  }
  return *active_;
}

const SessionEngine::ActiveSession& SessionEngine::RequireActiveLocked() const {
  if (!active_) {
    throw util::InvalidState("no active session");
  }
  return *active_;
}

model::AreaSnapshot SessionEngine::LoadArea(const std::string& area_id) {
  if (IsOnline()) {
    try {
      auto snapshot = context_.inventory->FetchAreaItems(area_id);
      CacheArea(snapshot);
      return snapshot;
    } catch (const util::NotFound&) {
      throw;
    } catch (const std::exception& e) {
      STOCKCOUNT_LOG_WARN("area fetch failed, using local cache", {StringField("area_id", area_id), StringField("error", e.what())});
    }
  }

  std::optional<db::model::AreaCacheRecord> cached;
  {
    auto tx = context_.repository->Begin();
    cached  = context_.repository->GetAreaCache(*tx, area_id);
    tx->Commit();
  }
  if (!cached) {
    throw util::Unavailable("area " + area_id + " is not cached and the inventory service is unreachable");
  }

  v1::AreaSnapshot proto;
  if (!proto.ParseFromString(cached->snapshot)) {
    throw util::StorageError("corrupt cached area " + area_id);
  }
  STOCKCOUNT_LOG_INFO("area loaded from cache", {StringField("area_id", area_id), IntField("items", proto.items_size())});
  return model::FromProto(proto);
}

void SessionEngine::CacheArea(const model::AreaSnapshot& snapshot) {
  db::model::AreaCacheRecord record;
  record.area_id       = snapshot.area.id;
  record.snapshot      = model::ToProto(snapshot).SerializeAsString();
  record.fetched_at_ms = util::ToUnixMillis(context_.clock->Now());

  auto tx = context_.repository->Begin();
  db::ThrowIfFailed(context_.repository->UpsertAreaCache(*tx, record), "cache area");
  tx->Commit();
}

double SessionEngine::BaselineLocked(const ActiveSession& active, const std::string& item_id) const {
  auto it = active.updates.find(item_id);
  if (it != active.updates.end()) {
    return it->second.previous_quantity;
  }
  return active.queue.Item(item_id).current_quantity;
}

void SessionEngine::RefreshCountsLocked(ActiveSession& active) {
  uint32_t checked = 0;
  uint32_t skipped = 0;
  for (const auto& [_, update] : active.updates) {
    if (update.status == model::ItemStatus::kCounted) {
      ++checked;
    } else {
      ++skipped;
    }
  }
  active.session.items_checked = checked;
  active.session.items_skipped = skipped;
  active.session.cursor        = active.queue.Cursor();
}

void SessionEngine::ClassifyLocked(ActiveSession& active, const std::string& item_id) {
  const auto& item     = active.queue.Item(item_id);
  double      quantity = item.current_quantity;

  auto update = active.updates.find(item_id);
  if (update != active.updates.end()) {
    quantity = update->second.status == model::ItemStatus::kCounted ? update->second.new_quantity : update->second.previous_quantity;
  }
  active.bands.Set(item_id, ClassifyQuantity(quantity, item.min_quantity, options_.healthy_factor));
}

std::string SessionEngine::EnqueueItemWriteLocked(const ActiveSession& active, const std::string& item_id) {
  const auto& item   = active.queue.Item(item_id);
  const auto& update = active.updates.at(item_id);

  v1::PendingPayload payload;
  auto*              write = payload.mutable_item_write();
  write->set_session_id(active.session.id);
  write->set_area_id(active.area.id);
  write->set_area_item_id(item_id);
  write->set_inventory_item_id(item.inventory_item_id);
  write->set_previous_quantity(update.previous_quantity);
  write->set_new_quantity(update.new_quantity);
  write->set_method(model::ToProto(update.method));
  if (update.note) write->set_note(*update.note);
  if (update.photo_url) write->set_photo_url(*update.photo_url);
  write->set_device_id(options_.device_id);
  *write->mutable_recorded_at() = util::ToProto(context_.clock->Now());

  return pending_.Enqueue(active.session.id, item_id, std::move(payload));
}

void SessionEngine::ArchiveLocked(const ActiveSession& active, model::SessionStatus status, const CompletionSummary* summary) {
  const auto now = context_.clock->Now();

  db::model::SessionArchiveRecord record;
  record.session_id     = active.session.id;
  record.area_id        = active.area.id;
  record.status         = std::string(model::ToString(status));
  record.started_at_ms  = util::ToUnixMillis(active.session.started_at);
  record.finished_at_ms = util::ToUnixMillis(now);
  record.items_checked  = active.session.items_checked;
  record.items_skipped  = active.session.items_skipped;
  record.items_total    = active.session.items_total;
  if (summary) {
    record.critical_count = static_cast<uint32_t>(summary->critical.size());
    record.low_count      = static_cast<uint32_t>(summary->low.size());
    record.healthy_count  = static_cast<uint32_t>(summary->healthy.size());
  }

  auto tx = context_.repository->Begin();
  db::ThrowIfFailed(context_.repository->InsertSessionArchive(*tx, record), "archive session");
  db::ThrowIfFailed(context_.repository->DeletePausedSession(*tx, active.area.id), "clear paused session");

  // a completed count resets the area's check schedule and becomes the offline baseline
  if (status == model::SessionStatus::kCompleted) {
    auto cached = context_.repository->GetAreaCache(*tx, active.area.id);
    if (cached) {
      v1::AreaSnapshot proto;
      if (proto.ParseFromString(cached->snapshot)) {
        *proto.mutable_area()->mutable_last_checked_at() = util::ToProto(now);
        for (auto& item : *proto.mutable_items()) {
          auto update = active.updates.find(item.id());
          if (update != active.updates.end() && update->second.status == model::ItemStatus::kCounted) {
            item.set_current_quantity(update->second.new_quantity);
          }
        }
        cached->snapshot = proto.SerializeAsString();
        db::ThrowIfFailed(context_.repository->UpsertAreaCache(*tx, *cached), "refresh cached area");
      }
    }
  }
  tx->Commit();
}

SessionEngine::ActiveSession SessionEngine::RestoreSnapshot(const std::string& snapshot_bytes) {
  v1::SessionSnapshot snapshot;
  if (!snapshot.ParseFromString(snapshot_bytes)) {
    throw util::StorageError("corrupt paused session snapshot");
  }

  std::vector<QueueEntry> entries;
  entries.reserve(static_cast<std::size_t>(snapshot.queue_size()));
  for (const auto& queued : snapshot.queue()) {
    entries.push_back(QueueEntry{model::FromProto(queued.item()), queued.skip_count()});
  }

  ActiveSession active;
  active.queue = ItemQueue::Restore(entries, snapshot.cursor());
  active.area  = model::FromProto(snapshot.area());

  for (const auto& update : snapshot.updates()) {
    active.updates[update.area_item_id()] = model::FromProto(update);
  }

  active.session.id          = snapshot.session_id();
  active.session.area_id     = active.area.id;
  active.session.status      = model::SessionStatus::kPaused;
  active.session.method      = model::FromProto(snapshot.method());
  active.session.started_at  = util::FromProto(snapshot.started_at());
  active.session.items_total = static_cast<uint32_t>(active.queue.Size());

  uint32_t checked = 0;
  uint32_t skipped = 0;
  for (const auto& [_, update] : active.updates) {
    if (update.status == model::ItemStatus::kCounted) {
      ++checked;
    } else {
      ++skipped;
    }
  }
  active.session.items_checked = checked;
  active.session.items_skipped = skipped;
  active.session.cursor        = active.queue.Cursor();
  return active;
}

std::string SessionEngine::SerializeSnapshot(const ActiveSession& active, const std::optional<std::string>& return_location_id) const {
  v1::SessionSnapshot snapshot;
  snapshot.set_session_id(active.session.id);
  *snapshot.mutable_area() = model::ToProto(active.area);
  snapshot.set_method(model::ToProto(active.session.method));
  *snapshot.mutable_started_at() = util::ToProto(active.session.started_at);
  snapshot.set_cursor(static_cast<uint32_t>(active.queue.Cursor()));

  for (const auto& entry : active.queue.Entries()) {
    auto* queued            = snapshot.add_queue();
    *queued->mutable_item() = model::ToProto(entry.item);
    queued->set_skip_count(entry.skip_count);

    auto update = active.updates.find(entry.item.id);
    if (update != active.updates.end()) {
      *snapshot.add_updates() = model::ToProto(update->second);
    }
  }

  if (return_location_id) {
    snapshot.set_return_location_id(*return_location_id);
  }
  return snapshot.SerializeAsString();
}

std::vector<model::AreaItem> SessionEngine::ItemsLocked(const ActiveSession& active) const {
  std::vector<model::AreaItem> items;
  items.reserve(active.queue.Size());
  for (const auto& entry : active.queue.Entries()) {
    items.push_back(entry.item);
  }
  return items;
}

template <typename Fn>
void SessionEngine::Notify(Fn&& fn) {
  std::vector<std::shared_ptr<SessionObserver>> observers;
  {
    std::scoped_lock lock(observers_mutex_);
    observers = observers_;
  }
  for (const auto& observer : observers) {
    fn(*observer);
  }
}

} // namespace stockcount::session
