#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/completion_aggregator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using stockcount::factory::Application;
using stockcount::session::SessionEngine;

namespace model   = stockcount::model;
namespace session = stockcount::session;

static void Usage() {
  std::cout << "Usage:\n"
            << "  stockctl --config <config.yaml>\n"
            << "\n"
            << "Commands (one per line on stdin):\n"
            << "  start <area_id> [manual|nfc|qr]\n"
            << "  count <item_id|.> <quantity> [note=<text>] [photo=<uri>]\n"
            << "  skip [item_id]\n"
            << "  next | prev | goto <index>\n"
            << "  edit <item_id> <quantity>\n"
            << "  pause [return_location_id]\n"
            << "  resume <area_id>\n"
            << "  complete\n"
            << "  abandon [area_id]\n"
            << "  online | offline\n"
            << "  drain | pending | status | items | paused\n"
            << "  help | quit\n";
}

// Prints engine events as they happen.
class ConsoleObserver final : public session::SessionObserver {
 public:
  void OnPendingCountChanged(std::size_t count) override {
    std::cout << "  pending: " << count << "\n";
  }
  void OnDecisionWarning(const std::string& item_id, session::DecisionWarning warning) override {
    std::cout << "  warning: " << session::ToString(warning) << " (" << item_id << ")\n";
  }
  void OnConnectivityChanged(bool online) override {
    std::cout << "  network: " << (online ? "online" : "offline") << "\n";
  }
};

static std::vector<std::string> Tokenize(const std::string& line) {
  std::istringstream       in(line);
  std::vector<std::string> tokens;
  std::string              token;
  while (in >> token) tokens.push_back(token);
  return tokens;
}

static double ParseQuantity(const std::string& text) {
  try {
    std::size_t used  = 0;
    double      value = std::stod(text, &used);
    if (used != text.size()) {
      throw stockcount::util::InvalidQuantity("not a number: " + text);
    }
    return value;
  } catch (const std::logic_error&) {
    throw stockcount::util::InvalidQuantity("not a number: " + text);
  }
}

static std::string CurrentItemId(SessionEngine& engine) {
  auto item = engine.CurrentItem();
  if (!item) {
    throw stockcount::util::InvalidState("no current item");
  }
  return item->id;
}

static void PrintSession(const model::StockSession& s) {
  std::cout << "session " << s.id << " area=" << s.area_id << " status=" << model::ToString(s.status) << " cursor=" << s.cursor
            << " checked=" << s.items_checked << " skipped=" << s.items_skipped << " total=" << s.items_total << "\n";
}

static void PrintBand(const char* label, const std::vector<session::BandEntry>& entries) {
  std::cout << "  " << label << " (" << entries.size() << ")";
  for (const auto& e : entries) std::cout << " " << e.name << "=" << e.quantity;
  std::cout << "\n";
}

static void PrintSummary(const session::CompletionSummary& summary) {
  std::cout << "completed " << summary.session_id << ": counted=" << summary.counted_count << " skipped=" << summary.skipped_count
            << " changed=" << summary.total_quantity_changed << " updated=" << summary.updated_items_count
            << (summary.alert_sent ? " alert=sent" : "") << "\n";
  PrintBand("critical", summary.critical);
  PrintBand("low", summary.low);
  PrintBand("healthy", summary.healthy);
  for (const auto& r : summary.reorder) {
    std::cout << "  reorder " << r.name << " +" << r.reorder_quantity << " " << r.unit_type << " [" << session::ToString(r.urgency) << "]\n";
  }
}

static void PrintItems(SessionEngine& engine) {
  const auto items  = engine.Items();
  const auto cursor = engine.CurrentSession() ? engine.CurrentSession()->cursor : 0;
  for (std::size_t i = 0; i < items.size(); ++i) {
    const auto& item = items[i];

    std::cout << (i == cursor ? " > " : "   ") << std::setw(2) << i << " " << item.id << " " << item.name << " q=" << item.current_quantity
              << " min=" << item.min_quantity;
    if (auto band = engine.BandOf(item.id)) std::cout << " [" << model::ToString(*band) << "]";
    if (auto update = engine.ItemUpdate(item.id)) std::cout << " " << model::ToString(update->status);
    if (engine.SkippedRepeatedly(item.id)) std::cout << " (skipped " << engine.SkipCount(item.id) << "x)";
    std::cout << "\n";
  }
}

// Returns false on "quit".
static bool Dispatch(Application& app, const std::vector<std::string>& args) {
  auto&             engine = *app.engine;
  const std::string cmd    = args[0];

  if (cmd == "quit" || cmd == "exit") {
    return false;
  }
  if (cmd == "help") {
    Usage();
  } else if (cmd == "start" && args.size() >= 2) {
    auto method = model::UpdateMethod::kManual;
    if (args.size() >= 3) {
      auto parsed = model::ParseUpdateMethod(args[2]);
      if (!parsed) throw stockcount::util::ValidationError("unknown method: " + args[2]);
      method = *parsed;
    }
    PrintSession(engine.StartSession(args[1], method));
  } else if (cmd == "count" && args.size() >= 3) {
    const auto item_id = args[1] == "." ? CurrentItemId(engine) : args[1];

    session::DecisionOptions options;
    for (std::size_t i = 3; i < args.size(); ++i) {
      if (args[i].rfind("note=", 0) == 0) options.note = args[i].substr(5);
      if (args[i].rfind("photo=", 0) == 0) options.photo_uri = args[i].substr(6);
    }
    const auto method  = engine.CurrentSession() ? engine.CurrentSession()->method : model::UpdateMethod::kManual;
    const auto outcome = engine.RecordDecision(item_id, ParseQuantity(args[2]), method, options);
    std::cout << "recorded " << item_id << (outcome.synced ? " (synced)" : " (queued)") << " pending=" << outcome.pending_count << "\n";
    if (!engine.IsLastItem()) engine.NextItem();
  } else if (cmd == "skip") {
    const auto item_id = args.size() >= 2 ? args[1] : CurrentItemId(engine);
    engine.SkipItem(item_id);
    std::cout << "skipped " << item_id << " (" << engine.SkipCount(item_id) << "x)\n";
  } else if (cmd == "next") {
    if (!engine.NextItem()) std::cout << "already at last item\n";
  } else if (cmd == "prev") {
    if (!engine.PreviousItem()) std::cout << "already at first item\n";
  } else if (cmd == "goto" && args.size() >= 2) {
    if (!engine.GoToItem(static_cast<std::size_t>(std::stoul(args[1])))) std::cout << "index out of range\n";
  } else if (cmd == "edit" && args.size() >= 3) {
    const auto outcome = engine.SetSessionItemQuantity(args[1], ParseQuantity(args[2]));
    std::cout << "revised " << args[1] << " pending=" << outcome.pending_count << "\n";
  } else if (cmd == "pause") {
    std::optional<std::string> location;
    if (args.size() >= 2) location = args[1];
    PrintSession(engine.PauseSession(location));
  } else if (cmd == "resume" && args.size() >= 2) {
    PrintSession(engine.ResumeSession(args[1]));
  } else if (cmd == "complete") {
    PrintSummary(engine.CompleteSession());
  } else if (cmd == "abandon") {
    PrintSession(args.size() >= 2 ? engine.AbandonPausedSession(args[1]) : engine.AbandonSession());
  } else if (cmd == "online" || cmd == "offline") {
    if (!app.manual_network) throw stockcount::util::InvalidState("connectivity follows the gRPC channel");
    app.manual_network->SetOnline(cmd == "online");
  } else if (cmd == "drain") {
    const auto report = engine.SyncPending();
    std::cout << "acknowledged=" << report.acknowledged << " failed=" << report.failed;
    if (report.failed > 0) std::cout << " error=" << report.last_error.message;
    std::cout << "\n";
  } else if (cmd == "pending") {
    for (const auto& p : engine.PendingSnapshot()) {
      std::cout << "  " << p.id << " item=" << (p.area_item_id.empty() ? "<commit>" : p.area_item_id) << " attempts=" << p.attempts
                << " created=" << stockcount::util::FormatIso8601(p.created_at) << "\n";
    }
    std::cout << engine.PendingCount() << " pending";
    if (auto last = engine.LastSyncAt()) std::cout << ", last sync " << stockcount::util::FormatIso8601(*last);
    std::cout << "\n";
  } else if (cmd == "status") {
    std::cout << "network: " << (engine.IsOnline() ? "online" : "offline") << "\n";
    if (auto s = engine.CurrentSession()) {
      PrintSession(*s);
      if (auto item = engine.CurrentItem()) std::cout << "current: " << item->id << " " << item->name << (engine.IsLastItem() ? " (last)" : "") << "\n";
      if (auto check = engine.CurrentCheckStatus()) std::cout << "check: " << session::ToString(*check) << "\n";
    } else {
      std::cout << "no active session\n";
    }
  } else if (cmd == "items") {
    PrintItems(engine);
  } else if (cmd == "paused") {
    for (const auto& area : engine.PausedAreas()) std::cout << "  " << area << "\n";
  } else {
    std::cout << "unknown command; try 'help'\n";
  }
  return true;
}

int main(int argc, char** argv) {
  if (argc != 3 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  try {
    auto config = stockcount::config::ConfigLoader::LoadFromYaml(argv[2]);
    stockcount::observability::InitializeLogging(config);

    {
      auto app = stockcount::factory::Build(config);
      app.engine->AddObserver(std::make_shared<ConsoleObserver>());

      std::string line;
      while (std::cout << "stockctl> " << std::flush, std::getline(std::cin, line)) {
        const auto args = Tokenize(line);
        if (args.empty()) continue;

        try {
          if (!Dispatch(app, args)) break;
        } catch (const stockcount::util::IncompleteDecisions& e) {
          std::cout << "error: " << e.what() << "\n";
          for (const auto& name : e.ItemNames()) std::cout << "  unresolved: " << name << "\n";
        } catch (const std::exception& e) {
          std::cout << "error: " << e.what() << "\n";
        }
      }

      app.Shutdown();
    }
    stockcount::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    STOCKCOUNT_LOG_ERROR("Fatal error", {stockcount::observability::StringField("error", e.what())});
    stockcount::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
