#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/log_notification_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/fixture/directory_blob_store.hpp"
#include "internal/remote/fixture/fixture_inventory_service.hpp"
#include "internal/util/errors.hpp"
#if STOCKCOUNT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if STOCKCOUNT_WITH_GRPC
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/network/channel_network_monitor.hpp"
#include "internal/remote/grpc/grpc_blob_store.hpp"
#include "internal/remote/grpc/grpc_inventory_service.hpp"
#endif

namespace stockcount::factory {

using observability::StringField;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const stockcount::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if STOCKCOUNT_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    STOCKCOUNT_LOG_INFO("local store opened", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  STOCKCOUNT_LOG_WARN("local store is in memory; queued writes will not survive a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::filesystem::path PhotoDirectory(const stockcount::runtime::config::RemoteConfig& remote) {
  if (!remote.photo_dir().empty()) {
    return remote.photo_dir();
  }
  return std::filesystem::temp_directory_path() / "stockcount-photos";
}

} // namespace

void Application::Shutdown() {
#if STOCKCOUNT_WITH_GRPC
  if (auto* watcher = dynamic_cast<network::ChannelNetworkMonitor*>(network.get())) {
    watcher->Stop();
  }
#endif
}

/*
    Build full application dependency graph
*/
Application Build(const stockcount::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto& remote = config.remote();

  session::SessionContext ctx;
  ctx.clock         = std::make_shared<util::SystemClock>();
  ctx.notifications = std::make_shared<notify::LogNotificationService>();

  // ------------------------------------------------------------------
  // Local store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  ctx.repository = app.repository;

  // ------------------------------------------------------------------
  // Remote collaborators
  // ------------------------------------------------------------------
  if (!remote.inventory_address().empty()) {
#if STOCKCOUNT_WITH_GRPC
    const auto deadline = std::chrono::milliseconds(remote.deadline_ms());

    auto inventory_channel = ::grpc::CreateChannel(remote.inventory_address(), ::grpc::InsecureChannelCredentials());
    auto blob_channel      = remote.blob_store_address() == remote.inventory_address()
                                 ? inventory_channel
                                 : ::grpc::CreateChannel(remote.blob_store_address(), ::grpc::InsecureChannelCredentials());

    ctx.inventory  = std::make_shared<remote::grpc::GrpcInventoryService>(inventory_channel, deadline);
    ctx.blob_store = std::make_shared<remote::grpc::GrpcBlobStore>(blob_channel, deadline);

    auto watcher = std::make_shared<network::ChannelNetworkMonitor>(inventory_channel, std::chrono::milliseconds(remote.connectivity_poll_ms()));
    watcher->Start();
    app.network = watcher;

    STOCKCOUNT_LOG_INFO("inventory service", {StringField("address", remote.inventory_address())});
#else
    throw std::runtime_error("remote.inventory_address set but gRPC support is not enabled at build time");
#endif
  } else {
    if (remote.fixture_path().empty()) {
      throw util::ValidationError("config: remote.inventory_address or remote.fixture_path is required");
    }
    ctx.inventory  = remote::fixture::FixtureInventoryService::FromFile(remote.fixture_path());
    ctx.blob_store = std::make_shared<remote::fixture::DirectoryBlobStore>(PhotoDirectory(remote));

    app.manual_network = std::make_shared<network::ManualNetworkMonitor>(true);
    app.network        = app.manual_network;

    STOCKCOUNT_LOG_INFO("inventory fixture", {StringField("path", remote.fixture_path())});
  }
  ctx.network = app.network;

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  session::EngineOptions options;
  options.device_id           = config.session().device_id();
  options.healthy_factor      = config.session().healthy_factor();
  options.skip_hint_threshold = config.session().skip_hint_threshold();

  app.engine = std::make_unique<session::SessionEngine>(std::move(ctx), std::move(options));
  app.engine->Hydrate();

  return app;
}

} // namespace stockcount::factory
