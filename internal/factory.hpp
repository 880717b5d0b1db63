#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/network/manual_network_monitor.hpp"
#include "internal/network/network_monitor.hpp"
#include "internal/session/session_engine.hpp"

namespace stockcount::factory {

/*
  Application

  Owns all long-lived objects of one process.
  Destroy the engine before the collaborators it observes.
*/
struct Application {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<network::NetworkMonitor> network;

  // Set when connectivity is driven by hand (no gRPC endpoint configured).
  std::shared_ptr<network::ManualNetworkMonitor> manual_network;

  std::unique_ptr<session::SessionEngine> engine;

  // Stops background watchers. Idempotent.
  void Shutdown();
};

/*
  Build

  Constructs the engine and its collaborators from runtime config and
  reloads queued writes from the local store.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete adapter types.
*/
Application Build(const stockcount::runtime::config::RuntimeConfig& config);

} // namespace stockcount::factory
