#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/remote/inventory_service.hpp"

namespace stockcount::remote::fixture {

/*
  InventoryService backed by a YAML fixture, for offline demos and tests.

    areas:
      - id: walk-in
        name: Walk-in cooler
        check_frequency: daily
        last_checked_at: "2026-10-18T07:00:00Z"
        items:
          - {id: ai-1, inventory_item_id: inv-1, name: Milk, unit_type: L,
             current_quantity: 4, min_quantity: 6, max_quantity: 12}

  Accepted writes are applied to the in-memory copy so a later fetch sees them.
*/
class FixtureInventoryService final : public InventoryService {
 public:
  // Throw util::ValidationError on a malformed fixture.
  static std::unique_ptr<FixtureInventoryService> FromFile(const std::filesystem::path& path);
  static std::unique_ptr<FixtureInventoryService> FromYaml(const std::string& yaml);

  explicit FixtureInventoryService(std::map<std::string, model::AreaSnapshot> areas);

  model::AreaSnapshot FetchAreaItems(const std::string& area_id) override;
  RemoteResult        PersistItemUpdate(const v1::ItemWrite& write) override;
  RemoteResult        CommitSession(const v1::SessionCommit& commit) override;

  std::vector<std::string> AreaIds() const;
  std::size_t              AcceptedWrites() const;
  std::size_t              AcceptedCommits() const;

 private:
  mutable std::mutex                         mutex_;
  std::map<std::string, model::AreaSnapshot> areas_;
  std::size_t                                accepted_writes_  = 0;
  std::size_t                                accepted_commits_ = 0;
};

} // namespace stockcount::remote::fixture
