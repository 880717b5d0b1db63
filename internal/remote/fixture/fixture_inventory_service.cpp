#include "internal/remote/fixture/fixture_inventory_service.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace stockcount::remote::fixture {

namespace {

std::string RequiredString(const YAML::Node& node, const char* key, const std::string& where) {
  const auto value = node[key];
  if (!value || !value.IsScalar() || value.Scalar().empty()) {
    throw util::ValidationError(where + ": missing '" + key + "'");
  }
  return value.Scalar();
}

std::string OptionalString(const YAML::Node& node, const char* key) {
  const auto value = node[key];
  return value && value.IsScalar() ? value.Scalar() : std::string();
}

double Quantity(const YAML::Node& node, const char* key, const std::string& where) {
  const auto value = node[key];
  if (!value) return 0.0;
  double quantity = 0.0;
  try {
    quantity = value.as<double>();
  } catch (const YAML::Exception&) {
    throw util::ValidationError(where + ": '" + key + "' is not a number");
  }
  if (quantity < 0.0) {
    throw util::ValidationError(where + ": '" + key + "' must not be negative");
  }
  return quantity;
}

model::AreaItem ParseItem(const YAML::Node& node, const std::string& area_id) {
  const std::string where = "area " + area_id + " item";

  model::AreaItem item;
  item.id                = RequiredString(node, "id", where);
  item.inventory_item_id = OptionalString(node, "inventory_item_id");
  if (item.inventory_item_id.empty()) item.inventory_item_id = item.id;
  item.name              = RequiredString(node, "name", where + " " + item.id);
  item.category          = OptionalString(node, "category");
  item.unit_type         = OptionalString(node, "unit_type");
  item.current_quantity  = Quantity(node, "current_quantity", where + " " + item.id);
  item.min_quantity      = Quantity(node, "min_quantity", where + " " + item.id);
  item.max_quantity      = Quantity(node, "max_quantity", where + " " + item.id);
  return item;
}

model::AreaSnapshot ParseArea(const YAML::Node& node) {
  model::AreaSnapshot snapshot;
  snapshot.area.id   = RequiredString(node, "id", "area");
  snapshot.area.name = OptionalString(node, "name");
  if (snapshot.area.name.empty()) snapshot.area.name = snapshot.area.id;

  const auto frequency = OptionalString(node, "check_frequency");
  if (!frequency.empty()) {
    auto parsed = model::ParseCheckFrequency(frequency);
    if (!parsed) {
      throw util::ValidationError("area " + snapshot.area.id + ": unknown check_frequency '" + frequency + "'");
    }
    snapshot.area.check_frequency = *parsed;
  }

  const auto last_checked = OptionalString(node, "last_checked_at");
  if (!last_checked.empty()) {
    snapshot.area.last_checked_at = util::ParseIso8601(last_checked);
  }

  const auto items = node["items"];
  if (items && !items.IsSequence()) {
    throw util::ValidationError("area " + snapshot.area.id + ": 'items' must be a list");
  }
  if (items) {
    for (const auto& item : items) {
      snapshot.items.push_back(ParseItem(item, snapshot.area.id));
    }
  }
  return snapshot;
}

std::map<std::string, model::AreaSnapshot> ParseFixture(const YAML::Node& root) {
  const auto areas = root["areas"];
  if (!areas || !areas.IsSequence()) {
    throw util::ValidationError("fixture must contain an 'areas' list");
  }

  std::map<std::string, model::AreaSnapshot> out;
  for (const auto& node : areas) {
    auto snapshot = ParseArea(node);
    auto id       = snapshot.area.id;
    if (!out.emplace(id, std::move(snapshot)).second) {
      throw util::ValidationError("duplicate area id in fixture: " + id);
    }
  }
  return out;
}

} // namespace

std::unique_ptr<FixtureInventoryService> FixtureInventoryService::FromFile(const std::filesystem::path& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    throw util::ValidationError("cannot load fixture " + path.string() + ": " + e.what());
  }
  return std::make_unique<FixtureInventoryService>(ParseFixture(root));
}

std::unique_ptr<FixtureInventoryService> FixtureInventoryService::FromYaml(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw util::ValidationError(std::string("malformed fixture: ") + e.what());
  }
  return std::make_unique<FixtureInventoryService>(ParseFixture(root));
}

FixtureInventoryService::FixtureInventoryService(std::map<std::string, model::AreaSnapshot> areas) : areas_(std::move(areas)) {
}

model::AreaSnapshot FixtureInventoryService::FetchAreaItems(const std::string& area_id) {
  std::scoped_lock lock(mutex_);
  auto             it = areas_.find(area_id);
  if (it == areas_.end()) {
    throw util::NotFound("unknown area: " + area_id);
  }
  return it->second;
}

RemoteResult FixtureInventoryService::PersistItemUpdate(const v1::ItemWrite& write) {
  std::scoped_lock lock(mutex_);
  auto             area = areas_.find(write.area_id());
  if (area == areas_.end()) {
    return RemoteResult::Err(RemoteError::NotFound, "unknown area: " + write.area_id());
  }

  auto& items = area->second.items;
  auto  item  = std::find_if(items.begin(), items.end(), [&](const auto& candidate) { return candidate.id == write.area_item_id(); });
  if (item == items.end()) {
    return RemoteResult::Err(RemoteError::NotFound, "unknown area item: " + write.area_item_id());
  }
  if (write.new_quantity() < 0.0) {
    return RemoteResult::Err(RemoteError::Rejected, "negative quantity");
  }

  item->current_quantity = write.new_quantity();
  ++accepted_writes_;
  return RemoteResult::Ok();
}

RemoteResult FixtureInventoryService::CommitSession(const v1::SessionCommit& commit) {
  std::scoped_lock lock(mutex_);
  auto             area = areas_.find(commit.area_id());
  if (area == areas_.end()) {
    return RemoteResult::Err(RemoteError::NotFound, "unknown area: " + commit.area_id());
  }

  area->second.area.last_checked_at = util::FromProto(commit.completed_at());
  ++accepted_commits_;
  return RemoteResult::Ok();
}

std::vector<std::string> FixtureInventoryService::AreaIds() const {
  std::scoped_lock         lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(areas_.size());
  for (const auto& [id, _] : areas_) {
    ids.push_back(id);
  }
  return ids;
}

std::size_t FixtureInventoryService::AcceptedWrites() const {
  std::scoped_lock lock(mutex_);
  return accepted_writes_;
}

std::size_t FixtureInventoryService::AcceptedCommits() const {
  std::scoped_lock lock(mutex_);
  return accepted_commits_;
}

} // namespace stockcount::remote::fixture
