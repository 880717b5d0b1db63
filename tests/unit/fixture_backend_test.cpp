#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/remote/fixture/directory_blob_store.hpp"
#include "internal/remote/fixture/fixture_inventory_service.hpp"
#include "internal/remote/local_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using stockcount::remote::RemoteError;
using stockcount::remote::fixture::DirectoryBlobStore;
using stockcount::remote::fixture::FixtureInventoryService;

const char* kFixture = R"(areas:
  - id: walk-in
    name: Walk-in cooler
    check_frequency: every_2_days
    last_checked_at: "2026-10-18T07:00:00Z"
    items:
      - {id: milk, inventory_item_id: inv-milk, name: Milk, unit_type: L, current_quantity: 4, min_quantity: 6, max_quantity: 12}
      - {id: cream, name: Cream, current_quantity: 2.5, min_quantity: 1}
  - id: dry-store
    items: []
)";

std::filesystem::path TempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "stockcount_fixture_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFixtureParsesAreas() {
  auto service = FixtureInventoryService::FromYaml(kFixture);
  assert(service->AreaIds().size() == 2);

  auto walk_in = service->FetchAreaItems("walk-in");
  assert(walk_in.area.name == "Walk-in cooler");
  assert(walk_in.area.check_frequency == stockcount::model::CheckFrequency::kEvery2Days);
  assert(walk_in.area.last_checked_at == stockcount::util::ParseIso8601("2026-10-18T07:00:00Z"));
  assert(walk_in.items.size() == 2);
  assert(walk_in.items[0].inventory_item_id == "inv-milk");
  assert(walk_in.items[0].max_quantity == 12);
  assert(walk_in.items[1].inventory_item_id == "cream");
  assert(walk_in.items[1].current_quantity == 2.5);

  auto dry = service->FetchAreaItems("dry-store");
  assert(dry.area.name == "dry-store");
  assert(dry.items.empty());

  assert(Throws<stockcount::util::NotFound>([&] { service->FetchAreaItems("freezer"); }));
}

void TestFixtureAppliesWrites() {
  auto service = FixtureInventoryService::FromYaml(kFixture);

  stockcount::v1::ItemWrite write;
  write.set_area_id("walk-in");
  write.set_area_item_id("milk");
  write.set_new_quantity(9);
  assert(service->PersistItemUpdate(write));
  assert(service->FetchAreaItems("walk-in").items[0].current_quantity == 9);
  assert(service->AcceptedWrites() == 1);

  write.set_area_item_id("butter");
  auto missing = service->PersistItemUpdate(write);
  assert(!missing);
  assert(missing.code == RemoteError::NotFound);

  stockcount::v1::SessionCommit commit;
  commit.set_area_id("walk-in");
  *commit.mutable_completed_at() = stockcount::util::ToProto(stockcount::util::ParseIso8601("2026-10-19T09:00:00Z"));
  assert(service->CommitSession(commit));
  assert(service->FetchAreaItems("walk-in").area.last_checked_at == stockcount::util::ParseIso8601("2026-10-19T09:00:00Z"));
  assert(service->AcceptedCommits() == 1);
}

void TestMalformedFixturesAreRejected() {
  using stockcount::util::ValidationError;
  assert(Throws<ValidationError>([] { FixtureInventoryService::FromYaml("areas: 3"); }));
  assert(Throws<ValidationError>([] { FixtureInventoryService::FromYaml("areas:\n  - name: no id\n"); }));
  assert(Throws<ValidationError>([] { FixtureInventoryService::FromYaml("areas:\n  - id: a\n  - id: a\n"); }));
  assert(Throws<ValidationError>([] { FixtureInventoryService::FromYaml("areas:\n  - id: a\n    check_frequency: hourly\n"); }));
  assert(Throws<ValidationError>(
      [] { FixtureInventoryService::FromYaml("areas:\n  - id: a\n    items:\n      - {id: x, name: X, current_quantity: -1}\n"); }));
  assert(Throws<ValidationError>([] { FixtureInventoryService::FromYaml("areas: [unclosed"); }));
  assert(Throws<ValidationError>([] { FixtureInventoryService::FromFile("/nonexistent/fixture.yaml"); }));
}

void TestDirectoryBlobStoreCopiesPhotos() {
  const auto dir   = TempDir("blobs");
  const auto photo = dir / "shelf.jpg";
  {
    std::ofstream out(photo, std::ios::binary);
    out << "jpeg-bytes";
  }

  DirectoryBlobStore store(dir / "uploaded");
  auto               result = store.UploadPhoto("file://" + photo.string());
  assert(result.status);
  assert(result.url.rfind("file://", 0) == 0);

  const auto stored = stockcount::remote::LocalPathFromUri(result.url);
  assert(stockcount::remote::ReadFileBytes(stored) == "jpeg-bytes");

  auto missing = store.UploadPhoto((dir / "nope.jpg").string());
  assert(!missing.status);
  assert(missing.status.code == RemoteError::NotFound);

  auto scheme = store.UploadPhoto("content://media/1");
  assert(scheme.status.code == RemoteError::Rejected);
}

void TestContentTypes() {
  assert(stockcount::remote::ContentTypeFor("a/b.JPG") == "image/jpeg");
  assert(stockcount::remote::ContentTypeFor("b.png") == "image/png");
  assert(stockcount::remote::ContentTypeFor("c.bin") == "application/octet-stream");
}

} // namespace

int main() {
  TestFixtureParsesAreas();
  TestFixtureAppliesWrites();
  TestMalformedFixturesAreRejected();
  TestDirectoryBlobStoreCopiesPhotos();
  TestContentTypes();

  std::cout << "stockcount_unit_fixture_backend: pass\n";
  return 0;
}
