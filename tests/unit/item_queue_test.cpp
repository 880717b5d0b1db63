#include "internal/session/item_queue.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using stockcount::model::AreaItem;
using stockcount::session::ItemQueue;

AreaItem Item(const std::string& id, double quantity, double min) {
  AreaItem item;
  item.id                = id;
  item.inventory_item_id = "inv-" + id;
  item.name              = id;
  item.current_quantity  = quantity;
  item.min_quantity      = min;
  return item;
}

std::vector<AreaItem> ThreeItems() {
  return {Item("A", 10, 5), Item("B", 3, 5), Item("C", 8, 4)};
}

void TestSkipCurrentMovesItToTheEnd() {
  ItemQueue queue(ThreeItems());
  assert(queue.Cursor() == 0);
  assert(queue.Current()->id == "A");

  queue.Skip("A");

  assert((queue.Order() == std::vector<std::string>{"B", "C", "A"}));
  assert(queue.Cursor() == 0);
  assert(queue.Current()->id == "B");
  assert(queue.SkipCount("A") == 1);
  assert(queue.SkipCount("B") == 0);
  assert(queue.Size() == 3);
}

void TestNextStopsAtLastItem() {
  ItemQueue queue(ThreeItems());
  assert(!queue.IsLast());
  assert(queue.Next());
  assert(queue.Next());
  assert(queue.IsLast());
  assert(queue.Cursor() == 2);

  assert(!queue.Next());
  assert(queue.Cursor() == 2);
  assert(queue.Current()->id == "C");
}

void TestPreviousAtFirstItemIsNoOp() {
  ItemQueue queue(ThreeItems());
  assert(!queue.Previous());
  assert(queue.Cursor() == 0);

  queue.Next();
  assert(queue.Previous());
  assert(queue.Cursor() == 0);
  assert(queue.Current()->id == "A");
}

void TestCursorStaysInRangeForAnyWalk() {
  ItemQueue queue(ThreeItems());
  const std::string walk = "nnnnppppnpnnpppnnn";
  for (char step : walk) {
    if (step == 'n') {
      queue.Next();
    } else {
      queue.Previous();
    }
    assert(queue.Cursor() < queue.Size());
    assert(queue.Current() != nullptr);
    assert(queue.Current()->id == queue.Order()[queue.Cursor()]);
  }
}

void TestSkipLastItemOnlyBumpsCounter() {
  ItemQueue queue(ThreeItems());
  queue.GoTo(2);

  queue.Skip("C");
  queue.Skip("C");

  assert((queue.Order() == std::vector<std::string>{"A", "B", "C"}));
  assert(queue.Cursor() == 2);
  assert(queue.Current()->id == "C");
  assert(queue.SkipCount("C") == 2);
}

void TestSkipItemBeforeCursorKeepsCurrentItem() {
  ItemQueue queue(ThreeItems());
  queue.GoTo(2);
  assert(queue.Current()->id == "C");

  queue.Skip("A");

  assert((queue.Order() == std::vector<std::string>{"B", "C", "A"}));
  assert(queue.Current()->id == "C");
  assert(queue.Cursor() == 1);
}

void TestSkipItemAfterCursorKeepsIndex() {
  ItemQueue queue(ThreeItems());

  queue.Skip("B");

  assert((queue.Order() == std::vector<std::string>{"A", "C", "B"}));
  assert(queue.Cursor() == 0);
  assert(queue.Current()->id == "A");
}

void TestRepeatedSkipsCycleThroughItems() {
  ItemQueue queue(ThreeItems());
  for (int i = 0; i < 6; ++i) {
    queue.Skip(queue.Current()->id);
    assert(queue.Size() == 3);
    assert(queue.Cursor() == 0);
  }
  assert(queue.SkipCount("A") == 2);
  assert(queue.SkipCount("B") == 2);
  assert(queue.SkipCount("C") == 2);
  assert((queue.Order() == std::vector<std::string>{"A", "B", "C"}));
}

void TestGoToBounds() {
  ItemQueue queue(ThreeItems());
  assert(queue.GoTo(1));
  assert(queue.Current()->id == "B");
  assert(!queue.GoTo(3));
  assert(queue.Cursor() == 1);
}

void TestUnknownItemIsNotFound() {
  ItemQueue queue(ThreeItems());
  bool      threw = false;
  try {
    queue.Skip("Z");
  } catch (const stockcount::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(!queue.Contains("Z"));
}

void TestDuplicateIdsAreRejected() {
  bool threw = false;
  try {
    ItemQueue queue({Item("A", 1, 1), Item("A", 2, 2)});
  } catch (const stockcount::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyQueue() {
  ItemQueue queue(std::vector<AreaItem>{});
  assert(queue.Empty());
  assert(queue.Cursor() == 0);
  assert(queue.Current() == nullptr);
  assert(!queue.IsLast());
  assert(!queue.Next());
  assert(!queue.Previous());
}

void TestRestoreKeepsOrderCountersAndCursor() {
  ItemQueue queue(ThreeItems());
  queue.Skip("A");
  queue.Next();

  auto restored = ItemQueue::Restore(queue.Entries(), queue.Cursor());
  assert(restored.Order() == queue.Order());
  assert(restored.Cursor() == 1);
  assert(restored.Current()->id == "C");
  assert(restored.SkipCount("A") == 1);

  // out-of-range cursors are clamped
  auto clamped = ItemQueue::Restore(queue.Entries(), 99);
  assert(clamped.Cursor() == 2);
}

} // namespace

int main() {
  TestSkipCurrentMovesItToTheEnd();
  TestNextStopsAtLastItem();
  TestPreviousAtFirstItemIsNoOp();
  TestCursorStaysInRangeForAnyWalk();
  TestSkipLastItemOnlyBumpsCounter();
  TestSkipItemBeforeCursorKeepsCurrentItem();
  TestSkipItemAfterCursorKeepsIndex();
  TestRepeatedSkipsCycleThroughItems();
  TestGoToBounds();
  TestUnknownItemIsNotFound();
  TestDuplicateIdsAreRejected();
  TestEmptyQueue();
  TestRestoreKeepsOrderCountersAndCursor();

  std::cout << "stockcount_unit_item_queue: pass\n";
  return 0;
}
