#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/types.hpp"

namespace stockcount::session {

struct QueueEntry {
  model::AreaItem item;
  uint32_t        skip_count = 0;
};

/*
  Ordered working set of an area's items with a movable cursor.

  Items live in an arena that never shrinks; the visiting order is a doubly
  linked list threaded through it, so skipping the current item is an O(1)
  unlink + append.
  The cursor is tracked both as a node and as an index.

  Invariants:
    Cursor() < Size() when non-empty, 0 when empty
    Skip() never changes Size(); skip counters only grow

  Not thread-safe; SessionEngine serializes access.
*/
class ItemQueue {
 public:
  ItemQueue() = default;

  // Throws util::ValidationError on duplicate item ids.
  explicit ItemQueue(const std::vector<model::AreaItem>& items);

  // Rebuilds a queue from Entries(); cursor is clamped into range.
  static ItemQueue Restore(const std::vector<QueueEntry>& entries, std::size_t cursor);

  std::size_t Size() const {
    return order_size_;
  }
  bool Empty() const {
    return order_size_ == 0;
  }
  std::size_t Cursor() const {
    return cursor_index_;
  }

  // nullptr when empty
  const model::AreaItem* Current() const;
  bool                   IsLast() const;

  // No-op at the last item; returns whether the cursor moved.
  bool Next();
  // False ("already at first item") at index 0.
  bool Previous();
  // False when index is out of range.
  bool GoTo(std::size_t index);

  /*
    Moves the item to the end of the order and bumps its skip counter.
    Skipping the current item leaves the cursor index in place, now on the
    following item. Throws util::NotFound for an unknown id.
  */
  void Skip(const std::string& item_id);

  bool     Contains(const std::string& item_id) const;
  uint32_t SkipCount(const std::string& item_id) const;

  // Throws util::NotFound for an unknown id.
  const model::AreaItem& Item(const std::string& item_id) const;
  model::AreaItem&       MutableItem(const std::string& item_id);

  // Visiting order, head to tail.
  std::vector<QueueEntry>  Entries() const;
  std::vector<std::string> Order() const;

 private:
  static constexpr std::size_t kNil = std::numeric_limits<std::size_t>::max();

  struct Node {
    QueueEntry  entry;
    std::size_t prev = kNil;
    std::size_t next = kNil;
  };

  void        Append(std::size_t slot);
  void        Unlink(std::size_t slot);
  std::size_t SlotOf(const std::string& item_id) const;

  std::vector<Node>                            arena_;
  std::unordered_map<std::string, std::size_t> slots_;

  std::size_t head_         = kNil;
  std::size_t tail_         = kNil;
  std::size_t order_size_   = 0;
  std::size_t cursor_node_  = kNil;
  std::size_t cursor_index_ = 0;
};

} // namespace stockcount::session
