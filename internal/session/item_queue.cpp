#include "internal/session/item_queue.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace stockcount::session {

ItemQueue::ItemQueue(const std::vector<model::AreaItem>& items) {
  arena_.reserve(items.size());
  for (const auto& item : items) {
    if (!slots_.emplace(item.id, arena_.size()).second) {
      throw util::ValidationError("duplicate area item id: " + item.id);
    }
    arena_.push_back(Node{QueueEntry{item, 0}, kNil, kNil});
    Append(arena_.size() - 1);
  }
  cursor_node_ = head_;
}

ItemQueue ItemQueue::Restore(const std::vector<QueueEntry>& entries, std::size_t cursor) {
  std::vector<model::AreaItem> items;
  items.reserve(entries.size());
  for (const auto& entry : entries) {
    items.push_back(entry.item);
  }

  ItemQueue queue(items);
  for (std::size_t i = 0; i < entries.size(); ++i) {
    queue.arena_[i].entry.skip_count = entries[i].skip_count;
  }
  if (!queue.Empty()) {
    queue.GoTo(std::min(cursor, queue.Size() - 1));
  }
  return queue;
}

const model::AreaItem* ItemQueue::Current() const {
  if (cursor_node_ == kNil) return nullptr;
  return &arena_[cursor_node_].entry.item;
}

bool ItemQueue::IsLast() const {
  return cursor_node_ != kNil && cursor_node_ == tail_;
}

bool ItemQueue::Next() {
  if (cursor_node_ == kNil || cursor_node_ == tail_) return false;
  cursor_node_ = arena_[cursor_node_].next;
  ++cursor_index_;
  return true;
}

bool ItemQueue::Previous() {
  if (cursor_node_ == kNil || cursor_node_ == head_) return false;
  cursor_node_ = arena_[cursor_node_].prev;
  --cursor_index_;
  return true;
}

bool ItemQueue::GoTo(std::size_t index) {
  if (index >= order_size_) return false;

  // walk from whichever end is closer
  std::size_t node = kNil;
  if (index < order_size_ / 2) {
    node = head_;
    for (std::size_t i = 0; i < index; ++i) node = arena_[node].next;
  } else {
    node = tail_;
    for (std::size_t i = order_size_ - 1; i > index; --i) node = arena_[node].prev;
  }

  cursor_node_  = node;
  cursor_index_ = index;
  return true;
}

void ItemQueue::Skip(const std::string& item_id) {
  const std::size_t slot = SlotOf(item_id);
  ++arena_[slot].entry.skip_count;

  if (slot == tail_) {
    return;
  }

  if (slot == cursor_node_) {
    // index stays, the node under it changes
    cursor_node_ = arena_[slot].next;
  } else {
    // skipped item sits before the cursor: everything after it shifts left
    bool before_cursor = false;
    for (std::size_t node = arena_[cursor_node_].prev; node != kNil; node = arena_[node].prev) {
      if (node == slot) {
        before_cursor = true;
        break;
      }
    }
    if (before_cursor) --cursor_index_;
  }

  Unlink(slot);
  Append(slot);
}

bool ItemQueue::Contains(const std::string& item_id) const {
  return slots_.contains(item_id);
}

uint32_t ItemQueue::SkipCount(const std::string& item_id) const {
  return arena_[SlotOf(item_id)].entry.skip_count;
}

const model::AreaItem& ItemQueue::Item(const std::string& item_id) const {
  return arena_[SlotOf(item_id)].entry.item;
}

model::AreaItem& ItemQueue::MutableItem(const std::string& item_id) {
  return arena_[SlotOf(item_id)].entry.item;
}

std::vector<QueueEntry> ItemQueue::Entries() const {
  std::vector<QueueEntry> out;
  out.reserve(order_size_);
  for (std::size_t node = head_; node != kNil; node = arena_[node].next) {
    out.push_back(arena_[node].entry);
  }
  return out;
}

std::vector<std::string> ItemQueue::Order() const {
  std::vector<std::string> out;
  out.reserve(order_size_);
  for (std::size_t node = head_; node != kNil; node = arena_[node].next) {
    out.push_back(arena_[node].entry.item.id);
  }
  return out;
}

void ItemQueue::Append(std::size_t slot) {
  auto& node = arena_[slot];
  node.prev  = tail_;
  node.next  = kNil;
  if (tail_ != kNil) {
    arena_[tail_].next = slot;
  } else {
    head_ = slot;
  }
  tail_ = slot;
  ++order_size_;
}

void ItemQueue::Unlink(std::size_t slot) {
  auto& node = arena_[slot];
  if (node.prev != kNil) {
    arena_[node.prev].next = node.next;
  } else {
    head_ = node.next;
  }
  if (node.next != kNil) {
    arena_[node.next].prev = node.prev;
  } else {
    tail_ = node.prev;
  }
  node.prev = kNil;
  node.next = kNil;
  --order_size_;
}

std::size_t ItemQueue::SlotOf(const std::string& item_id) const {
  auto it = slots_.find(item_id);
  if (it == slots_.end()) {
    throw util::NotFound("item not in session queue: " + item_id);
  }
  return it->second;
}

} // namespace stockcount::session
