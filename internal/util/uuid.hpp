#pragma once

#include <string>

namespace stockcount::util {

/*
  Identifier generation

  Session ids and pending-update ids are random RFC4122 v4 UUIDs in
  lowercase 8-4-4-4-12 form. Ids only need to be unique per device; the
  Inventory Service keys writes by (session_id, area_item_id).
*/
std::string NewId();

} // namespace stockcount::util
