#pragma once

#include "internal/model/types.hpp"
#include "stockcount/v1.hpp"

namespace stockcount::model {

/*
  Conversions between the domain structs and the stockcount.core.v1 wire types.

  The wire enums carry an UNSPECIFIED zero value; decoding maps it to the
  domain default (manual, daily, counted).
*/

v1::UpdateMethod    ToProto(UpdateMethod method);
UpdateMethod        FromProto(v1::UpdateMethod method);
v1::CheckFrequency  ToProto(CheckFrequency frequency);
CheckFrequency      FromProto(v1::CheckFrequency frequency);
v1::ItemUpdateStatus ToProto(ItemStatus status);
ItemStatus          FromProto(v1::ItemUpdateStatus status);

v1::StorageArea ToProto(const StorageArea& area);
StorageArea     FromProto(const v1::StorageArea& area);

v1::AreaItem ToProto(const AreaItem& item);
AreaItem     FromProto(const v1::AreaItem& item);

v1::AreaSnapshot ToProto(const AreaSnapshot& snapshot);
AreaSnapshot     FromProto(const v1::AreaSnapshot& snapshot);

v1::SessionItemUpdate ToProto(const SessionItemUpdate& update);
SessionItemUpdate     FromProto(const v1::SessionItemUpdate& update);

} // namespace stockcount::model
