#pragma once

#include <cascade/schema/audit_entry.hpp>
#include <scale/scale.hpp>

namespace cascade::schema::encoding::scale {

void encode(cascade::schema::audit_entry<1>&& o, ::scale::Encoder& encoder);
void decode(cascade::schema::audit_entry<1>&& o, ::scale::Decoder& decoder);

}  // namespace cascade::schema::encoding::scale
