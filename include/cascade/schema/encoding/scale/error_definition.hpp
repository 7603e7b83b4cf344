#pragma once

#include <cascade/schema/error_definition.hpp>
#include <scale/scale.hpp>

namespace cascade::schema::encoding::scale {

void encode(cascade::schema::error_definition<1>&& o, ::scale::Encoder& encoder);
void decode(cascade::schema::error_definition<1>&& o, ::scale::Decoder& decoder);

}  // namespace cascade::schema::encoding::scale
