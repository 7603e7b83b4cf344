#pragma once

#include <cascade/schema/parameter.hpp>
#include <scale/scale.hpp>

namespace cascade::schema::encoding::scale {

void encode(cascade::schema::parameter<1>&& o, ::scale::Encoder& encoder);
void decode(cascade::schema::parameter<1>&& o, ::scale::Decoder& decoder);

}  // namespace cascade::schema::encoding::scale
