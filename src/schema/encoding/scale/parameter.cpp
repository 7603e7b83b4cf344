#include <cascade/schema/encoding/scale/parameter.hpp>

using namespace cascade::schema;

namespace cascade::schema::encoding::scale {

void encode(parameter<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.value, encoder);
  encode(o.description, encoder);
}

void decode(parameter<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.value, decoder);
  decode(o.description, decoder);
}

}  // namespace cascade::schema::encoding::scale
