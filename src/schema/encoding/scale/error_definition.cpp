#include <cascade/schema/encoding/scale/error_definition.hpp>

using namespace cascade::schema;

namespace cascade::schema::encoding::scale {

void encode(error_definition<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.error_id, encoder);
  encode(o.procedure_name, encoder);
  encode(o.error_name, encoder);
  encode(o.user_message, encoder);
  encode(o.developer_message, encoder);
}

void decode(error_definition<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.error_id, decoder);
  decode(o.procedure_name, decoder);
  decode(o.error_name, decoder);
  decode(o.user_message, decoder);
  decode(o.developer_message, decoder);
}

}  // namespace cascade::schema::encoding::scale
