#include <cascade/schema/encoding/scale/audit_entry.hpp>

using namespace cascade::schema;

namespace cascade::schema::encoding::scale {

void encode(audit_entry<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.audit_id, encoder);
  encode(o.procedure_name, encoder);
  encode(o.input_data, encoder);
  encode(o.output_data, encoder);
  encode(o.error_message, encoder);
  encode(o.start_time, encoder);
  encode(o.end_time, encoder);
}

void decode(audit_entry<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.audit_id, decoder);
  decode(o.procedure_name, decoder);
  decode(o.input_data, decoder);
  decode(o.output_data, decoder);
  decode(o.error_message, decoder);
  decode(o.start_time, decoder);
  decode(o.end_time, decoder);
}

}  // namespace cascade::schema::encoding::scale
