#include "manager/records.hpp"

#include <stdexcept>

#include "absl/strings/str_cat.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "google/protobuf/util/time_util.h"
#include "manager/event_queue.hpp"

namespace manager {

namespace {
std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.always_print_primitive_fields = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error(absl::StrCat("Cannot convert ",
                                          message.GetTypeName(), " to JSON: ",
                                          status.ToString()));
  }
  return json;
}
}  // namespace

std::string Now() {
  return google::protobuf::util::TimeUtil::ToString(
      google::protobuf::util::TimeUtil::GetCurrentTime());
}

proto::StoredMessage ToStoredMessage(const proto::Event& event,
                                     int64_t order_index) {
  const google::protobuf::Reflection* reflection = event.GetReflection();
  const google::protobuf::FieldDescriptor* field =
      reflection->GetOneofFieldDescriptor(
          event, proto::Event::descriptor()->FindOneofByName("event"));
  if (field == nullptr) throw std::invalid_argument("Event with no payload");

  proto::StoredMessage message;
  message.set_event_type(EventType(event));
  message.set_content(ToJson(reflection->GetMessage(event, field)));
  message.set_timestamp(Now());
  message.set_order_index(order_index);
  return message;
}

proto::StoredMessage UserQuery(const std::string& task, int64_t order_index) {
  google::protobuf::Struct content;
  (*content.mutable_fields())["query"].set_string_value(task);
  proto::StoredMessage message;
  message.set_event_type("user_query");
  message.set_content(ToJson(content));
  message.set_timestamp(Now());
  message.set_order_index(order_index);
  return message;
}

}  // namespace manager
