#pragma once

#include <google/protobuf/message.h>

#include <string>

namespace recall::util {

// Serializes with proto field names preserved; throws std::runtime_error.
std::string ToJson(const google::protobuf::Message& message);

// Parses into message; throws std::runtime_error with the parser's reason.
void FromJson(const std::string& json, google::protobuf::Message* message, bool ignore_unknown_fields);

} // namespace recall::util
