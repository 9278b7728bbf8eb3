#pragma once

#include "fedlink/logging/StructuredLogger.hpp"

#include "fedlink/v1/base.pb.h"

#include <google/protobuf/message_lite.h>

#include <cstddef>
#include <string>
#include <vector>

namespace fedlink::protocol {

inline constexpr std::size_t kDefaultStreamChunkBytes = 2 * 1024 * 1024;

// Serializes the message and cuts it into frames of at most chunk_bytes each.
std::vector<v1::DataStream> to_datastream(const google::protobuf::MessageLite& message,
                                          std::size_t chunk_bytes = kDefaultStreamChunkBytes,
                                          logging::EventLog* log = nullptr);

// Concatenates frame payloads and parses them into message. Throws CodecError on an
// empty stream or a payload that does not parse.
void from_datastream(const std::vector<v1::DataStream>& frames, google::protobuf::MessageLite& message);

std::string join_frames(const std::vector<v1::DataStream>& frames);

}  // namespace fedlink::protocol
