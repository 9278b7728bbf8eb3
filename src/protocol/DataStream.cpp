#include "fedlink/protocol/DataStream.hpp"

#include "fedlink/Errors.hpp"

#include <algorithm>

namespace fedlink::protocol {

std::vector<v1::DataStream> to_datastream(const google::protobuf::MessageLite& message,
                                          std::size_t chunk_bytes,
                                          logging::EventLog* log) {
    std::string serialized;
    if (!message.SerializeToString(&serialized)) {
        throw CodecError("failed to serialize " + message.GetTypeName() + " for streaming");
    }

    const auto total = serialized.size();
    const auto buffer_size = chunk_bytes == 0 ? total : std::min(chunk_bytes, total);

    std::vector<v1::DataStream> frames;
    if (buffer_size > 0) {
        frames.reserve((total + buffer_size - 1) / buffer_size);
    }
    for (std::size_t offset = 0; offset < total; offset += buffer_size) {
        const auto length = std::min(buffer_size, total - offset);
        v1::DataStream frame;
        frame.set_npbytes(serialized.substr(offset, length));
        frame.set_size(static_cast<std::uint32_t>(length));
        frames.push_back(std::move(frame));
    }

    if (log != nullptr) {
        log->log(logging::Level::Debug,
                 "stream.chunked",
                 {{"type", message.GetTypeName()},
                  {"bytes", std::to_string(total)},
                  {"chunk_bytes", std::to_string(buffer_size)},
                  {"frames", std::to_string(frames.size())}});
    }
    return frames;
}

std::string join_frames(const std::vector<v1::DataStream>& frames) {
    std::string joined;
    for (const auto& frame : frames) {
        joined.append(frame.npbytes());
    }
    return joined;
}

void from_datastream(const std::vector<v1::DataStream>& frames, google::protobuf::MessageLite& message) {
    const auto joined = join_frames(frames);
    if (joined.empty()) {
        throw CodecError("received empty stream for " + message.GetTypeName());
    }
    if (!message.ParseFromString(joined)) {
        throw CodecError("stream payload does not parse as " + message.GetTypeName());
    }
}

}  // namespace fedlink::protocol
