#include "fedlink/Errors.hpp"
#include "fedlink/protocol/DataStream.hpp"
#include "fedlink/protocol/TensorCodec.hpp"
#include "test_support.hpp"

#include "fedlink/v1/aggregator.pb.h"

#include <cassert>
#include <memory>
#include <string>
#include <vector>

namespace {

using fedlink::protocol::from_datastream;
using fedlink::protocol::join_frames;
using fedlink::protocol::to_datastream;

fedlink::v1::TaskResults sample_results(std::size_t values) {
    fedlink::Tensor tensor;
    tensor.shape = {values};
    tensor.values.assign(values, 0.125f);

    fedlink::v1::TaskResults results;
    results.mutable_header()->set_sender("collab-1");
    results.set_round_number(7);
    results.set_task_name("train");
    results.set_data_size(1024);
    *results.add_tensors() = fedlink::protocol::Float32Codec{}.encode("layer.weight", tensor);
    return results;
}

void test_frames_respect_chunk_size() {
    const auto results = sample_results(300);
    const auto serialized = results.SerializeAsString();

    const auto frames = to_datastream(results, 100);
    assert(frames.size() == (serialized.size() + 99) / 100);
    for (std::size_t i = 0; i + 1 < frames.size(); ++i) {
        assert(frames[i].npbytes().size() == 100);
        assert(frames[i].size() == 100);
    }
    assert(frames.back().size() == frames.back().npbytes().size());
    assert(join_frames(frames) == serialized);
}

void test_reassembly() {
    const auto results = sample_results(64);
    const auto frames = to_datastream(results, 17);

    fedlink::v1::TaskResults decoded;
    from_datastream(frames, decoded);
    assert(decoded.SerializeAsString() == results.SerializeAsString());
}

void test_small_message_is_one_frame() {
    const auto results = sample_results(2);
    const auto frames = to_datastream(results);
    assert(frames.size() == 1);
    assert(frames[0].npbytes() == results.SerializeAsString());
}

void test_empty_message_produces_no_frames() {
    const fedlink::v1::TaskResults empty;
    assert(to_datastream(empty, 16).empty());

    fedlink::v1::TaskResults decoded;
    bool raised = false;
    try {
        from_datastream({}, decoded);
    } catch (const fedlink::CodecError& ex) {
        raised = true;
        assert(ex.code() == "E_CODEC");
    }
    assert(raised);
}

void test_garbage_payload_is_rejected() {
    std::vector<fedlink::v1::DataStream> frames(1);
    frames[0].set_npbytes(std::string("\xff\xff\xff\xff\xff", 5));
    frames[0].set_size(5);

    fedlink::v1::TaskResults decoded;
    bool raised = false;
    try {
        from_datastream(frames, decoded);
    } catch (const fedlink::CodecError&) {
        raised = true;
    }
    assert(raised);
}

void test_chunking_is_logged() {
    auto log = std::make_shared<fedlink::test::RecordingLog>();
    const auto frames = to_datastream(sample_results(50), 64, log.get());
    const auto entry = log->last("stream.chunked");
    assert(entry.has_value());
    assert(fedlink::test::RecordingLog::field(*entry, "frames") == std::to_string(frames.size()));
    assert(fedlink::test::RecordingLog::field(*entry, "chunk_bytes") == "64");
}

}  // namespace

int main() {
    test_frames_respect_chunk_size();
    test_reassembly();
    test_small_message_is_one_frame();
    test_empty_message_produces_no_frames();
    test_garbage_payload_is_rejected();
    test_chunking_is_logged();
    return 0;
}
