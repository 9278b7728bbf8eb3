#include "fedlink/protocol/TensorCodec.hpp"

#include "fedlink/Errors.hpp"

#include <bit>
#include <cstdint>

namespace fedlink::protocol {

namespace {

constexpr std::size_t kFloatBytes = sizeof(float);

static_assert(sizeof(float) == sizeof(std::uint32_t));

void append_float(std::string& buffer, float value) {
    const auto bits = std::bit_cast<std::uint32_t>(value);
    for (int shift = 0; shift < 32; shift += 8) {
        buffer.push_back(static_cast<char>((bits >> shift) & 0xFFu));
    }
}

float read_float(const std::string& buffer, std::size_t offset) {
    std::uint32_t bits = 0;
    for (std::size_t index = 0; index < kFloatBytes; ++index) {
        bits |= static_cast<std::uint32_t>(static_cast<unsigned char>(buffer[offset + index])) << (8 * index);
    }
    return std::bit_cast<float>(bits);
}

}  // namespace

Tensor Float32Codec::decode(const v1::NamedTensor& named) const {
    const auto& bytes = named.data_bytes();
    if (bytes.size() % kFloatBytes != 0) {
        throw CodecError("tensor '" + named.name() + "' payload is not a whole number of float32 values");
    }

    Tensor tensor;
    if (named.transformer_metadata_size() > 0) {
        for (const auto dimension : named.transformer_metadata(0).int_list()) {
            if (dimension < 0) {
                throw CodecError("tensor '" + named.name() + "' has a negative dimension");
            }
            tensor.shape.push_back(static_cast<std::size_t>(dimension));
        }
    }

    const auto count = bytes.size() / kFloatBytes;
    tensor.values.reserve(count);
    for (std::size_t index = 0; index < count; ++index) {
        tensor.values.push_back(read_float(bytes, index * kFloatBytes));
    }

    if (tensor.shape.empty()) {
        tensor.shape.push_back(count);
    }
    if (tensor.element_count() != count) {
        throw CodecError("tensor '" + named.name() + "' shape does not match its payload of " +
                         std::to_string(count) + " values");
    }
    return tensor;
}

v1::NamedTensor Float32Codec::encode(const std::string& name, const Tensor& tensor) const {
    if (tensor.element_count() != tensor.values.size()) {
        throw CodecError("tensor '" + name + "' shape does not match its values");
    }

    v1::NamedTensor named;
    named.set_name(name);
    named.set_lossless(true);

    auto* metadata = named.add_transformer_metadata();
    for (const auto dimension : tensor.shape) {
        metadata->add_int_list(static_cast<std::int32_t>(dimension));
    }

    std::string bytes;
    bytes.reserve(tensor.values.size() * kFloatBytes);
    for (const auto value : tensor.values) {
        append_float(bytes, value);
    }
    named.set_data_bytes(std::move(bytes));
    return named;
}

TensorMap deconstruct_model(const v1::ModelProto& model, const TensorCodec& codec) {
    TensorMap tensors;
    for (const auto& named : model.tensors()) {
        tensors[named.name()] = codec.decode(named);
    }
    return tensors;
}

v1::ModelProto construct_model(const TensorMap& tensors, const TensorCodec& codec) {
    v1::ModelProto model;
    for (const auto& [name, tensor] : tensors) {
        *model.add_tensors() = codec.encode(name, tensor);
    }
    return model;
}

}  // namespace fedlink::protocol
