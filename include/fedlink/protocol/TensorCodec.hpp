#pragma once

#include "fedlink/Types.hpp"

#include "fedlink/v1/base.pb.h"

#include <string>

namespace fedlink::protocol {

class TensorCodec {
public:
    virtual ~TensorCodec() = default;

    virtual Tensor decode(const v1::NamedTensor& named) const = 0;
    virtual v1::NamedTensor encode(const std::string& name, const Tensor& tensor) const = 0;
};

// Uncompressed little-endian float32; the shape travels in the first
// transformer metadata entry's int_list.
class Float32Codec final : public TensorCodec {
public:
    Tensor decode(const v1::NamedTensor& named) const override;
    v1::NamedTensor encode(const std::string& name, const Tensor& tensor) const override;
};

TensorMap deconstruct_model(const v1::ModelProto& model, const TensorCodec& codec);
v1::ModelProto construct_model(const TensorMap& tensors, const TensorCodec& codec);

}  // namespace fedlink::protocol
