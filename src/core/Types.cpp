#include "fedlink/Types.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <numeric>

namespace fedlink {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

}  // namespace

std::string Endpoint::target() const {
    return host + ":" + std::to_string(port);
}

std::vector<std::string> TaskAssignment::task_names() const {
    std::vector<std::string> names;
    names.reserve(tasks.size());
    for (const auto& task : tasks) {
        names.push_back(task.name);
    }
    return names;
}

std::size_t Tensor::element_count() const noexcept {
    if (shape.empty()) {
        return values.size();
    }
    return std::accumulate(shape.begin(), shape.end(), std::size_t{1}, std::multiplies<>());
}

std::optional<ModelType> model_type_from_string(const std::string& text) {
    const auto lowered = to_lower(text);
    if (lowered == "best" || lowered == "best_model") {
        return ModelType::Best;
    }
    if (lowered == "last" || lowered == "last_model") {
        return ModelType::Last;
    }
    return std::nullopt;
}

std::string model_type_to_string(ModelType type) {
    switch (type) {
        case ModelType::Best:
            return "best";
        case ModelType::Last:
            return "last";
    }
    return "best";
}

}  // namespace fedlink
