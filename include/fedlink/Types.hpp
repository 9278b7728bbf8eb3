#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fedlink {

struct Endpoint {
    std::string host{"localhost"};
    std::uint16_t port{50051};

    std::string target() const;
};

// Identities stamped on every headed request and expected back on every response.
struct Identity {
    std::string aggregator_uuid;
    std::string federation_uuid;
    std::optional<std::string> single_col_cert_common_name{};
};

struct Task {
    std::string name;
    std::string function_name;
    std::string task_type;
    bool apply_local{false};
};

struct TaskAssignment {
    std::vector<Task> tasks;
    std::int32_t round_number{0};
    std::int32_t sleep_time{0};
    bool quit{false};

    std::vector<std::string> task_names() const;
};

struct CollaboratorProgress {
    std::int32_t completed_tasks{0};
    std::int32_t assigned_tasks{0};
};

struct ExperimentStatus {
    std::string experiment_name;
    std::string state;
    std::int32_t current_round{0};
    std::int32_t total_rounds{0};
    double progress{0.0};
    std::map<std::string, CollaboratorProgress> collaborators;
};

struct Tensor {
    std::vector<std::size_t> shape;
    std::vector<float> values;

    std::size_t element_count() const noexcept;
};

using TensorMap = std::map<std::string, Tensor>;

enum class ModelType {
    Best,
    Last
};

std::optional<ModelType> model_type_from_string(const std::string& text);
std::string model_type_to_string(ModelType type);

}  // namespace fedlink
