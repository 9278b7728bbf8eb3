#pragma once

#include "fedlink/Config.hpp"
#include "fedlink/Export.hpp"
#include "fedlink/Types.hpp"
#include "fedlink/logging/StructuredLogger.hpp"
#include "fedlink/protocol/TensorCodec.hpp"
#include "fedlink/transport/Backoff.hpp"

#include "fedlink/v1/base.pb.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fedlink {

// Optional overrides; anything left empty is built from the ClientConfig.
struct ClientDependencies {
    std::shared_ptr<logging::EventLog> log{};
    std::shared_ptr<transport::BackoffPolicy> backoff{};
    std::shared_ptr<const protocol::TensorCodec> codec{};
};

// Collaborator and administrator access to the aggregator.
//
// Resilient operations (tasks, aggregated tensors, task results, trained model)
// retry transient statuses with backoff. Terminal operations (connectivity check
// and the administrative calls) make a single attempt and raise
// UnhandledTransportFailure on any failure status. Every headed response is
// checked against the configured identities before it is returned.
class FEDLINK_API AggregatorClient {
public:
    explicit AggregatorClient(ClientConfig config, ClientDependencies dependencies = {});
    ~AggregatorClient();

    AggregatorClient(const AggregatorClient&) = delete;
    AggregatorClient& operator=(const AggregatorClient&) = delete;

    TaskAssignment get_tasks(const std::string& collaborator_name);

    v1::NamedTensor get_aggregated_tensor(const std::string& collaborator_name,
                                          const std::string& tensor_name,
                                          std::int32_t round_number,
                                          bool report,
                                          const std::vector<std::string>& tags,
                                          bool require_lossless);

    // The request is streamed as DataStream frames of at most stream_chunk_bytes.
    void send_local_task_results(const std::string& collaborator_name,
                                 std::int32_t round_number,
                                 const std::string& task_name,
                                 std::int32_t data_size,
                                 const std::vector<v1::NamedTensor>& named_tensors);

    void connectivity_check(const std::string& collaborator_name);

    void add_collaborator(const std::string& admin_name,
                          const std::string& collaborator_label,
                          const std::string& collaborator_cn);
    void remove_collaborator(const std::string& admin_name,
                             const std::string& collaborator_label,
                             const std::string& collaborator_cn);
    ExperimentStatus get_experiment_status(const std::string& admin_name);
    void set_straggler_cutoff_time(const std::string& admin_name, std::int32_t timeout_in_seconds);

    // Neither stamps nor validates an identity header.
    TensorMap get_trained_model_unheaded(const std::string& experiment_name, ModelType model_type);

    void reconnect();
    void disconnect();

    [[nodiscard]] bool connected() const;
    [[nodiscard]] const std::string& target() const noexcept;
    [[nodiscard]] const ClientConfig& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace fedlink
