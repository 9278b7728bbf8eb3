#include "fedlink/client/AggregatorClient.hpp"

#include "fedlink/Errors.hpp"
#include "fedlink/protocol/DataStream.hpp"
#include "fedlink/protocol/HeaderValidator.hpp"
#include "fedlink/transport/ChannelFactory.hpp"
#include "fedlink/transport/ConnectionLifecycle.hpp"
#include "fedlink/transport/RetryInterceptor.hpp"

#include "fedlink/v1/aggregator.grpc.pb.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace fedlink {

namespace {

using Stub = v1::Aggregator::Stub;

transport::RetryPolicy make_retry_policy(const ClientConfig& config) {
    transport::RetryPolicy policy;
    policy.retryable = config.retryable_status_codes;
    policy.max_attempts = config.retry_attempt_limit;
    policy.deadline = config.retry_deadline;
    return policy;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

ExperimentStatus to_experiment_status(const v1::GetExperimentStatusResponse& response) {
    ExperimentStatus status;
    status.experiment_name = response.experiment_name();
    status.state = lowercase(v1::GetExperimentStatusResponse::State_Name(response.state()));
    status.current_round = response.current_round();
    status.total_rounds = response.total_rounds();
    if (response.total_rounds() > 0) {
        status.progress = static_cast<double>(response.current_round()) /
                          static_cast<double>(response.total_rounds());
    }
    for (const auto& entry : response.collaborators()) {
        status.collaborators[entry.label()] = CollaboratorProgress{
            .completed_tasks = entry.completed_tasks(),
            .assigned_tasks = entry.assigned_tasks(),
        };
    }
    return status;
}

v1::GetTrainedModelRequest::ModelType to_proto(ModelType type) {
    switch (type) {
        case ModelType::Best:
            return v1::GetTrainedModelRequest::BEST_MODEL;
        case ModelType::Last:
            return v1::GetTrainedModelRequest::LAST_MODEL;
    }
    return v1::GetTrainedModelRequest::BEST_MODEL;
}

}  // namespace

class AggregatorClient::Impl {
public:
    Impl(ClientConfig config, ClientDependencies dependencies)
        : config_(std::move(config)),
          target_(config_.aggregator.target()),
          log_(dependencies.log ? std::move(dependencies.log)
                                : std::make_shared<logging::StructuredLogger>()),
          backoff_(dependencies.backoff ? std::move(dependencies.backoff)
                                        : std::make_shared<transport::ConstantBackoff>(
                                              config_.reconnect_interval, target_, log_)),
          codec_(dependencies.codec ? std::move(dependencies.codec)
                                    : std::make_shared<const protocol::Float32Codec>()),
          channels_(config_.channel, log_),
          retry_(make_retry_policy(config_), backoff_, log_),
          headers_(config_.identity, log_),
          lifecycle_(target_,
                     [this]() { return channels_.open(config_.aggregator, config_.security); },
                     log_) {}

    TaskAssignment get_tasks(const std::string& caller) {
        v1::GetTasksRequest request;
        *request.mutable_header() = headers_.stamp(caller);

        const auto response = resilient<v1::GetTasksResponse>(
            caller, [&](Stub& stub, grpc::ClientContext& context, v1::GetTasksResponse* out) {
                return stub.GetTasks(&context, request, out);
            });

        TaskAssignment assignment;
        for (const auto& task : response.tasks()) {
            assignment.tasks.push_back(Task{
                .name = task.name(),
                .function_name = task.function_name(),
                .task_type = task.task_type(),
                .apply_local = task.apply_local(),
            });
        }
        assignment.round_number = response.round_number();
        assignment.sleep_time = response.sleep_time();
        assignment.quit = response.quit();
        return assignment;
    }

    v1::NamedTensor get_aggregated_tensor(const std::string& caller,
                                          const std::string& tensor_name,
                                          std::int32_t round_number,
                                          bool report,
                                          const std::vector<std::string>& tags,
                                          bool require_lossless) {
        v1::GetAggregatedTensorRequest request;
        *request.mutable_header() = headers_.stamp(caller);
        request.set_tensor_name(tensor_name);
        request.set_round_number(round_number);
        request.set_report(report);
        for (const auto& tag : tags) {
            request.add_tags(tag);
        }
        request.set_require_lossless(require_lossless);

        auto response = resilient<v1::GetAggregatedTensorResponse>(
            caller, [&](Stub& stub, grpc::ClientContext& context, v1::GetAggregatedTensorResponse* out) {
                return stub.GetAggregatedTensor(&context, request, out);
            });
        return std::move(*response.mutable_tensor());
    }

    void send_local_task_results(const std::string& caller,
                                 std::int32_t round_number,
                                 const std::string& task_name,
                                 std::int32_t data_size,
                                 const std::vector<v1::NamedTensor>& named_tensors) {
        v1::TaskResults request;
        *request.mutable_header() = headers_.stamp(caller);
        request.set_round_number(round_number);
        request.set_task_name(task_name);
        request.set_data_size(data_size);
        for (const auto& tensor : named_tensors) {
            *request.add_tensors() = tensor;
        }

        const auto frames = protocol::to_datastream(request, config_.stream_chunk_bytes, log_.get());

        lifecycle_.run([&](const std::shared_ptr<grpc::Channel>& channel) {
            auto stub = v1::Aggregator::NewStub(channel);
            const auto response = resend([&]() {
                v1::SendLocalTaskResultsResponse out;
                auto status = retry_.invoke_streamed<v1::DataStream>(
                    [&](grpc::ClientContext& context) {
                        out.Clear();
                        return stub->SendLocalTaskResults(&context, &out);
                    },
                    frames);
                return std::make_pair(std::move(status), std::move(out));
            });
            headers_.validate(response.header(), caller);
        });
    }

    void connectivity_check(const std::string& caller) {
        v1::ConnectivityCheckRequest request;
        *request.mutable_header() = headers_.stamp(caller);
        terminal<v1::ConnectivityCheckResponse>(
            caller, "connectivity_check",
            [&](Stub& stub, grpc::ClientContext& context, v1::ConnectivityCheckResponse* out) {
                return stub.ConnectivityCheck(&context, request, out);
            });
    }

    void add_collaborator(const std::string& admin, const std::string& label, const std::string& cn) {
        v1::AddCollaboratorRequest request;
        *request.mutable_header() = headers_.stamp(admin);
        request.set_collaborator_label(label);
        request.set_collaborator_cn(cn);
        terminal<v1::AddCollaboratorResponse>(
            admin, "add_collaborator",
            [&](Stub& stub, grpc::ClientContext& context, v1::AddCollaboratorResponse* out) {
                return stub.AddCollaborator(&context, request, out);
            });
    }

    void remove_collaborator(const std::string& admin, const std::string& label, const std::string& cn) {
        v1::RemoveCollaboratorRequest request;
        *request.mutable_header() = headers_.stamp(admin);
        request.set_collaborator_label(label);
        request.set_collaborator_cn(cn);
        terminal<v1::RemoveCollaboratorResponse>(
            admin, "remove_collaborator",
            [&](Stub& stub, grpc::ClientContext& context, v1::RemoveCollaboratorResponse* out) {
                return stub.RemoveCollaborator(&context, request, out);
            });
    }

    ExperimentStatus get_experiment_status(const std::string& admin) {
        v1::GetExperimentStatusRequest request;
        *request.mutable_header() = headers_.stamp(admin);
        const auto response = terminal<v1::GetExperimentStatusResponse>(
            admin, "get_experiment_status",
            [&](Stub& stub, grpc::ClientContext& context, v1::GetExperimentStatusResponse* out) {
                return stub.GetExperimentStatus(&context, request, out);
            });
        return to_experiment_status(response);
    }

    void set_straggler_cutoff_time(const std::string& admin, std::int32_t timeout_in_seconds) {
        v1::SetStragglerCutoffTimeRequest request;
        *request.mutable_header() = headers_.stamp(admin);
        request.set_timeout_in_seconds(timeout_in_seconds);
        terminal<v1::SetStragglerCutoffTimeResponse>(
            admin, "set_straggler_cutoff_time",
            [&](Stub& stub, grpc::ClientContext& context, v1::SetStragglerCutoffTimeResponse* out) {
                return stub.SetStragglerCutoffTime(&context, request, out);
            });
    }

    TensorMap get_trained_model_unheaded(const std::string& experiment_name, ModelType model_type) {
        v1::GetTrainedModelRequest request;
        request.set_experiment_name(experiment_name);
        request.set_model_type(to_proto(model_type));

        return lifecycle_.run([&](const std::shared_ptr<grpc::Channel>& channel) {
            auto stub = v1::Aggregator::NewStub(channel);
            v1::TrainedModelResponse response;
            const auto status = retry_.invoke_unary([&](grpc::ClientContext& context) {
                response.Clear();
                return stub->GetTrainedModel(&context, request, &response);
            });
            if (!status.ok()) {
                raise_failure(status);
            }
            return protocol::deconstruct_model(response.model_proto(), *codec_);
        });
    }

    void reconnect() { lifecycle_.reconnect(); }
    void disconnect() { lifecycle_.disconnect(); }
    bool connected() const { return lifecycle_.connected(); }

    const std::string& target() const noexcept { return target_; }
    const ClientConfig& config() const noexcept { return config_; }

private:
    // lifecycle(resend(retry(call))), then header validation.
    template <typename Response, typename Call>
    Response resilient(const std::string& caller, Call&& call) {
        return lifecycle_.run([&](const std::shared_ptr<grpc::Channel>& channel) {
            auto stub = v1::Aggregator::NewStub(channel);
            Response response = resend([&]() {
                Response out;
                auto status = retry_.invoke_unary([&](grpc::ClientContext& context) {
                    out.Clear();
                    return call(*stub, context, &out);
                });
                return std::make_pair(std::move(status), std::move(out));
            });
            headers_.validate(response.header(), caller);
            return response;
        });
    }

    // Every other failure left by the retry layer is sent again. A retryable
    // status here means the retry budget is spent, so it is raised together
    // with UNAUTHENTICATED. Only UNKNOWN resends are logged.
    template <typename Attempt>
    auto resend(Attempt&& attempt) -> decltype(attempt().second) {
        for (std::size_t attempts = 1;; ++attempts) {
            auto result = attempt();
            const auto& status = result.first;
            if (status.ok()) {
                return std::move(result.second);
            }
            const auto code = status.error_code();
            if (code == grpc::StatusCode::UNAUTHENTICATED || retry_.policy().should_retry(code)) {
                raise_failure(status);
            }
            if (config_.resend_attempt_limit.has_value() && attempts >= *config_.resend_attempt_limit) {
                if (code == grpc::StatusCode::UNKNOWN) {
                    throw TransientTransportFailure(code, status.error_message());
                }
                raise_failure(status);
            }
            if (code == grpc::StatusCode::UNKNOWN) {
                log_->log(logging::Level::Info,
                          "transport.resend",
                          {{"target", target_}, {"attempt", std::to_string(attempts)}});
            }
        }
    }

    // Single attempt; any failure is final for the caller.
    template <typename Response, typename Call>
    Response terminal(const std::string& caller, const char* operation, Call&& call) {
        return lifecycle_.run([&](const std::shared_ptr<grpc::Channel>& channel) {
            auto stub = v1::Aggregator::NewStub(channel);
            Response response;
            grpc::Status status;
            {
                grpc::ClientContext context;
                status = call(*stub, context, &response);
            }
            if (!status.ok()) {
                log_->log(logging::Level::Error,
                          "transport.fatal",
                          {{"operation", operation},
                           {"target", target_},
                           {"code", status_code_name(status.error_code())},
                           {"details", status.error_message()}});
                if (status.error_code() == grpc::StatusCode::UNAUTHENTICATED) {
                    throw AuthenticationFailure(status.error_code(), status.error_message());
                }
                throw UnhandledTransportFailure(status.error_code(), status.error_message());
            }
            headers_.validate(response.header(), caller);
            return response;
        });
    }

    [[noreturn]] void raise_failure(const grpc::Status& status) const {
        const auto code = status.error_code();
        if (code == grpc::StatusCode::UNAUTHENTICATED) {
            throw AuthenticationFailure(code, status.error_message());
        }
        if (retry_.policy().should_retry(code)) {
            throw TransientTransportFailure(code, status.error_message());
        }
        throw TransportFailure(code, status.error_message());
    }

    ClientConfig config_;
    std::string target_;
    std::shared_ptr<logging::EventLog> log_;
    std::shared_ptr<transport::BackoffPolicy> backoff_;
    std::shared_ptr<const protocol::TensorCodec> codec_;
    transport::ChannelFactory channels_;
    transport::RetryInterceptor retry_;
    protocol::HeaderValidator headers_;
    transport::ConnectionLifecycle lifecycle_;
};

AggregatorClient::AggregatorClient(ClientConfig config, ClientDependencies dependencies)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(dependencies))) {}

AggregatorClient::~AggregatorClient() = default;

TaskAssignment AggregatorClient::get_tasks(const std::string& collaborator_name) {
    return impl_->get_tasks(collaborator_name);
}

v1::NamedTensor AggregatorClient::get_aggregated_tensor(const std::string& collaborator_name,
                                                        const std::string& tensor_name,
                                                        std::int32_t round_number,
                                                        bool report,
                                                        const std::vector<std::string>& tags,
                                                        bool require_lossless) {
    return impl_->get_aggregated_tensor(collaborator_name, tensor_name, round_number, report, tags,
                                        require_lossless);
}

void AggregatorClient::send_local_task_results(const std::string& collaborator_name,
                                               std::int32_t round_number,
                                               const std::string& task_name,
                                               std::int32_t data_size,
                                               const std::vector<v1::NamedTensor>& named_tensors) {
    impl_->send_local_task_results(collaborator_name, round_number, task_name, data_size, named_tensors);
}

void AggregatorClient::connectivity_check(const std::string& collaborator_name) {
    impl_->connectivity_check(collaborator_name);
}

void AggregatorClient::add_collaborator(const std::string& admin_name,
                                        const std::string& collaborator_label,
                                        const std::string& collaborator_cn) {
    impl_->add_collaborator(admin_name, collaborator_label, collaborator_cn);
}

void AggregatorClient::remove_collaborator(const std::string& admin_name,
                                           const std::string& collaborator_label,
                                           const std::string& collaborator_cn) {
    impl_->remove_collaborator(admin_name, collaborator_label, collaborator_cn);
}

ExperimentStatus AggregatorClient::get_experiment_status(const std::string& admin_name) {
    return impl_->get_experiment_status(admin_name);
}

void AggregatorClient::set_straggler_cutoff_time(const std::string& admin_name, std::int32_t timeout_in_seconds) {
    impl_->set_straggler_cutoff_time(admin_name, timeout_in_seconds);
}

TensorMap AggregatorClient::get_trained_model_unheaded(const std::string& experiment_name, ModelType model_type) {
    return impl_->get_trained_model_unheaded(experiment_name, model_type);
}

void AggregatorClient::reconnect() {
    impl_->reconnect();
}

void AggregatorClient::disconnect() {
    impl_->disconnect();
}

bool AggregatorClient::connected() const {
    return impl_->connected();
}

const std::string& AggregatorClient::target() const noexcept {
    return impl_->target();
}

const ClientConfig& AggregatorClient::config() const noexcept {
    return impl_->config();
}

}  // namespace fedlink
