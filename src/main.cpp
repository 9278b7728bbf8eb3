#include "fedlink/Config.hpp"
#include "fedlink/Errors.hpp"
#include "fedlink/Types.hpp"
#include "fedlink/client/AggregatorClient.hpp"
#include "fedlink/config/ProfileLoader.hpp"
#include "fedlink/logging/StructuredLogger.hpp"

#include <charconv>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#ifndef FEDLINK_VERSION
#define FEDLINK_VERSION "v0.3.0"
#endif

namespace {

constexpr std::string_view kFedlinkVersion = FEDLINK_VERSION;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {}, int exit_code = kExitUsage)
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)), exit_code_(exit_code) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& hint() const& {
        return hint_;
    }

    int exit_code() const noexcept {
        return exit_code_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    int exit_code_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

struct GlobalOptions {
    std::optional<std::string> config_path{};
    std::optional<std::string> host{};
    std::optional<std::uint16_t> port{};
    bool insecure{false};
    fedlink::logging::Level log_level{fedlink::logging::Level::Warning};
    std::optional<std::string> aggregator_uuid{};
    std::optional<std::string> federation_uuid{};
};

void print_usage() {
    std::cout << "fedlink " << kFedlinkVersion << std::endl;
    std::cout << "Usage: fedlink [options] <command> [args]\n\n";
    std::cout << "Global options:\n"
              << "  --config <file>           YAML client profile\n"
              << "  --host <host>             Aggregator host (default localhost)\n"
              << "  --port <port>             Aggregator port (default 50051)\n"
              << "  --insecure                Use a plaintext channel\n"
              << "  --log-level <level>       debug, info, warning or error (default warning)\n"
              << "  --aggregator-uuid <id>    Expected aggregator identity\n"
              << "  --federation-uuid <id>    Federation identity\n"
              << "  --help                    Show this message\n"
              << "  --version                 Print the version\n\n";
    std::cout << "Commands:\n"
              << "  check <collaborator>\n"
              << "  tasks <collaborator>\n"
              << "  add-collaborator <admin> <label> <cn>\n"
              << "  remove-collaborator <admin> <label> <cn>\n"
              << "  status <admin>\n"
              << "  straggler-cutoff <admin> <seconds>\n"
              << "  trained-model <experiment> [best|last]\n";
}

bool parse_uint64(std::string_view text, std::uint64_t& value) {
    if (text.empty()) {
        return false;
    }
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    return result.ec == std::errc{} && result.ptr == text.data() + text.size();
}

std::int32_t parse_seconds(const std::string& text) {
    std::uint64_t parsed{};
    if (!parse_uint64(text, parsed) || parsed > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
        throw_cli_error("E_INVALID_SECONDS",
                        "Invalid number of seconds: " + text,
                        "Provide a non-negative integer, e.g. straggler-cutoff admin 600");
    }
    return static_cast<std::int32_t>(parsed);
}

void expect_arguments(const std::string& command,
                      const std::vector<std::string>& arguments,
                      std::size_t minimum,
                      std::size_t maximum,
                      std::string_view synopsis) {
    if (arguments.size() < minimum || arguments.size() > maximum) {
        throw_cli_error("E_USAGE",
                        "Wrong number of arguments for '" + command + "'",
                        "Usage: fedlink " + std::string(synopsis));
    }
}

fedlink::ClientConfig build_config(const GlobalOptions& options) {
    fedlink::ClientConfig config{};
    if (options.config_path) {
        config = fedlink::config::load_client_config(*options.config_path);
    }
    if (options.host) {
        config.aggregator.host = *options.host;
    }
    if (options.port) {
        config.aggregator.port = *options.port;
    }
    if (options.insecure) {
        config.security.tls = false;
    }
    if (options.aggregator_uuid) {
        config.identity.aggregator_uuid = *options.aggregator_uuid;
    }
    if (options.federation_uuid) {
        config.identity.federation_uuid = *options.federation_uuid;
    }
    return config;
}

void print_tasks(const fedlink::TaskAssignment& assignment) {
    std::cout << "Round: " << assignment.round_number << std::endl;
    std::cout << "Tasks:";
    if (assignment.tasks.empty()) {
        std::cout << " (none)";
    }
    std::cout << std::endl;
    for (const auto& task : assignment.tasks) {
        std::cout << "  - " << task.name;
        if (!task.function_name.empty()) {
            std::cout << " (" << task.function_name << ")";
        }
        std::cout << std::endl;
    }
    std::cout << "Sleep: " << assignment.sleep_time << "s" << std::endl;
    std::cout << "Quit: " << (assignment.quit ? "yes" : "no") << std::endl;
}

void print_status(const fedlink::ExperimentStatus& status) {
    std::cout << "Experiment: " << (status.experiment_name.empty() ? "<none>" : status.experiment_name) << std::endl;
    std::cout << "State: " << status.state << std::endl;
    std::cout << "Round: " << status.current_round << "/" << status.total_rounds << std::endl;
    std::cout << "Progress: " << std::fixed << std::setprecision(1) << status.progress * 100.0 << "%" << std::endl;
    for (const auto& [label, progress] : status.collaborators) {
        std::cout << "  " << label << ": " << progress.completed_tasks << "/" << progress.assigned_tasks
                  << " tasks" << std::endl;
    }
}

void print_model(const fedlink::TensorMap& tensors) {
    std::cout << "Tensors: " << tensors.size() << std::endl;
    for (const auto& [name, tensor] : tensors) {
        std::cout << "  " << name << " [";
        for (std::size_t i = 0; i < tensor.shape.size(); ++i) {
            std::cout << (i == 0 ? "" : "x") << tensor.shape[i];
        }
        std::cout << "] " << tensor.values.size() << " values" << std::endl;
    }
}

int run_command(const std::string& command, const std::vector<std::string>& arguments, const GlobalOptions& options) {
    // Validate arguments before any channel is opened.
    if (command == "check") {
        expect_arguments(command, arguments, 1, 1, "check <collaborator>");
    } else if (command == "tasks") {
        expect_arguments(command, arguments, 1, 1, "tasks <collaborator>");
    } else if (command == "add-collaborator" || command == "remove-collaborator") {
        expect_arguments(command, arguments, 3, 3, command + " <admin> <label> <cn>");
    } else if (command == "status") {
        expect_arguments(command, arguments, 1, 1, "status <admin>");
    } else if (command == "straggler-cutoff") {
        expect_arguments(command, arguments, 2, 2, "straggler-cutoff <admin> <seconds>");
    } else if (command == "trained-model") {
        expect_arguments(command, arguments, 1, 2, "trained-model <experiment> [best|last]");
    } else {
        throw_cli_error("E_UNKNOWN_COMMAND", "Unknown command: " + command, "Run 'fedlink --help' for the command list");
    }

    std::optional<std::int32_t> seconds;
    if (command == "straggler-cutoff") {
        seconds = parse_seconds(arguments[1]);
    }
    auto model_type = fedlink::ModelType::Best;
    if (command == "trained-model" && arguments.size() == 2) {
        const auto parsed = fedlink::model_type_from_string(arguments[1]);
        if (!parsed) {
            throw_cli_error("E_INVALID_MODEL_TYPE",
                            "Unknown model type: " + arguments[1],
                            "Use 'best' or 'last'");
        }
        model_type = *parsed;
    }

    auto logger = std::make_shared<fedlink::logging::StructuredLogger>();
    logger->set_minimum_level(options.log_level);

    fedlink::ClientDependencies dependencies{};
    dependencies.log = logger;
    fedlink::AggregatorClient client(build_config(options), std::move(dependencies));

    if (command == "check") {
        client.connectivity_check(arguments[0]);
        std::cout << "Aggregator at " << client.target() << " is reachable" << std::endl;
    } else if (command == "tasks") {
        print_tasks(client.get_tasks(arguments[0]));
    } else if (command == "add-collaborator") {
        client.add_collaborator(arguments[0], arguments[1], arguments[2]);
        std::cout << "Added collaborator " << arguments[1] << std::endl;
    } else if (command == "remove-collaborator") {
        client.remove_collaborator(arguments[0], arguments[1], arguments[2]);
        std::cout << "Removed collaborator " << arguments[1] << std::endl;
    } else if (command == "status") {
        print_status(client.get_experiment_status(arguments[0]));
    } else if (command == "straggler-cutoff") {
        client.set_straggler_cutoff_time(arguments[0], *seconds);
        std::cout << "Straggler cutoff set to " << *seconds << "s" << std::endl;
    } else if (command == "trained-model") {
        print_model(client.get_trained_model_unheaded(arguments[0], model_type));
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };

        std::optional<std::string> command;
        std::vector<std::string> arguments;

        while (index < args.size()) {
            const auto arg = args[index++];
            if (!arg.starts_with("-")) {
                if (!command) {
                    command = std::string(arg);
                } else {
                    arguments.emplace_back(arg);
                }
                continue;
            }
            if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            }
            if (arg == "--version") {
                std::cout << "fedlink " << kFedlinkVersion << std::endl;
                return 0;
            }
            if (arg == "--config") {
                if (options.config_path.has_value()) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --config specified multiple times",
                                    "Provide the configuration file only once");
                }
                options.config_path = require_value(arg);
                continue;
            }
            if (arg == "--host") {
                options.host = require_value(arg);
                if (options.host->empty()) {
                    throw_cli_error("E_INVALID_HOST", "--host must not be empty");
                }
                continue;
            }
            if (arg == "--port") {
                const auto value = require_value(arg);
                std::uint64_t parsed{};
                if (!parse_uint64(value, parsed) || parsed == 0 || parsed > std::numeric_limits<std::uint16_t>::max()) {
                    throw_cli_error("E_INVALID_PORT",
                                    "--port must be between 1 and 65535",
                                    "Use the aggregator's listening port, e.g. --port 50051");
                }
                options.port = static_cast<std::uint16_t>(parsed);
                continue;
            }
            if (arg == "--insecure") {
                options.insecure = true;
                continue;
            }
            if (arg == "--log-level") {
                const auto value = require_value(arg);
                if (!fedlink::logging::level_from_string(value, options.log_level)) {
                    throw_cli_error("E_INVALID_LOG_LEVEL",
                                    "Unknown log level: " + value,
                                    "Use debug, info, warning or error");
                }
                continue;
            }
            if (arg == "--aggregator-uuid") {
                options.aggregator_uuid = require_value(arg);
                continue;
            }
            if (arg == "--federation-uuid") {
                options.federation_uuid = require_value(arg);
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(arg),
                            "Run 'fedlink --help' for the option list");
        }

        if (!command) {
            print_usage();
            return kExitUsage;
        }

        return run_command(*command, arguments, options);
    } catch (const CliException& ex) {
        std::cerr << ex.what() << std::endl;
        if (!ex.hint().empty()) {
            std::cerr << "Hint: " << ex.hint() << std::endl;
        }
        return ex.exit_code();
    } catch (const fedlink::TransportFailure& ex) {
        std::cerr << "Transport error [" << fedlink::status_code_name(ex.status()) << "]: " << ex.details()
                  << std::endl;
        if (!ex.hint().empty()) {
            std::cerr << "Hint: " << ex.hint() << std::endl;
        }
        return kExitFailure;
    } catch (const fedlink::Error& ex) {
        std::cerr << ex.what() << std::endl;
        if (!ex.hint().empty()) {
            std::cerr << "Hint: " << ex.hint() << std::endl;
        }
        return kExitFailure;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return kExitFailure;
    }
}
