#ifndef OVERLOOK_CONFIGURATION_H_
#define OVERLOOK_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Overlook {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct OverlookConfig {
    // Framework identity and the orchestrator endpoint it subscribes to
    struct Framework {
        ConfigValue<std::string> name{"overlook", "OVERLOOK_FRAMEWORK_NAME"};
        ConfigValue<std::string> user{"", "OVERLOOK_FRAMEWORK_USER"};
        ConfigValue<std::string> orchestrator_address{"", "OVERLOOK_ORCHESTRATOR"};
        ConfigValue<std::string> task_id_prefix{"viewer", "OVERLOOK_TASK_ID_PREFIX"};
    } framework;

    // Per-instance launch template. Every viewer task reserves exactly these resources.
    struct Task {
        ConfigValue<std::string> image{"kibana", "OVERLOOK_TASK_IMAGE"};
        ConfigValue<double> cpus{0.1, "OVERLOOK_TASK_CPUS"};
        ConfigValue<double> mem{128.0, "OVERLOOK_TASK_MEM"};
        ConfigValue<int> container_port{5601, "OVERLOOK_TASK_CONTAINER_PORT"};
        // BRIDGE or HOST
        ConfigValue<std::string> network{"BRIDGE", "OVERLOOK_TASK_NETWORK"};
        ConfigValue<std::string> upstream_env{"ELASTICSEARCH_URL", "OVERLOOK_TASK_UPSTREAM_ENV"};
        ConfigValue<std::string> upstream_flag{"--elasticsearch_url", "OVERLOOK_TASK_UPSTREAM_FLAG"};
    } task;

    // gRPC management endpoint
    struct Management {
        ConfigValue<std::string> listen_address{"0.0.0.0", "OVERLOOK_MANAGEMENT_ADDRESS"};
        ConfigValue<int> port{9001, "OVERLOOK_MANAGEMENT_PORT"};
    } management;

    // Targets required once each at startup
    struct Targets {
        std::vector<std::string> initial;
    } targets;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    Configuration() = default;

    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const OverlookConfig& config() const { return config_; }
    OverlookConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getOrchestratorAddress() const { return config_.framework.orchestrator_address.get(); }
    std::string getManagementAddress() const {
        return config_.management.listen_address.get() + ":" + std::to_string(config_.management.port.get());
    }
    std::vector<std::string> getInitialTargets() const { return config_.targets.initial; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    OverlookConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Applies every recognised key under the "overlook" root
    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Overlook

#endif // OVERLOOK_CONFIGURATION_H_
