#include "configuration.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Overlook {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        LOG(INFO) << "Loaded configuration from " << filename;
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["overlook"]) {
        LOG(WARNING) << "Configuration has no 'overlook' root, nothing applied";
        return;
    }
    auto root = yaml["overlook"];

    // Framework
    if (root["framework"]) {
        auto framework = root["framework"];
        if (framework["name"]) config_.framework.name.set(framework["name"].as<std::string>());
        if (framework["user"]) config_.framework.user.set(framework["user"].as<std::string>());
        if (framework["orchestrator_address"]) config_.framework.orchestrator_address.set(framework["orchestrator_address"].as<std::string>());
        if (framework["task_id_prefix"]) config_.framework.task_id_prefix.set(framework["task_id_prefix"].as<std::string>());
    }

    // Task
    if (root["task"]) {
        auto task = root["task"];
        if (task["image"]) config_.task.image.set(task["image"].as<std::string>());
        if (task["cpus"]) config_.task.cpus.set(task["cpus"].as<double>());
        if (task["mem"]) config_.task.mem.set(task["mem"].as<double>());
        if (task["container_port"]) config_.task.container_port.set(task["container_port"].as<int>());
        if (task["network"]) config_.task.network.set(task["network"].as<std::string>());
        if (task["upstream_env"]) config_.task.upstream_env.set(task["upstream_env"].as<std::string>());
        if (task["upstream_flag"]) config_.task.upstream_flag.set(task["upstream_flag"].as<std::string>());
    }

    // Management
    if (root["management"]) {
        auto management = root["management"];
        if (management["listen_address"]) config_.management.listen_address.set(management["listen_address"].as<std::string>());
        if (management["port"]) config_.management.port.set(management["port"].as<int>());
    }

    // Targets
    if (root["targets"]) {
        config_.targets.initial.clear();
        for (const auto& target : root["targets"]) {
            config_.targets.initial.push_back(target.as<std::string>());
        }
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.framework.orchestrator_address.get().empty()) {
        validation_errors_.push_back("Orchestrator address is required");
    }

    // Launch template
    if (config_.task.image.get().empty()) {
        validation_errors_.push_back("Task image must not be empty");
    }
    if (config_.task.cpus.get() <= 0) {
        validation_errors_.push_back("Task cpus must be positive");
    }
    if (config_.task.mem.get() <= 0) {
        validation_errors_.push_back("Task mem must be positive");
    }
    if (config_.task.container_port.get() < 1 || config_.task.container_port.get() > 65535) {
        validation_errors_.push_back("Task container port must be between 1 and 65535");
    }
    const std::string network = config_.task.network.get();
    if (network != "BRIDGE" && network != "HOST") {
        validation_errors_.push_back("Task network must be BRIDGE or HOST, got " + network);
    }

    // Validate port ranges
    if (config_.management.port.get() < 1024 || config_.management.port.get() > 65535) {
        validation_errors_.push_back("Management port must be between 1024 and 65535");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Overlook
