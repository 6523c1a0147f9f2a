/**
 * @file node.cpp
 * @brief Implementation of the Node base class.
 */

#include "hippocampus_common/node.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace hippocampus_common {

namespace {

rclcpp::SignalHandlerOptions signal_handler_options(bool disable_signals) {
    return disable_signals ? rclcpp::SignalHandlerOptions::None
                           : rclcpp::SignalHandlerOptions::All;
}

}  // namespace

void init(int argc, char const* const* argv, bool disable_signals) {
    rclcpp::init(argc, argv, rclcpp::InitOptions(), signal_handler_options(disable_signals));
}

std::string anonymous_name(const std::string& name) {
    // Strictly increasing so two names created in the same millisecond differ.
    static std::atomic<std::int64_t> last_stamp{0};
    std::int64_t stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
    std::int64_t previous = last_stamp.load();
    std::int64_t next = 0;
    do {
        next = std::max(stamp, previous + 1);
    } while (!last_stamp.compare_exchange_weak(previous, next));

    return name + "_" + std::to_string(::getpid()) + "_" + std::to_string(next);
}

//=====================================
Node::Node(const std::string& name, bool anonymous, bool disable_signals,
           const rclcpp::NodeOptions& options)
    : rclcpp::Node(initialize(name, anonymous, disable_signals), options),
      parameters_(std::make_unique<LocalParameterStore>(this->get_node_parameters_interface())) {
    RCLCPP_INFO(this->get_logger(), "Initialized.");
}

std::string Node::initialize(const std::string& name, bool anonymous, bool disable_signals) {
    if (!rclcpp::ok()) {
        init(0, nullptr, disable_signals);
    }
    return anonymous ? anonymous_name(name) : name;
}

rclcpp::NodeOptions Node::default_node_options() {
    return rclcpp::NodeOptions()
        .allow_undeclared_parameters(true)
        .automatically_declare_parameters_from_overrides(true);
}

//=====================================
void Node::run() {
    while (rclcpp::ok()) {
        rclcpp::spin(this->shared_from_this());
    }
    RCLCPP_INFO(this->get_logger(), "Shutting down...");
}

//=====================================
rclcpp::ParameterValue Node::get_param(ParameterStore& store, const rclcpp::Logger& logger,
                                       const std::string& name,
                                       const rclcpp::ParameterValue& default_value, bool verbose,
                                       int limit) {
    auto value = store.get(name);
    if (!value) {
        if (default_value.get_type() == rclcpp::ParameterType::PARAMETER_NOT_SET) {
            RCLCPP_WARN(logger,
                        "No default value given for parameter '%s', unexpected behaviour possible.",
                        name.c_str());
        } else {
            store.set(name, default_value);
            RCLCPP_WARN(logger, "Parameter '%s' does not exist. Using default value '%s'.",
                        name.c_str(), rclcpp::to_string(default_value).c_str());
        }
        return default_value;
    }

    if (verbose) {
        RCLCPP_INFO(logger, "%s=%s", name.c_str(), format_value(*value, limit).c_str());
    }
    return *value;
}

void Node::set_param(ParameterStore& store, const rclcpp::Logger& logger, const std::string& name,
                     const rclcpp::ParameterValue& value, bool /*verbose*/, int limit) {
    store.set(name, value);
    RCLCPP_INFO(logger, "%s=%s", name.c_str(), format_value(value, limit).c_str());
}

rclcpp::ParameterValue Node::get_param(const std::string& name,
                                       const rclcpp::ParameterValue& default_value, bool verbose,
                                       int limit) {
    return get_param(*parameters_, this->get_logger(), name, default_value, verbose, limit);
}

void Node::set_param(const std::string& name, const rclcpp::ParameterValue& value, bool verbose,
                     int limit) {
    set_param(*parameters_, this->get_logger(), name, value, verbose, limit);
}

}  // namespace hippocampus_common
