/**
 * @file parameter_store.cpp
 * @brief Implementation of the local and remote parameter stores.
 */

#include "hippocampus_common/parameter_store.hpp"

#include <utility>
#include <vector>

#include "hippocampus_common/node.hpp"

namespace hippocampus_common {

//=====================================
LocalParameterStore::LocalParameterStore(
    rclcpp::node_interfaces::NodeParametersInterface::SharedPtr parameters)
    : parameters_(std::move(parameters)) {}

std::optional<rclcpp::ParameterValue> LocalParameterStore::get(const std::string& name) {
    rclcpp::Parameter parameter;
    if (!parameters_->get_parameter(name, parameter) ||
        parameter.get_type() == rclcpp::ParameterType::PARAMETER_NOT_SET) {
        return std::nullopt;
    }
    return parameter.get_parameter_value();
}

void LocalParameterStore::set(const std::string& name, const rclcpp::ParameterValue& value) {
    auto results = parameters_->set_parameters({rclcpp::Parameter(name, value)});
    if (results.empty() || !results.front().successful) {
        throw ParameterStoreError("Failed to set parameter '" + name + "': " +
                                  (results.empty() ? std::string("no result") : results.front().reason));
    }
}

//=====================================
RemoteParameterStore::RemoteParameterStore(const std::string& remote_node_name,
                                           std::chrono::nanoseconds timeout)
    : remote_node_name_(remote_node_name),
      timeout_(timeout),
      client_node_(std::make_shared<rclcpp::Node>(anonymous_name("parameter_client"))) {
    reset_client();
    executor_.add_node(client_node_);
}

void RemoteParameterStore::reset_client() {
    client_ = std::make_shared<rclcpp::AsyncParametersClient>(client_node_, remote_node_name_);
}

bool RemoteParameterStore::wait_for_service(std::chrono::nanoseconds timeout) {
    return client_->wait_for_service(timeout);
}

std::optional<rclcpp::ParameterValue> RemoteParameterStore::get(const std::string& name) {
    auto future = client_->get_parameters({name});
    if (executor_.spin_until_future_complete(future, timeout_) != rclcpp::FutureReturnCode::SUCCESS) {
        // Drops the request that is still pending for the abandoned future.
        reset_client();
        throw ParameterStoreError("Timed out reading parameter '" + name + "' of node '" +
                                  remote_node_name_ + "'");
    }

    // Nodes that do not allow undeclared parameters answer with no values.
    std::vector<rclcpp::Parameter> parameters = future.get();
    if (parameters.empty() ||
        parameters.front().get_type() == rclcpp::ParameterType::PARAMETER_NOT_SET) {
        return std::nullopt;
    }
    return parameters.front().get_parameter_value();
}

void RemoteParameterStore::set(const std::string& name, const rclcpp::ParameterValue& value) {
    auto future = client_->set_parameters({rclcpp::Parameter(name, value)});
    if (executor_.spin_until_future_complete(future, timeout_) != rclcpp::FutureReturnCode::SUCCESS) {
        // Drops the request that is still pending for the abandoned future.
        reset_client();
        throw ParameterStoreError("Timed out setting parameter '" + name + "' of node '" +
                                  remote_node_name_ + "'");
    }

    auto results = future.get();
    if (results.empty() || !results.front().successful) {
        throw ParameterStoreError("Node '" + remote_node_name_ + "' rejected parameter '" + name +
                                  "': " +
                                  (results.empty() ? std::string("no result") : results.front().reason));
    }
}

}  // namespace hippocampus_common
