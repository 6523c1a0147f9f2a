#pragma once

/**
 * @file parameter_store.hpp
 * @brief Key-value access to the parameters of a local or remote node.
 */

#include <rclcpp/executors/single_threaded_executor.hpp>
#include <rclcpp/node_interfaces/node_parameters_interface.hpp>
#include <rclcpp/parameter_client.hpp>
#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace hippocampus_common {

/**
 * @brief Raised when a parameter could not be read or written.
 */
class ParameterStoreError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ParameterStore
 * @brief A name to value store backed by ROS 2 parameters.
 */
class ParameterStore {
   public:
    virtual ~ParameterStore() = default;

    /**
     * @brief Reads a parameter.
     *
     * @param name Name of the parameter.
     * @return The value, or std::nullopt if the parameter does not exist or
     * is not set.
     */
    virtual std::optional<rclcpp::ParameterValue> get(const std::string& name) = 0;

    /**
     * @brief Writes a parameter, creating it if needed.
     *
     * @throws ParameterStoreError if the write was rejected.
     */
    virtual void set(const std::string& name, const rclcpp::ParameterValue& value) = 0;
};

/**
 * @class LocalParameterStore
 * @brief The parameters of a node living in this process.
 */
class LocalParameterStore : public ParameterStore {
   public:
    explicit LocalParameterStore(
        rclcpp::node_interfaces::NodeParametersInterface::SharedPtr parameters);

    std::optional<rclcpp::ParameterValue> get(const std::string& name) override;
    void set(const std::string& name, const rclcpp::ParameterValue& value) override;

   private:
    rclcpp::node_interfaces::NodeParametersInterface::SharedPtr parameters_;
};

/**
 * @class RemoteParameterStore
 * @brief The parameters of another node, reached through its parameter
 * services.
 *
 * Owns a private client node and executor so that requests can be completed
 * synchronously regardless of how the calling node is spun. After a timeout
 * the parameter client is recreated, so unanswered requests do not pile up.
 */
class RemoteParameterStore : public ParameterStore {
   public:
    /**
     * @param remote_node_name Fully qualified or relative name of the node
     * whose parameters are accessed.
     * @param timeout Upper bound for a single get or set request.
     */
    explicit RemoteParameterStore(const std::string& remote_node_name,
                                  std::chrono::nanoseconds timeout = std::chrono::seconds(2));

    /**
     * @brief Blocks until the remote parameter services are available.
     *
     * @return false if they did not appear within @p timeout.
     */
    bool wait_for_service(std::chrono::nanoseconds timeout);

    std::optional<rclcpp::ParameterValue> get(const std::string& name) override;
    void set(const std::string& name, const rclcpp::ParameterValue& value) override;

    const std::string& remote_node_name() const { return remote_node_name_; }

   private:
    void reset_client();

    std::string remote_node_name_;
    std::chrono::nanoseconds timeout_;
    rclcpp::Node::SharedPtr client_node_;
    rclcpp::AsyncParametersClient::SharedPtr client_;
    rclcpp::executors::SingleThreadedExecutor executor_;
};

}  // namespace hippocampus_common
