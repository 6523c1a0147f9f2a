#pragma once

/**
 * @file node.hpp
 * @brief Declares the Node base class for ROS 2 nodes.
 *
 * Node wraps middleware initialization and node registration, provides a
 * blocking run loop and verbose helpers to read and write parameters with a
 * default value fallback.
 */

#include <rclcpp/rclcpp.hpp>

#include <memory>
#include <string>

#include "hippocampus_common/parameter_format.hpp"
#include "hippocampus_common/parameter_store.hpp"

namespace hippocampus_common {

/**
 * @brief Initializes the default context with command line arguments.
 *
 * Only needed if remapping or parameter arguments have to be passed. A Node
 * initializes the context itself if this was not called.
 *
 * @param argc Number of command-line arguments.
 * @param argv Array of command-line arguments.
 * @param disable_signals If true, no SIGINT/SIGTERM handlers are installed.
 */
void init(int argc, char const* const* argv, bool disable_signals = false);

/**
 * @brief Appends "_<pid>_<milliseconds since epoch>" to @p name.
 */
std::string anonymous_name(const std::string& name);

/**
 * @class Node
 * @brief A basic node class to start off with when implementing a ROS 2
 * node.
 *
 * Derive from it and override run() if the node should do something besides
 * waiting for callbacks. Instances have to be owned by a std::shared_ptr for
 * run() to work.
 */
class Node : public rclcpp::Node {
   public:
    /**
     * @brief Initializes ROS 2 if necessary and registers the node.
     *
     * @param name Name of the node.
     * @param anonymous If true, a unique suffix is appended to the name.
     * @param disable_signals If true, ROS 2 does not handle ctrl+c. Only has
     * an effect if the context is not initialized yet.
     * @param options Node options, see default_node_options().
     */
    explicit Node(const std::string& name, bool anonymous = false, bool disable_signals = false,
                  const rclcpp::NodeOptions& options = default_node_options());

    ~Node() override = default;

    /**
     * @brief Spins until ROS 2 is shut down.
     */
    virtual void run();

    /**
     * @brief Gets a parameter from a parameter store.
     *
     * Logs a warning if the parameter does not exist and writes the default
     * value to the store afterwards.
     *
     * @param store Store to read from.
     * @param logger Logger used for all messages.
     * @param name Name of the parameter.
     * @param default_value Used if the parameter does not exist. A value of
     * type PARAMETER_NOT_SET means no default was given.
     * @param verbose Log the retrieved value.
     * @param limit Maximum number of characters of the value that are logged.
     * Values <= 0 disable truncation.
     * @return The stored value, otherwise the default value. If no default was
     * given the returned value is not set.
     */
    static rclcpp::ParameterValue get_param(
        ParameterStore& store, const rclcpp::Logger& logger, const std::string& name,
        const rclcpp::ParameterValue& default_value = rclcpp::ParameterValue(),
        bool verbose = true, int limit = kDefaultLogLimit);

    /**
     * @brief Sets a parameter in a parameter store and logs it.
     *
     * The value is always logged. @p verbose is accepted for symmetry with
     * get_param() and has no effect.
     */
    static void set_param(ParameterStore& store, const rclcpp::Logger& logger,
                          const std::string& name, const rclcpp::ParameterValue& value,
                          bool verbose = true, int limit = kDefaultLogLimit);

    /// Reads a parameter of this node. See the static overload.
    rclcpp::ParameterValue get_param(
        const std::string& name,
        const rclcpp::ParameterValue& default_value = rclcpp::ParameterValue(),
        bool verbose = true, int limit = kDefaultLogLimit);

    /// Writes a parameter of this node. See the static overload.
    void set_param(const std::string& name, const rclcpp::ParameterValue& value,
                   bool verbose = true, int limit = kDefaultLogLimit);

    /**
     * @brief Typed variant of get_param().
     *
     * @throws rclcpp::ParameterTypeException if the stored value is not of
     * type @p T.
     */
    template <typename T>
    T get_param_or(const std::string& name, const T& default_value, bool verbose = true,
                   int limit = kDefaultLogLimit) {
        return get_param(name, rclcpp::ParameterValue(default_value), verbose, limit)
            .template get<T>();
    }

    template <typename T>
    void set_param(const std::string& name, const T& value, bool verbose = true,
                   int limit = kDefaultLogLimit) {
        set_param(name, rclcpp::ParameterValue(value), verbose, limit);
    }

    /// The parameters of this node.
    ParameterStore& parameters() { return *parameters_; }

    /**
     * @brief Options that let the node's parameters act as a key-value store.
     *
     * Undeclared parameters are allowed and overrides from the command line
     * or parameter files are declared automatically.
     */
    static rclcpp::NodeOptions default_node_options();

   private:
    static std::string initialize(const std::string& name, bool anonymous, bool disable_signals);

    std::unique_ptr<LocalParameterStore> parameters_;
};

}  // namespace hippocampus_common
