#pragma once

/**
 * @file parameter_format.hpp
 * @brief Helpers to render parameter values for log output.
 */

#include <rclcpp/parameter_value.hpp>

#include <string>

namespace hippocampus_common {

/// Default number of characters of a parameter value written to the log.
constexpr int kDefaultLogLimit = 80 * 5;

/**
 * @brief Shortens a string for logging.
 *
 * Characters are UTF-8 code points, a multi-byte character is never split.
 *
 * @param text The string to shorten.
 * @param limit Maximum number of characters kept. Values <= 0 disable
 * truncation.
 * @return The first @p limit characters followed by "..." if @p text is
 * longer than @p limit, otherwise @p text unchanged.
 */
std::string truncate_value(const std::string& text, int limit);

/**
 * @brief Converts a parameter value to a string and truncates it.
 *
 * @param value The parameter value.
 * @param limit See truncate_value().
 */
std::string format_value(const rclcpp::ParameterValue& value, int limit = kDefaultLogLimit);

}  // namespace hippocampus_common
