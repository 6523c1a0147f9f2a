#include "hippocampus_common/parameter_format.hpp"

namespace hippocampus_common {

namespace {

// UTF-8 continuation bytes look like 0b10xxxxxx.
bool is_continuation_byte(char byte) {
    return (static_cast<unsigned char>(byte) & 0xC0) == 0x80;
}

}  // namespace

std::string truncate_value(const std::string& text, int limit) {
    if (limit <= 0) {
        return text;
    }

    // Byte offset of the first character past the limit.
    std::size_t characters = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (is_continuation_byte(text[i])) {
            continue;
        }
        if (characters == static_cast<std::size_t>(limit)) {
            return text.substr(0, i) + "...";
        }
        ++characters;
    }
    return text;
}

std::string format_value(const rclcpp::ParameterValue& value, int limit) {
    return truncate_value(rclcpp::to_string(value), limit);
}

}  // namespace hippocampus_common
