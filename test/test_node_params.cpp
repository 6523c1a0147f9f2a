#include <gtest/gtest.h>

#include <rclcpp/rclcpp.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "hippocampus_common/node.hpp"
#include "log_capture.hpp"

using hippocampus_common::Node;
using hippocampus_common::ParameterStore;
using hippocampus_common::test::LogCapture;

namespace {

// Counts writes so tests can check when the store is touched.
class InMemoryParameterStore : public ParameterStore {
   public:
    std::optional<rclcpp::ParameterValue> get(const std::string& name) override {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const std::string& name, const rclcpp::ParameterValue& value) override {
        ++writes;
        values[name] = value;
    }

    std::map<std::string, rclcpp::ParameterValue> values;
    int writes = 0;
};

const rclcpp::Logger kLogger = rclcpp::get_logger("test_node_params");

}  // namespace

class NodeParamsTest : public ::testing::Test {
   protected:
    static void SetUpTestSuite() { rclcpp::init(0, nullptr); }
    static void TearDownTestSuite() { rclcpp::shutdown(); }

    InMemoryParameterStore store_;
};

TEST_F(NodeParamsTest, ReturnsStoredValueVerbatim) {
    store_.values["gain"] = rclcpp::ParameterValue(1.5);

    auto value = Node::get_param(store_, kLogger, "gain", rclcpp::ParameterValue(3.0));

    EXPECT_EQ(value, rclcpp::ParameterValue(1.5));
    EXPECT_EQ(store_.writes, 0);
}

TEST_F(NodeParamsTest, MissingParameterFallsBackToDefaultAndPersistsIt) {
    LogCapture log;

    auto value = Node::get_param(store_, kLogger, "frame_id", rclcpp::ParameterValue("map"));

    EXPECT_EQ(value.get<std::string>(), "map");
    EXPECT_EQ(store_.writes, 1);
    ASSERT_EQ(store_.values.count("frame_id"), 1u);
    EXPECT_EQ(store_.values["frame_id"].get<std::string>(), "map");
    EXPECT_TRUE(log.contains(RCUTILS_LOG_SEVERITY_WARN,
                             "Parameter 'frame_id' does not exist. Using default value 'map'."));
}

TEST_F(NodeParamsTest, MissingParameterWithoutDefaultIsNotWritten) {
    LogCapture log;

    auto value = Node::get_param(store_, kLogger, "unknown");

    EXPECT_EQ(value.get_type(), rclcpp::ParameterType::PARAMETER_NOT_SET);
    EXPECT_EQ(store_.writes, 0);
    EXPECT_TRUE(store_.values.empty());
    EXPECT_TRUE(log.contains(
        RCUTILS_LOG_SEVERITY_WARN,
        "No default value given for parameter 'unknown', unexpected behaviour possible."));
}

TEST_F(NodeParamsTest, LoggedValueIsTruncatedButReturnedValueIsNot) {
    const std::string long_value(20, 'a');
    store_.values["description"] = rclcpp::ParameterValue(long_value);
    LogCapture log;

    auto value = Node::get_param(store_, kLogger, "description", rclcpp::ParameterValue(), true, 5);

    EXPECT_EQ(value.get<std::string>(), long_value);
    EXPECT_TRUE(log.contains(RCUTILS_LOG_SEVERITY_INFO, "description=aaaaa..."));
}

TEST_F(NodeParamsTest, ShortValueIsLoggedUnmodified) {
    store_.values["mode"] = rclcpp::ParameterValue("auto");
    LogCapture log;

    Node::get_param(store_, kLogger, "mode", rclcpp::ParameterValue(), true, 4);

    EXPECT_TRUE(log.contains(RCUTILS_LOG_SEVERITY_INFO, "mode=auto"));
}

TEST_F(NodeParamsTest, QuietReadDoesNotLog) {
    store_.values["mode"] = rclcpp::ParameterValue("auto");
    LogCapture log;

    Node::get_param(store_, kLogger, "mode", rclcpp::ParameterValue(), false);

    EXPECT_TRUE(log.messages().empty());
}

TEST_F(NodeParamsTest, SetWritesExactValue) {
    const std::string long_value(30, 'b');
    LogCapture log;

    Node::set_param(store_, kLogger, "name", rclcpp::ParameterValue(long_value), true, 10);

    EXPECT_EQ(store_.writes, 1);
    EXPECT_EQ(store_.values["name"].get<std::string>(), long_value);
    EXPECT_TRUE(log.contains(RCUTILS_LOG_SEVERITY_INFO, "name=bbbbbbbbbb..."));
}

TEST_F(NodeParamsTest, SetLogsEvenWhenNotVerbose) {
    LogCapture log;

    Node::set_param(store_, kLogger, "mode", rclcpp::ParameterValue("manual"), false);

    EXPECT_EQ(store_.values["mode"].get<std::string>(), "manual");
    EXPECT_TRUE(log.contains(RCUTILS_LOG_SEVERITY_INFO, "mode=manual"));
}

TEST_F(NodeParamsTest, LoggedMultiByteValueKeepsWholeCharacters) {
    store_.values["label"] = rclcpp::ParameterValue("äää");
    LogCapture log;

    auto value = Node::get_param(store_, kLogger, "label", rclcpp::ParameterValue(), true, 3);

    EXPECT_EQ(value.get<std::string>(), "äää");
    EXPECT_TRUE(log.contains(RCUTILS_LOG_SEVERITY_INFO, "label=äää"));
}

TEST_F(NodeParamsTest, NodeParametersActAsStore) {
    auto node = std::make_shared<Node>("param_node");

    EXPECT_EQ(node->get_param_or<int>("rate", 10), 10);
    EXPECT_TRUE(node->has_parameter("rate"));
    EXPECT_EQ(node->get_parameter("rate").as_int(), 10);

    node->set_param("rate", 25);
    EXPECT_EQ(node->get_param_or<int>("rate", 10), 25);

    node->set_param("topic", std::string("/odom"));
    EXPECT_EQ(node->get_param("topic").get<std::string>(), "/odom");
}

TEST_F(NodeParamsTest, NodeReadOfUnknownParameterDoesNotDeclareIt) {
    auto node = std::make_shared<Node>("param_node_unknown");

    auto value = node->get_param("not_there");

    EXPECT_EQ(value.get_type(), rclcpp::ParameterType::PARAMETER_NOT_SET);
    EXPECT_FALSE(node->parameters().get("not_there").has_value());
}

TEST_F(NodeParamsTest, TypeMismatchPropagates) {
    auto node = std::make_shared<Node>("param_node_types");
    node->set_param("label", std::string("front"));

    EXPECT_THROW(node->get_param_or<double>("label", 1.0), rclcpp::ParameterTypeException);
}

TEST_F(NodeParamsTest, RejectedWriteThrows) {
    auto node = std::make_shared<Node>("param_node_rejecting");
    auto handle = node->add_on_set_parameters_callback(
        [](const std::vector<rclcpp::Parameter>&) {
            rcl_interfaces::msg::SetParametersResult result;
            result.successful = false;
            result.reason = "read only";
            return result;
        });

    EXPECT_THROW(node->set_param("locked", true), hippocampus_common::ParameterStoreError);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
