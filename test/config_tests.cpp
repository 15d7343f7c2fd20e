#include <streamcat/config.hpp>

#include <boost/test/unit_test.hpp>

#include <stdexcept>

using namespace JsonDemux;
using namespace JsonDemux::StreamCat;

BOOST_AUTO_TEST_SUITE(test_config)

BOOST_AUTO_TEST_CASE(test_missing_members_keep_defaults)
{
    const auto config = json::parse(R"({"timeoutSeconds": 5, "parseFailurePolicy": "keep"})").get<Config>();

    BOOST_TEST(config.timeoutSeconds == 5);
    BOOST_CHECK(config.parseFailurePolicy == ParseFailurePolicy::KeepBuffering);
    BOOST_TEST(config.verifyPeer);
    BOOST_TEST(config.maxPendingBytes == 0u);
    BOOST_TEST(config.logLevel == "info");
}

BOOST_AUTO_TEST_CASE(test_config_survives_serialization)
{
    Config config;
    config.verifyPeer = false;
    config.maxPendingBytes = 4096;
    config.userAgent = "agent";

    const json serialized = config;
    BOOST_TEST(serialized["parseFailurePolicy"].get<std::string>() == "drop");

    const auto restored = serialized.get<Config>();
    BOOST_TEST(!restored.verifyPeer);
    BOOST_TEST(restored.maxPendingBytes == 4096u);
    BOOST_TEST(restored.userAgent == "agent");
}

BOOST_AUTO_TEST_CASE(test_invalid_members_throw)
{
    BOOST_CHECK_THROW(json::parse(R"({"parseFailurePolicy": "retry"})").get<Config>(), std::invalid_argument);
    BOOST_CHECK_THROW(json::parse(R"({"timeoutSeconds": 0})").get<Config>(), std::invalid_argument);
    BOOST_CHECK_THROW(json::parse(R"({"verifyPeer": "yes"})").get<Config>(), json::exception);
}

BOOST_AUTO_TEST_CASE(test_policy_names)
{
    BOOST_CHECK(parseFailurePolicyFromString("drop") == ParseFailurePolicy::DropAndResume);
    BOOST_CHECK(parseFailurePolicyFromString("keep") == ParseFailurePolicy::KeepBuffering);
    BOOST_TEST(!parseFailurePolicyFromString("other").has_value());
    BOOST_CHECK(toString(ParseFailurePolicy::KeepBuffering) == "keep");
}

BOOST_AUTO_TEST_SUITE_END()
