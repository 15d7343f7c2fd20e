#include <fetchpp/replay_chunk_source.hpp>

#include <sharedpp/json.hpp>
#include <sharedpp/memory_unit.hpp>
#include <sharedpp/printable_string.hpp>
#include <sharedpp/uuid_generator.hpp>

#include <boost/test/unit_test.hpp>

#include <stdexcept>
#include <string>

using namespace JsonDemux;

BOOST_AUTO_TEST_SUITE(test_shared)

BOOST_AUTO_TEST_CASE(test_memory_unit_formatting)
{
    BOOST_TEST((0_B).toString() == "0 B");
    BOOST_TEST((1023_B).toString() == "1023 B");
    BOOST_TEST((1_KB).toString() == "1.00 KB");
    BOOST_TEST(MemoryUnit{1536}.toString() == "1.50 KB");
    BOOST_TEST(MemoryUnit{1024 + 10}.toString() == "1.00 KB");
    BOOST_TEST((5_MB).toString() == "5.00 MB");

    MemoryUnit counter;
    counter += 1000;
    counter += 48;
    BOOST_TEST(counter.bytes() == 1048u);
    BOOST_CHECK(counter == MemoryUnit{1048});
}

BOOST_AUTO_TEST_CASE(test_printable_string)
{
    BOOST_TEST(makePrintableString("plain text") == "plain text");
    BOOST_TEST(makePrintableString("a\nb\x01") == "a\\x0Ab\\x01");
    BOOST_TEST(makePrintableString("\xC3\xA4") == "\\xC3\\xA4");
    BOOST_TEST(makePrintableString("0123456789", 4) == "0123...");
}

BOOST_AUTO_TEST_CASE(test_try_parse_json)
{
    BOOST_TEST(tryParseJson(R"({"a":[1,2]})").has_value());
    BOOST_TEST(!tryParseJson(R"({"a":1,})").has_value());
    BOOST_TEST(!tryParseJson("").has_value());

    const auto value = json::parse(R"({"present": 3, "null": null})");
    BOOST_TEST(valueOr(value, "present", 1) == 3);
    BOOST_TEST(valueOr(value, "null", 1) == 1);
    BOOST_TEST(valueOr(value, "absent", std::string{"x"}) == "x");
}

BOOST_AUTO_TEST_CASE(test_uuid_generator)
{
    UuidGenerator generator;
    const auto id = generator.generateId();
    BOOST_TEST(id.size() == 36u);
    BOOST_TEST(generator.generateShortId().size() == 8u);
    BOOST_TEST(generator.generateId() != id);
}

BOOST_AUTO_TEST_CASE(test_split_into_chunks)
{
    const auto chunks = splitIntoChunks("abcdefg", 3);
    BOOST_TEST(chunks == (std::vector<std::string>{"abc", "def", "g"}), boost::test_tools::per_element());
    BOOST_TEST(splitIntoChunks("", 3).empty());
    BOOST_CHECK_THROW(splitIntoChunks("abc", 0), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
