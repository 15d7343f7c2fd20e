#include "test_helpers.hpp"

#include <fetchpp/replay_chunk_source.hpp>
#include <fetchpp/stream_reader.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/test/unit_test.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace JsonDemux;
using namespace JsonDemux::Test;

namespace
{
    struct ReaderFixture
    {
        boost::asio::io_context context;
        std::vector<json> values;
        std::optional<StreamError> failure;
        StreamStatistics statistics;
        int completions = 0;

        StreamReader::CompletionHandler completionHandler()
        {
            return [this](std::optional<StreamError> const& error, StreamStatistics const& finalStatistics) {
                ++completions;
                failure = error;
                statistics = finalStatistics;
            };
        }

        StreamReader::ValueCallback valueCallback()
        {
            return [this](json const& value) {
                values.push_back(value);
            };
        }
    };
}

BOOST_FIXTURE_TEST_SUITE(test_stream_reader, ReaderFixture)

BOOST_AUTO_TEST_CASE(test_values_arrive_in_order)
{
    std::string body;
    for (int i = 0; i != 50; ++i)
        body += json{{"index", i}, {"text", "chunk {" + std::to_string(i) + "}"}}.dump() + "\n";

    auto source = std::make_shared<ReplayChunkSource>(context.get_executor(), body, 13);
    auto reader = std::make_shared<StreamReader>(source, DemuxOptions{}, valueCallback());
    reader->start(completionHandler());
    BOOST_TEST(reader->active());

    context.run();

    BOOST_TEST(completions == 1);
    BOOST_TEST(!failure.has_value());
    BOOST_TEST(!reader->active());
    BOOST_REQUIRE(values.size() == 50u);
    for (int i = 0; i != 50; ++i)
        BOOST_CHECK(values[i]["index"] == i);
    BOOST_TEST(statistics.valuesDispatched == 50u);
    BOOST_TEST(statistics.bytesReceived.bytes() == body.size());
    BOOST_TEST(source->chunksDelivered() == (body.size() + 12) / 13);
}

BOOST_AUTO_TEST_CASE(test_stream_name_carries_identifier)
{
    auto source = std::make_shared<FakeChunkSource>(context.get_executor(), std::vector<ScriptedRead>{});
    StreamReader reader{source, DemuxOptions{.streamName = "chat"}, valueCallback()};

    BOOST_TEST(reader.name().starts_with("chat-"));
    BOOST_TEST(reader.name().size() == 13u);
}

BOOST_AUTO_TEST_CASE(test_open_failure_completes_without_reading)
{
    auto source = std::make_shared<FakeChunkSource>(
        context.get_executor(),
        std::vector<ScriptedRead>{{.bytes = "{\"a\":1}", .done = true}},
        StreamError{.kind = StreamErrorKind::HttpStatus, .message = "HTTP 403 Forbidden", .status = 403});
    auto reader = std::make_shared<StreamReader>(source, DemuxOptions{}, valueCallback());
    reader->start(completionHandler());

    context.run();

    BOOST_TEST(completions == 1);
    BOOST_REQUIRE(failure.has_value());
    BOOST_CHECK(failure->kind == StreamErrorKind::HttpStatus);
    BOOST_CHECK(failure->status == std::optional<int>{403});
    BOOST_TEST(source->reads == 0);
    BOOST_TEST(values.empty());
}

BOOST_AUTO_TEST_CASE(test_mid_stream_error_keeps_delivered_values)
{
    auto source = std::make_shared<FakeChunkSource>(
        context.get_executor(),
        std::vector<ScriptedRead>{
            {.bytes = "{\"a\":1}\n{\"b\":"},
            {.bytes = "2}\n{\"c\":"},
            {.error = StreamError{.kind = StreamErrorKind::Transport, .message = "connection reset"}},
        });
    auto reader = std::make_shared<StreamReader>(source, DemuxOptions{}, valueCallback());
    reader->start(completionHandler());

    context.run();

    BOOST_TEST(completions == 1);
    BOOST_REQUIRE(failure.has_value());
    BOOST_CHECK(failure->kind == StreamErrorKind::Transport);
    BOOST_REQUIRE(values.size() == 2u);
    BOOST_CHECK(values[0]["a"] == 1);
    BOOST_CHECK(values[1]["b"] == 2);
    BOOST_TEST(reader->statistics().valuesDispatched == 2u);
    BOOST_TEST(reader->statistics().bytesReceived.bytes() == 21u);
}

BOOST_AUTO_TEST_CASE(test_empty_final_read_ends_stream)
{
    auto source = std::make_shared<FakeChunkSource>(
        context.get_executor(),
        std::vector<ScriptedRead>{{.bytes = "{\"a\":"}, {.bytes = "1}"}, {.bytes = "", .done = true}});
    auto reader = std::make_shared<StreamReader>(source, DemuxOptions{}, valueCallback());
    reader->start(completionHandler());

    context.run();

    BOOST_TEST(!failure.has_value());
    BOOST_TEST(values.size() == 1u);
    BOOST_TEST(source->reads == 3);
}

BOOST_AUTO_TEST_CASE(test_cancel_inside_consumer_stops_delivery)
{
    auto source = std::make_shared<FakeChunkSource>(
        context.get_executor(),
        std::vector<ScriptedRead>{{.bytes = "{\"n\":1}{\"n\":2}{\"n\":3}"}, {.bytes = "{\"n\":4}", .done = true}});

    std::shared_ptr<StreamReader> reader;
    reader = std::make_shared<StreamReader>(source, DemuxOptions{}, [this, &reader](json const& value) {
        values.push_back(value);
        reader->cancel();
    });
    reader->start(completionHandler());

    context.run();

    BOOST_TEST(completions == 1);
    BOOST_REQUIRE(failure.has_value());
    BOOST_CHECK(failure->kind == StreamErrorKind::Cancelled);
    BOOST_TEST(values.size() == 1u);
    BOOST_TEST(source->cancelled);
    BOOST_TEST(source->reads == 1);
}

BOOST_AUTO_TEST_CASE(test_cancel_before_start)
{
    auto source = std::make_shared<FakeChunkSource>(context.get_executor(), std::vector<ScriptedRead>{});
    auto reader = std::make_shared<StreamReader>(source, DemuxOptions{}, valueCallback());

    reader->cancel();
    reader->start(completionHandler());
    context.run();

    BOOST_TEST(completions == 1);
    BOOST_REQUIRE(failure.has_value());
    BOOST_CHECK(failure->kind == StreamErrorKind::Cancelled);
    BOOST_TEST(source->opens == 0);
}

BOOST_AUTO_TEST_CASE(test_cancel_while_reading)
{
    auto source = std::make_shared<FakeChunkSource>(
        context.get_executor(), std::vector<ScriptedRead>{{.bytes = "{\"n\":1}"}, {.bytes = "{\"n\":2}"}});
    auto reader = std::make_shared<StreamReader>(source, DemuxOptions{}, valueCallback());
    reader->start(completionHandler());

    context.run_one();
    reader->cancel();
    context.run();

    BOOST_TEST(completions == 1);
    BOOST_REQUIRE(failure.has_value());
    BOOST_CHECK(failure->kind == StreamErrorKind::Cancelled);
    BOOST_TEST(values.empty());
}

BOOST_AUTO_TEST_CASE(test_consumer_exception_ends_stream)
{
    auto source = std::make_shared<FakeChunkSource>(
        context.get_executor(),
        std::vector<ScriptedRead>{{.bytes = "{\"n\":1}{\"n\":2}"}, {.bytes = "{\"n\":3}", .done = true}});
    auto reader = std::make_shared<StreamReader>(source, DemuxOptions{}, [this](json const& value) {
        values.push_back(value);
        throw std::runtime_error("cannot print");
    });
    reader->start(completionHandler());

    context.run();

    BOOST_TEST(completions == 1);
    BOOST_REQUIRE(failure.has_value());
    BOOST_CHECK(failure->kind == StreamErrorKind::Consumer);
    BOOST_TEST(failure->message == "cannot print");
    BOOST_TEST(values.size() == 1u);
    BOOST_TEST(source->cancelled);
}

BOOST_AUTO_TEST_CASE(test_foreign_consumer_exception_issues_no_read)
{
    auto source = std::make_shared<FakeChunkSource>(
        context.get_executor(),
        std::vector<ScriptedRead>{{.bytes = "{\"n\":1}"}, {.bytes = "{\"n\":2}", .done = true}});
    auto reader = std::make_shared<StreamReader>(source, DemuxOptions{}, [this](json const& value) {
        values.push_back(value);
        throw 42;
    });
    reader->start(completionHandler());

    BOOST_CHECK_THROW(context.run(), int);
    context.restart();
    context.run();

    BOOST_TEST(source->reads == 1);
    BOOST_TEST(values.size() == 1u);
    BOOST_TEST(completions == 0);
}

BOOST_AUTO_TEST_CASE(test_destroyed_reader_closes_source)
{
    auto source = std::make_shared<FakeChunkSource>(
        context.get_executor(), std::vector<ScriptedRead>{{.bytes = "{\"n\":1}"}});
    {
        auto reader = std::make_shared<StreamReader>(source, DemuxOptions{}, valueCallback());
        reader->start(completionHandler());
    }
    context.run();

    BOOST_TEST(source->cancelled);
    BOOST_TEST(completions == 0);
}

BOOST_AUTO_TEST_SUITE_END()
