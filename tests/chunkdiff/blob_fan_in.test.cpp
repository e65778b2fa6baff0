#include "chunkdiff/blob_fan_in.hpp"

#include <array>
#include <thread>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

namespace chunkdiff_tests
{

using namespace chunkdiff;
using namespace chunkdiff::detail;

namespace
{

auto read_all(blob_stream &stream) -> std::string
{
    std::string content;
    std::array<std::byte, 16> buffer;
    for (;;)
    {
        auto n = stream.read_some(buffer).value();
        if (n == 0U)
        {
            return content;
        }
        content.append(as_string_view(ro_dynblob(buffer).first(n)));
    }
}

struct fan_in_fixture
{
    std::string const first = "first stream";
    std::string const second = "second stream";
    blob_channels channels = make_blob_channels();

    void send(std::string const &content)
    {
        BOOST_TEST_REQUIRE(channels.streams->send(
                std::make_unique<memory_blob_stream>(as_bytes(content))));
    }
    void close()
    {
        channels.streams->close();
        channels.errors->close();
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(blob_fan_in_tests, fan_in_fixture)

BOOST_AUTO_TEST_CASE(streams_are_delivered_in_order)
{
    send(first);
    send(second);
    close();

    auto fanInRx = blob_fan_in::start(channels, 2U);
    TEST_RESULT_REQUIRE(fanInRx);
    auto &fanIn = *fanInRx.assume_value();

    auto one = fanIn.next();
    BOOST_TEST_REQUIRE(one.has_value());
    TEST_RESULT_REQUIRE(*one);
    BOOST_TEST(read_all(*one->assume_value()) == first);

    auto two = fanIn.next();
    BOOST_TEST_REQUIRE(two.has_value());
    TEST_RESULT_REQUIRE(*two);
    BOOST_TEST(read_all(*two->assume_value()) == second);

    BOOST_TEST(!fanIn.next().has_value());
}

BOOST_AUTO_TEST_CASE(errors_are_forwarded)
{
    send(first);
    BOOST_TEST_REQUIRE(channels.errors->send(
            system_error::error{make_status_code(chunked_errc::not_enough_data)}));
    close();

    auto fanIn = blob_fan_in::start(channels, 1U).value();
    auto stream = fanIn->next();
    BOOST_TEST_REQUIRE(stream.has_value());
    TEST_RESULT(*stream);

    auto error = fanIn->next();
    BOOST_TEST_REQUIRE(error.has_value());
    BOOST_TEST_REQUIRE(error->has_error());
    BOOST_TEST(error->assume_error() == chunked_errc::not_enough_data);
}

BOOST_AUTO_TEST_CASE(surplus_streams_are_reported_last)
{
    send(first);
    send(second);
    send(first);
    close();

    auto fanIn = blob_fan_in::start(channels, 2U).value();
    BOOST_TEST(fanIn->next().has_value());
    BOOST_TEST(fanIn->next().has_value());

    auto surplus = fanIn->next();
    BOOST_TEST_REQUIRE(surplus.has_value());
    BOOST_TEST_REQUIRE(surplus->has_error());
    BOOST_TEST(surplus->assume_error() == chunked_errc::too_many_streams);
    BOOST_TEST(!fanIn->next().has_value());
}

BOOST_AUTO_TEST_CASE(drain_returns_the_first_error)
{
    send(first);
    BOOST_TEST_REQUIRE(channels.errors->send(
            system_error::error{make_status_code(chunked_errc::bad_request)}));
    BOOST_TEST_REQUIRE(channels.errors->send(
            system_error::error{make_status_code(chunked_errc::not_enough_data)}));
    close();

    auto fanIn = blob_fan_in::start(channels, 1U).value();
    auto drained = fanIn->drain();
    BOOST_TEST_REQUIRE(drained.has_error());
    BOOST_TEST(drained.assume_error() == chunked_errc::bad_request);
}

BOOST_AUTO_TEST_CASE(early_consumer_exit_does_not_block_the_source)
{
    auto fanIn = blob_fan_in::start(channels, 8U).value();
    std::thread producer([this] {
        for (int i = 0; i < 8; ++i)
        {
            (void)channels.streams->send(
                    std::make_unique<memory_blob_stream>(as_bytes(first)));
        }
        close();
    });

    BOOST_TEST(fanIn->next().has_value());
    fanIn.reset();
    producer.join();
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace chunkdiff_tests
