#include "chunkdiff/missing_parts.hpp"

#include <deque>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

namespace chunkdiff_tests
{

using namespace chunkdiff;
using namespace chunkdiff::detail;

namespace
{

struct missing_parts_fixture
{
    std::deque<file_metadata> files;

    auto file(std::string name) -> file_metadata const &
    {
        auto &f = files.emplace_back();
        f.name = std::move(name);
        return f;
    }

    static auto remote(file_metadata const &f,
                       std::uint64_t offset,
                       std::uint64_t length) -> missing_part
    {
        missing_part part;
        part.source = {offset, length};
        part.chunks.push_back(missing_file_chunk{.file = &f,
                                                 .compressed_size = length,
                                                 .uncompressed_size = length});
        return part;
    }

    static auto local(file_metadata const &f,
                      std::uint64_t offset,
                      std::uint64_t length) -> missing_part
    {
        auto part = remote(f, offset, length);
        part.origin = origin_file{"/layers/a", f.name, 0U};
        return part;
    }

    static auto hole(file_metadata const &f, std::uint64_t length)
            -> missing_part
    {
        missing_part part;
        part.hole = true;
        part.chunks.push_back(missing_file_chunk{.hole = true,
                                                 .file = &f,
                                                 .uncompressed_size = length});
        return part;
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(missing_parts_tests, missing_parts_fixture)

BOOST_AUTO_TEST_CASE(empty_input)
{
    BOOST_TEST(merge_missing_chunks({}, 1U, 1024U).empty());
}

BOOST_AUTO_TEST_CASE(adjacent_chunks_of_a_file_are_combined)
{
    auto const &f = file("f");
    std::vector<missing_part> parts{remote(f, 0U, 100U), remote(f, 100U, 50U)};

    auto merged = merge_missing_chunks(std::move(parts), 1024U, 0U);
    BOOST_TEST_REQUIRE(merged.size() == 1U);
    BOOST_TEST(merged[0].source == (blob_range{0U, 150U}));
    BOOST_TEST_REQUIRE(merged[0].chunks.size() == 1U);
    BOOST_TEST(merged[0].chunks[0].compressed_size == 150U);
    BOOST_TEST(merged[0].chunks[0].uncompressed_size == 150U);
}

BOOST_AUTO_TEST_CASE(small_gaps_are_always_bridged)
{
    auto const &a = file("a");
    auto const &b = file("b");
    std::vector<missing_part> parts{remote(a, 0U, 100U),
                                    remote(b, 110U, 10U)};

    auto merged = merge_missing_chunks(std::move(parts), 1024U, 16U);
    BOOST_TEST_REQUIRE(merged.size() == 1U);
    BOOST_TEST(merged[0].source == (blob_range{0U, 120U}));
    BOOST_TEST_REQUIRE(merged[0].chunks.size() == 3U);
    BOOST_TEST(merged[0].chunks[1].gap == 10U);
    BOOST_TEST((merged[0].chunks[1].file == nullptr));
    BOOST_TEST((merged[0].chunks[2].file == &b));
}

BOOST_AUTO_TEST_CASE(large_gaps_are_kept_below_the_target)
{
    auto const &a = file("a");
    auto const &b = file("b");
    std::vector<missing_part> parts{remote(a, 0U, 100U),
                                    remote(b, 5000U, 10U)};

    auto merged = merge_missing_chunks(std::move(parts), 1024U, 16U);
    BOOST_TEST(merged.size() == 2U);
    BOOST_TEST(remote_ranges(merged).size() == 2U);
}

BOOST_AUTO_TEST_CASE(cheapest_gaps_are_bridged_first)
{
    auto const &a = file("a");
    auto const &b = file("b");
    auto const &c = file("c");
    std::vector<missing_part> parts{remote(a, 0U, 100U),
                                    remote(b, 5000U, 100U),
                                    remote(c, 5200U, 100U)};

    auto merged = merge_missing_chunks(std::move(parts), 2U, 0U);
    auto const ranges = remote_ranges(merged);
    std::vector<blob_range> const expected{
            {   0U, 100U},
            {5000U, 300U},
    };
    BOOST_TEST(ranges == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(local_parts_inside_a_bridged_gap_are_fetched)
{
    auto const &a = file("a");
    auto const &b = file("b");
    auto const &c = file("c");
    std::vector<missing_part> parts{remote(a, 0U, 100U), local(b, 100U, 20U),
                                    remote(c, 120U, 30U)};

    auto merged = merge_missing_chunks(std::move(parts), 1U, 0U);
    BOOST_TEST_REQUIRE(merged.size() == 1U);
    BOOST_TEST(merged[0].is_remote());
    BOOST_TEST(merged[0].source == (blob_range{0U, 150U}));
    BOOST_TEST(merged[0].chunks.size() == 3U);
}

BOOST_AUTO_TEST_CASE(holes_stay_local)
{
    auto const &a = file("a");
    std::vector<missing_part> parts{hole(a, 4096U), remote(a, 10U, 20U)};

    auto merged = merge_missing_chunks(std::move(parts), 1U, 1024U);
    BOOST_TEST_REQUIRE(merged.size() == 2U);
    BOOST_TEST(merged[0].hole);
    BOOST_TEST(!merged[0].is_remote());
    auto const ranges = remote_ranges(merged);
    BOOST_TEST_REQUIRE(ranges.size() == 1U);
    BOOST_TEST(ranges[0] == (blob_range{10U, 20U}));
}

BOOST_AUTO_TEST_CASE(overlapping_ranges_are_not_merged)
{
    auto const &a = file("a");
    auto const &b = file("b");
    std::vector<missing_part> parts{remote(a, 100U, 100U),
                                    remote(b, 50U, 10U)};

    auto merged = merge_missing_chunks(std::move(parts), 1U, 1024U);
    BOOST_TEST(merged.size() == 2U);
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace chunkdiff_tests
