#include <chunkdiff/toc.hpp>

#include <chunkdiff/digest.hpp>
#include <chunkdiff/utils/path.hpp>

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

namespace chunkdiff_tests
{

using namespace chunkdiff;

BOOST_AUTO_TEST_SUITE(toc_tests)

BOOST_AUTO_TEST_CASE(parse_matches_keys_case_insensitively)
{
    constexpr std::string_view manifest = R"({
        "Version": 1,
        "ENTRIES": [
            {"type": "dir", "name": "etc/", "mode": 493, "modtime": "2023-11-14T22:13:20Z"},
            {"Type": "reg", "Name": "etc/hosts", "Size": 5, "UID": 1000,
             "digest": "sha256:b0c4a8ccbf22a7d5be6c8a45e40b12c3ebdd9dde1a4ef7fbd4bd5e4e3fb5d2b1",
             "offset": 100, "endOffset": 140,
             "xattrs": {"user.test": "dmFsdWU="}, "unknown": [1, 2]},
            {"type": "symlink", "name": "etc/link", "linkName": "hosts"}
        ]
    })";

    auto parsed = parse_toc(manifest);
    TEST_RESULT_REQUIRE(parsed);
    auto const &value = parsed.assume_value();
    BOOST_TEST(value.version == 1);
    BOOST_TEST_REQUIRE(value.entries.size() == 3U);

    auto const &dir = value.entries[0];
    BOOST_TEST((dir.type == entry_type::dir));
    BOOST_TEST(dir.mode == 0755);
    BOOST_TEST_REQUIRE(dir.modtime.has_value());
    BOOST_TEST(dir.modtime->time_since_epoch().count()
               == 1700000000LL * 1000000000LL);

    auto const &file = value.entries[1];
    BOOST_TEST((file.type == entry_type::reg));
    BOOST_TEST(file.name == "etc/hosts");
    BOOST_TEST(file.size == 5);
    BOOST_TEST(file.uid == 1000);
    BOOST_TEST(file.offset == 100);
    BOOST_TEST(file.end_offset == 140);
    BOOST_TEST(file.xattrs.at("user.test") == "dmFsdWU=");

    BOOST_TEST(value.entries[2].linkname == "hosts");
}

BOOST_AUTO_TEST_CASE(parse_rejects_trailing_data)
{
    auto parsed = parse_toc(R"({"version": 1, "entries": []} {})");
    BOOST_TEST_REQUIRE(parsed.has_error());
    BOOST_TEST(parsed.assume_error() == chunked_errc::invalid_manifest);

    TEST_RESULT(parse_toc("{\"version\": 1}\n  \t"));
}

BOOST_AUTO_TEST_CASE(parse_rejects_unknown_entry_types)
{
    auto parsed = parse_toc(R"({"entries": [{"type": "socket", "name": "s"}]})");
    BOOST_TEST_REQUIRE(parsed.has_error());
    BOOST_TEST(parsed.assume_error() == chunked_errc::unsupported_entry_type);
}

BOOST_AUTO_TEST_CASE(parse_rejects_unknown_chunk_types)
{
    auto parsed = parse_toc(
            R"({"entries": [{"type": "reg", "name": "f", "chunkType": "ones"}]})");
    BOOST_TEST_REQUIRE(parsed.has_error());
    BOOST_TEST(parsed.assume_error() == chunked_errc::invalid_manifest);
}

BOOST_AUTO_TEST_CASE(empty_files_get_the_empty_digest)
{
    auto parsed = parse_toc(R"({"entries": [{"type": "reg", "name": "empty"}]})");
    TEST_RESULT_REQUIRE(parsed);
    BOOST_TEST(parsed.assume_value().entries[0].digest == empty_sha256_digest);
}

BOOST_AUTO_TEST_CASE(serialize_round_trips_through_parse)
{
    toc manifest;
    manifest.version = 1;
    file_entry entry;
    entry.type = entry_type::reg;
    entry.name = "bin/sh";
    entry.mode = 0755;
    entry.size = 10;
    entry.digest = sha256_of("0123456789");
    entry.modtime = file_time{std::chrono::nanoseconds{1700000000123456789LL}};
    entry.chunk_type = chunk_kind::zeros;
    manifest.entries.push_back(entry);

    auto parsed = parse_toc(serialize_toc(manifest));
    TEST_RESULT_REQUIRE(parsed);
    auto const &decoded = parsed.assume_value().entries.at(0);
    BOOST_TEST(decoded.name == entry.name);
    BOOST_TEST(decoded.mode == entry.mode);
    BOOST_TEST(decoded.digest == entry.digest);
    BOOST_TEST((decoded.modtime == entry.modtime));
    BOOST_TEST((decoded.chunk_type == chunk_kind::zeros));
}

BOOST_AUTO_TEST_CASE(file_times_with_zone_offsets)
{
    auto utc = parse_file_time("2023-11-14T22:13:20Z");
    auto shifted = parse_file_time("2023-11-15T00:13:20.5+02:00");
    TEST_RESULT_REQUIRE(utc);
    TEST_RESULT_REQUIRE(shifted);
    BOOST_TEST((shifted.assume_value() - utc.assume_value()
                == std::chrono::milliseconds{500}));

    BOOST_TEST(parse_file_time("2023-13-01T00:00:00Z").has_error());
    BOOST_TEST(format_file_time(utc.assume_value()) == "2023-11-14T22:13:20Z");
}

BOOST_AUTO_TEST_CASE(merge_attaches_chunks_to_their_file)
{
    std::vector<file_entry> entries(4);
    entries[0].type = entry_type::dir;
    entries[0].name = "d";
    entries[1].type = entry_type::reg;
    entries[1].name = "d/f";
    entries[1].size = 300;
    entries[1].offset = 10;
    entries[1].chunk_size = 100;
    entries[2].type = entry_type::chunk;
    entries[2].name = "d/f";
    entries[2].offset = 60;
    entries[2].chunk_offset = 100;
    entries[2].chunk_size = 200;
    entries[2].end_offset = 90;
    entries[3].type = entry_type::reg;
    entries[3].name = "g";
    entries[3].size = 1;
    entries[3].offset = 90;

    auto merged = merge_entries(compressed_file_type::zstd_chunked, 120,
                                entries);
    TEST_RESULT_REQUIRE(merged);
    auto const &files = merged.assume_value();
    BOOST_TEST_REQUIRE(files.size() == 3U);

    auto const &f = files[1];
    BOOST_TEST_REQUIRE(f.chunks.size() == 2U);
    BOOST_TEST(f.end_offset == 90);
    BOOST_TEST(f.chunks[0].offset == 10);
    BOOST_TEST(f.chunks[0].end_offset == 60);
    BOOST_TEST(f.chunks[0].size == 50);
    BOOST_TEST(f.chunks[1].end_offset == 90);
    BOOST_TEST(f.chunks[1].size == 30);

    // the end of the last entry is the start of the table of contents
    BOOST_TEST(files[2].end_offset == 120);
    BOOST_TEST(files[2].chunks.at(0).size == 30);
}

BOOST_AUTO_TEST_CASE(merge_rejects_orphan_chunks)
{
    std::vector<file_entry> entries(1);
    entries[0].type = entry_type::chunk;
    entries[0].name = "f";

    auto merged = merge_entries(compressed_file_type::zstd_chunked, 0, entries);
    BOOST_TEST_REQUIRE(merged.has_error());
    BOOST_TEST(merged.assume_error() == chunked_errc::invalid_manifest);
}

BOOST_AUTO_TEST_CASE(merge_drops_estargz_landmarks)
{
    std::vector<file_entry> entries(2);
    entries[0].name = ".prefetch.landmark";
    entries[0].offset = 10;
    entries[1].name = "data";
    entries[1].offset = 20;

    auto estargz = merge_entries(compressed_file_type::estargz, 40, entries);
    TEST_RESULT_REQUIRE(estargz);
    BOOST_TEST_REQUIRE(estargz.assume_value().size() == 1U);
    BOOST_TEST(estargz.assume_value()[0].name == "data");
    BOOST_TEST(estargz.assume_value()[0].end_offset == 40);

    auto zstd = merge_entries(compressed_file_type::zstd_chunked, 40, entries);
    TEST_RESULT_REQUIRE(zstd);
    BOOST_TEST(zstd.assume_value().size() == 2U);
}

BOOST_AUTO_TEST_CASE(flat_entries_are_content_addressed)
{
    auto const digest = sha256_of("shared");
    std::vector<file_metadata> entries(4);
    entries[0].type = entry_type::dir;
    entries[0].name = "d";
    entries[1].name = "./d/one";
    entries[1].digest = digest;
    entries[2].name = "d/two";
    entries[2].digest = digest;
    entries[3].type = entry_type::symlink;
    entries[3].name = "d/link";

    std::map<std::string, std::string> names;
    auto flat = make_entries_flat(entries, &names);
    TEST_RESULT_REQUIRE(flat);
    BOOST_TEST_REQUIRE(flat.assume_value().size() == 1U);

    auto const expected = std::string(digest.substr(7, 2)) + "/"
                          + std::string(digest.substr(9));
    BOOST_TEST(flat.assume_value()[0].name == expected);
    BOOST_TEST(flat.assume_value()[0].skip_set_attrs);
    BOOST_TEST(names.at("d/one") == expected);
    BOOST_TEST(names.at("d/two") == expected);
}

BOOST_AUTO_TEST_CASE(flat_entries_need_a_digest)
{
    std::vector<file_metadata> entries(1);
    entries[0].name = "f";
    auto flat = make_entries_flat(entries, nullptr);
    BOOST_TEST_REQUIRE(flat.has_error());
    BOOST_TEST(flat.assume_error() == chunked_errc::invalid_manifest);
}

BOOST_AUTO_TEST_CASE(fingerprint_covers_owner_mode_and_xattrs)
{
    file_entry entry;
    entry.digest = sha256_of("content");
    entry.mode = 0644;
    auto const base = hard_link_fingerprint(entry).value();

    auto other = entry;
    other.uid = 1;
    BOOST_TEST(hard_link_fingerprint(other).value() != base);

    other = entry;
    other.mode = 0600;
    BOOST_TEST(hard_link_fingerprint(other).value() != base);

    other = entry;
    other.xattrs.emplace("user.a", "YQ==");
    BOOST_TEST(hard_link_fingerprint(other).value() != base);

    BOOST_TEST(hard_link_fingerprint(entry).value() == base);
}

BOOST_AUTO_TEST_CASE(layer_data_round_trip)
{
    BOOST_TEST(serialize_layer_data(output_format::flat)
               == R"({"format":"flat"})");
    BOOST_TEST((parse_layer_data(R"({"format":"flat"})").value()
                == output_format::flat));
    BOOST_TEST((parse_layer_data("{}").value() == output_format::dir));

    auto unknown = parse_layer_data(R"({"format":"tree"})");
    BOOST_TEST_REQUIRE(unknown.has_error());
    BOOST_TEST(unknown.assume_error() == chunked_errc::unsupported_format);
}

BOOST_AUTO_TEST_CASE(clean_paths)
{
    BOOST_TEST(utils::clean_path("./a//b/../c/") == "a/c");
    BOOST_TEST(utils::clean_path("") == ".");
    BOOST_TEST(utils::clean_absolute_path("../../etc/passwd") == "/etc/passwd");
    BOOST_TEST(utils::clean_absolute_path("./") == "/");
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace chunkdiff_tests
