#include "chunkdiff/manifest.hpp"

#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

#include <chunkdiff/differ.hpp>
#include <chunkdiff/digest.hpp>

#include "chunkdiff/convert.hpp"

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

namespace chunkdiff_tests
{

using namespace chunkdiff;
using namespace chunkdiff::detail;

namespace
{

void append(std::vector<std::byte> &out, ro_dynblob data)
{
    out.insert(out.end(), data.begin(), data.end());
}

auto sample_archive() -> std::vector<std::byte>
{
    tar_builder builder;
    builder.uid = static_cast<std::uint32_t>(::getuid());
    builder.gid = static_cast<std::uint32_t>(::getgid());
    builder.add_dir("etc/")
            .add_file("etc/hosts", "127.0.0.1 localhost\n")
            .add_file("etc/motd", std::string(5000U, 'm'))
            .add_symlink("etc/issue", "motd")
            .add_file("etc/empty", "");
    return builder.finish();
}

/**
 * @brief A zstd:chunked blob with one frame per regular file followed by
 * the compressed table of contents and tar-split.
 */
struct zstd_chunked_blob
{
    std::vector<std::byte> data;
    annotation_map annotations;
    std::string toc_digest;
    std::string toc_json;
    std::string tar_split;
    std::string uncompressed_digest;
    std::uint64_t toc_offset{0U};

    zstd_chunked_blob(std::vector<std::byte> const &archive,
                      bool withTarSplit)
    {
        auto converted = index_tar_file(make_temp_file(archive)).value();
        uncompressed_digest = converted.uncompressed_digest;
        tar_split = converted.tar_split;

        toc manifest = converted.manifest;
        for (auto &entry : manifest.entries)
        {
            if (entry.type != entry_type::reg || entry.size == 0)
            {
                continue;
            }
            auto const content = ro_dynblob(archive).subspan(
                    static_cast<std::size_t>(entry.offset),
                    static_cast<std::size_t>(entry.size));
            entry.offset = static_cast<std::int64_t>(data.size());
            append(data, zstd_compress(content));
            entry.end_offset = static_cast<std::int64_t>(data.size());
        }

        auto const compressedSplit = zstd_compress(as_bytes(tar_split));
        manifest.tar_split_digest
                = withTarSplit ? digest_of(compressedSplit).value() : "";
        toc_json = serialize_toc(manifest);
        auto const compressedToc = zstd_compress(as_bytes(toc_json));
        toc_digest = digest_of(compressedToc).value();

        toc_offset = data.size();
        append(data, compressedToc);
        auto const splitOffset = data.size();
        append(data, compressedSplit);

        annotations.emplace(zstd_chunked_manifest_checksum_key, toc_digest);
        annotations.emplace(zstd_chunked_manifest_position_key,
                            fmt::format("{}:{}:{}:1", toc_offset,
                                        compressedToc.size(),
                                        toc_json.size()));
        if (withTarSplit)
        {
            annotations.emplace(zstd_chunked_tar_split_position_key,
                                fmt::format("{}:{}:{}", splitOffset,
                                            compressedSplit.size(),
                                            tar_split.size()));
        }
    }
};

// gzip member with an empty deflate stream carrying the TOC offset
auto estargz_footer(std::uint64_t tocOffset) -> std::vector<std::byte>
{
    std::vector<std::byte> footer;
    auto const put = [&footer](std::initializer_list<unsigned> bytes) {
        for (auto b : bytes)
        {
            footer.push_back(static_cast<std::byte>(b));
        }
    };
    put({0x1f, 0x8b, 0x08, 0x04, 0, 0, 0, 0, 0, 0xff, 26, 0, 'S', 'G', 22, 0});
    append(footer, as_bytes(fmt::format("{:016x}STARGZ", tocOffset)));
    put({0x01, 0x00, 0x00, 0xff, 0xff, 0, 0, 0, 0, 0, 0, 0, 0});
    return footer;
}

} // namespace

BOOST_AUTO_TEST_SUITE(manifest_tests)

BOOST_AUTO_TEST_CASE(blob_positions)
{
    auto withType = parse_blob_position("10:20:30:1", true);
    TEST_RESULT_REQUIRE(withType);
    BOOST_TEST(withType.assume_value().range == (blob_range{10U, 20U}));
    BOOST_TEST(withType.assume_value().uncompressed_length == 30U);
    BOOST_TEST(withType.assume_value().type == 1U);

    auto withoutType = parse_blob_position("1:2:3", false);
    TEST_RESULT_REQUIRE(withoutType);
    BOOST_TEST(withoutType.assume_value().uncompressed_length == 3U);

    for (auto invalid : {"1:2", "1:2:3:4", "a:2:3", "1::3", ""})
    {
        auto rx = parse_blob_position(invalid, false);
        BOOST_TEST_REQUIRE(rx.has_error(), invalid);
        BOOST_TEST(rx.assume_error() == chunked_errc::invalid_manifest);
    }
}

BOOST_AUTO_TEST_CASE(reads_zstd_chunked_manifest_and_tar_split)
{
    zstd_chunked_blob const blob(sample_archive(), true);
    memory_blob_source source(blob.data);

    auto manifest = read_zstd_chunked_manifest(source, blob.toc_digest,
                                               blob.annotations);
    TEST_RESULT_REQUIRE(manifest);
    auto const &m = manifest.assume_value();
    BOOST_TEST(m.json == blob.toc_json);
    BOOST_TEST(m.toc_offset == blob.toc_offset);
    BOOST_TEST(m.parsed.entries.size() == 5U);
    BOOST_TEST_REQUIRE(m.tar_split.has_value());
    BOOST_TEST(*m.tar_split == blob.tar_split);
    BOOST_TEST(source.requests().size() == 1U);
    BOOST_TEST(source.requests()[0].size() == 2U);
}

BOOST_AUTO_TEST_CASE(rejects_a_manifest_with_another_digest)
{
    zstd_chunked_blob const blob(sample_archive(), true);
    memory_blob_source source(blob.data);

    auto manifest = read_zstd_chunked_manifest(source, sha256_of("other"),
                                               blob.annotations);
    BOOST_TEST_REQUIRE(manifest.has_error());
    BOOST_TEST(manifest.assume_error() == chunked_errc::checksum_mismatch);
}

BOOST_AUTO_TEST_CASE(requires_the_position_annotation)
{
    zstd_chunked_blob blob(sample_archive(), true);
    blob.annotations.erase(std::string(zstd_chunked_manifest_position_key));
    memory_blob_source source(blob.data);

    auto manifest = read_zstd_chunked_manifest(source, blob.toc_digest,
                                               blob.annotations);
    BOOST_TEST_REQUIRE(manifest.has_error());
    BOOST_TEST(manifest.assume_error() == chunked_errc::invalid_manifest);
}

BOOST_AUTO_TEST_CASE(requires_the_tar_split_the_toc_refers_to)
{
    zstd_chunked_blob blob(sample_archive(), true);
    blob.annotations.erase(std::string(zstd_chunked_tar_split_position_key));
    memory_blob_source source(blob.data);

    auto manifest = read_zstd_chunked_manifest(source, blob.toc_digest,
                                               blob.annotations);
    BOOST_TEST_REQUIRE(manifest.has_error());
    BOOST_TEST(manifest.assume_error() == chunked_errc::invalid_manifest);
}

BOOST_AUTO_TEST_CASE(rejected_manifest_requests_suggest_conversion)
{
    zstd_chunked_blob const blob(sample_archive(), true);
    memory_blob_source source(blob.data);
    source.max_ranges = 1U;

    auto manifest = read_zstd_chunked_manifest(source, blob.toc_digest,
                                               blob.annotations);
    BOOST_TEST_REQUIRE(manifest.has_error());
    BOOST_TEST(manifest.assume_error() == chunked_errc::fallback_can_convert);
}

BOOST_AUTO_TEST_CASE(reads_estargz_manifest_through_the_footer)
{
    toc index;
    index.version = 1;
    file_entry hosts;
    hosts.type = entry_type::reg;
    hosts.name = "etc/hosts";
    hosts.size = 4;
    hosts.digest = sha256_of("host");
    hosts.offset = 10;
    index.entries.push_back(hosts);
    auto const json = serialize_toc(index);

    tar_builder tocTar;
    tocTar.add_file("stargz.index.json", json);
    auto const compressedToc = gzip_compress(tocTar.finish());

    std::vector<std::byte> data(100U, std::byte{'p'});
    append(data, compressedToc);
    append(data, estargz_footer(100U));
    memory_blob_source source(data);

    auto manifest = read_estargz_manifest(source, data.size(),
                                          sha256_of(json));
    TEST_RESULT_REQUIRE(manifest);
    BOOST_TEST(manifest.assume_value().json == json);
    BOOST_TEST(manifest.assume_value().toc_offset == 100U);
    BOOST_TEST_REQUIRE(manifest.assume_value().parsed.entries.size() == 1U);
    BOOST_TEST(manifest.assume_value().parsed.entries[0].name == "etc/hosts");

    auto wrong = read_estargz_manifest(source, data.size(), sha256_of("x"));
    BOOST_TEST_REQUIRE(wrong.has_error());
    BOOST_TEST(wrong.assume_error() == chunked_errc::checksum_mismatch);
}

BOOST_AUTO_TEST_CASE(estargz_footer_must_be_valid)
{
    std::vector<std::byte> data(200U, std::byte{'p'});
    memory_blob_source source(data);

    auto manifest = read_estargz_manifest(source, data.size(),
                                          sha256_of("toc"));
    BOOST_TEST_REQUIRE(manifest.has_error());
    BOOST_TEST(manifest.assume_error() == chunked_errc::invalid_manifest);
}

BOOST_AUTO_TEST_CASE(zstd_chunked_layers_are_pulled_partially)
{
    auto const archive = sample_archive();
    zstd_chunked_blob const blob(archive, true);
    auto source = std::make_shared<memory_blob_source>(blob.data);
    auto store = std::make_shared<memory_layer_store>();
    auto cache = layers_cache::create(store).value();
    temp_directory target;

    pull_options options;
    options.enable_partial_images = true;
    tar_options tarOptions;
    tarOptions.ignore_chown_errors = true;

    auto differ = make_differ(cache, source, sha256_of("blob"),
                              blob.data.size(), blob.annotations, options);
    TEST_RESULT_REQUIRE(differ);
    BOOST_TEST(!differ.assume_value()->converts());
    BOOST_TEST((differ.assume_value()->file_type()
                == compressed_file_type::zstd_chunked));

    auto output = differ.assume_value()->apply_diff(target.path(), tarOptions,
                                                    differ_options{});
    TEST_RESULT_REQUIRE(output);
    auto const &out = output.assume_value();
    BOOST_TEST(out.toc_digest == blob.toc_digest);
    BOOST_TEST(out.uncompressed_digest == blob.uncompressed_digest);
    BOOST_TEST(out.size == static_cast<std::int64_t>(archive.size()));
    BOOST_TEST(target.read_file("etc/hosts") == "127.0.0.1 localhost\n");
    BOOST_TEST(target.read_file("etc/motd") == std::string(5000U, 'm'));

    // the manifest request and a single request for the file data
    auto const requests = source->requests();
    BOOST_TEST_REQUIRE(requests.size() == 2U);
    std::vector<blob_range> const fileData{
            {0U, blob.toc_offset}
    };
    BOOST_TEST(requests[1] == fileData);
}

BOOST_AUTO_TEST_CASE(zstd_chunked_layers_without_tar_split_can_be_converted)
{
    zstd_chunked_blob const blob(sample_archive(), false);
    auto source = std::make_shared<memory_blob_source>(blob.data);
    auto cache = layers_cache::create(std::make_shared<memory_layer_store>())
                         .value();

    pull_options options;
    options.enable_partial_images = true;
    auto differ = make_differ(cache, source, sha256_of("blob"),
                              blob.data.size(), blob.annotations, options);
    BOOST_TEST_REQUIRE(differ.has_error());
    BOOST_TEST(differ.assume_error() == chunked_errc::fallback_can_convert);

    options.insecure_allow_unpredictable_image_contents = true;
    auto insecure = make_differ(cache, source, sha256_of("blob"),
                                blob.data.size(), blob.annotations, options);
    TEST_RESULT_REQUIRE(insecure);
    BOOST_TEST(!insecure.assume_value()->converts());
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace chunkdiff_tests
