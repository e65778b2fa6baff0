#include <chunkdiff/differ.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include <chunkdiff/digest.hpp>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "chunkdiff/convert.hpp"
#include "chunkdiff/manifest.hpp"

#include "boost-unit-test.hpp"
#include "test-utils.hpp"

namespace chunkdiff_tests
{

using namespace chunkdiff;

namespace
{

constexpr std::string_view tool_content = "tool content";

auto own_uid() -> std::int64_t
{
    return static_cast<std::int64_t>(::getuid());
}
auto own_gid() -> std::int64_t
{
    return static_cast<std::int64_t>(::getgid());
}

auto dir_entry(std::string name) -> file_entry
{
    file_entry entry;
    entry.type = entry_type::dir;
    entry.name = std::move(name);
    entry.mode = 0755;
    entry.uid = own_uid();
    entry.gid = own_gid();
    return entry;
}

auto reg_entry(std::string name,
               std::string_view content,
               std::int64_t offset,
               std::int64_t compressedSize) -> file_entry
{
    file_entry entry;
    entry.type = entry_type::reg;
    entry.name = std::move(name);
    entry.mode = 0644;
    entry.uid = own_uid();
    entry.gid = own_gid();
    entry.size = static_cast<std::int64_t>(content.size());
    entry.digest = sha256_of(content);
    entry.offset = offset;
    entry.end_offset = offset + compressedSize;
    entry.chunk_size = entry.size;
    entry.chunk_digest = entry.digest;
    return entry;
}

auto make_layer(std::vector<file_entry> entries,
                compressed_file_type fileType,
                std::uint64_t tocOffset) -> chunked_layer
{
    chunked_layer layer;
    layer.file_type = fileType;
    layer.parsed.version = 1;
    layer.parsed.entries = std::move(entries);
    layer.manifest = serialize_toc(layer.parsed);
    layer.toc_digest = digest_of(as_bytes(layer.manifest)).value();
    layer.toc_offset = tocOffset;
    return layer;
}

// a blob with content at the given offset, filled up with 'z'
auto blob_with(std::string_view content, std::size_t offset, std::size_t size)
        -> std::vector<std::byte>
{
    std::string data(size, 'z');
    data.replace(offset, content.size(), content);
    return to_blob(data);
}

auto file_mode(std::filesystem::path const &path) -> unsigned
{
    struct stat st;
    BOOST_TEST_REQUIRE(::lstat(path.c_str(), &st) == 0);
    return st.st_mode & 07777;
}

auto inode_of(std::filesystem::path const &path) -> ino_t
{
    struct stat st;
    BOOST_TEST_REQUIRE(::lstat(path.c_str(), &st) == 0);
    return st.st_ino;
}

auto chunk_entry(std::string name,
                 std::string_view content,
                 std::int64_t offset,
                 std::int64_t chunkOffset) -> file_entry
{
    file_entry entry;
    entry.type = entry_type::chunk;
    entry.name = std::move(name);
    entry.offset = offset;
    entry.end_offset = offset + static_cast<std::int64_t>(content.size());
    entry.chunk_offset = chunkOffset;
    entry.chunk_size = static_cast<std::int64_t>(content.size());
    entry.chunk_digest = sha256_of(content);
    return entry;
}

struct differ_fixture
{
    temp_directory local;
    temp_directory target;
    std::shared_ptr<memory_layer_store> store
            = std::make_shared<memory_layer_store>();
    pull_options options;
    differ_tuning tuning;
    tar_options tarOptions;
    differ_options differOptions;

    differ_fixture()
    {
        options.enable_partial_images = true;
        options.insecure_allow_unpredictable_image_contents = true;
        tuning.copy_workers = 2U;
        tarOptions.ignore_chown_errors = true;
    }

    auto cache() -> std::shared_ptr<layers_cache>
    {
        return layers_cache::create(store).value();
    }

    // a read-only local layer holding usr/bin/tool
    void add_tool_layer()
    {
        local.write_file("usr/bin/tool", tool_content);
        toc baseToc;
        baseToc.version = 1;
        baseToc.entries.push_back(
                reg_entry("usr/bin/tool", tool_content, 100, 12));
        store->add_layer({"base", true}, local.path());
        store->put_big_data("base", manifest_big_data_key,
                            serialize_toc(baseToc));
    }

    auto pull_tool(file_entry tool) -> std::shared_ptr<memory_blob_source>
    {
        auto source = std::make_shared<memory_blob_source>(
                blob_with(tool_content, 100U, 200U));
        chunked_differ differ(cache(), source,
                              make_layer({dir_entry("usr/"),
                                          dir_entry("usr/bin/"), tool},
                                         compressed_file_type::zstd_chunked,
                                         200U),
                              options, tuning);
        auto output
                = differ.apply_diff(target.path(), tarOptions, differOptions);
        TEST_RESULT_REQUIRE(output);
        return source;
    }

    auto archive() const -> std::vector<std::byte>
    {
        tar_builder builder;
        builder.uid = static_cast<std::uint32_t>(own_uid());
        builder.gid = static_cast<std::uint32_t>(own_gid());
        builder.add_dir("etc/")
                .add_file("etc/hosts", "127.0.0.1 localhost\n")
                .add_file("etc/empty", "")
                .add_symlink("etc/link", "hosts")
                .add_file("bin/tool", std::string(3000U, 't'), 0755)
                .add_hardlink("bin/tool2", "bin/tool");
        return builder.finish();
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(differ_tests, differ_fixture)

BOOST_AUTO_TEST_CASE(files_of_local_layers_are_not_fetched)
{
    add_tool_layer();

    auto tool = reg_entry("usr/bin/tool", tool_content, 100, 12);
    tool.mode = 0755;
    auto source = std::make_shared<memory_blob_source>(
            blob_with(tool_content, 100U, 200U));
    chunked_differ differ(cache(), source,
                          make_layer({dir_entry("usr/"), dir_entry("usr/bin/"),
                                      tool},
                                     compressed_file_type::zstd_chunked, 200U),
                          options, tuning);

    auto output = differ.apply_diff(target.path(), tarOptions, differOptions);
    TEST_RESULT_REQUIRE(output);
    BOOST_TEST(source->requests().empty());
    BOOST_TEST(target.read_file("usr/bin/tool") == tool_content);
    BOOST_TEST(file_mode(target.path() / "usr/bin/tool") == 0755U);

    auto const &out = output.assume_value();
    BOOST_TEST(out.uncompressed_digest.empty());
    BOOST_TEST(out.big_data.contains(manifest_big_data_key));
    BOOST_TEST(out.big_data.contains(layer_data_big_data_key));
    BOOST_TEST_REQUIRE(out.uids.size() == 1U);
    BOOST_TEST(out.uids[0] == static_cast<std::uint32_t>(own_uid()));
}

BOOST_AUTO_TEST_CASE(chunks_of_local_layers_are_not_fetched)
{
    local.write_file("lib/one", "aaaa");
    local.write_file("lib/data", "xxxxbbbb");

    toc baseToc;
    baseToc.version = 1;
    baseToc.entries.push_back(reg_entry("lib/one", "aaaa", 100, 4));
    auto baseData = reg_entry("lib/data", "xxxxbbbb", 104, 4);
    baseData.chunk_size = 4;
    baseData.chunk_digest = sha256_of("xxxx");
    baseToc.entries.push_back(baseData);
    baseToc.entries.push_back(chunk_entry("lib/data", "bbbb", 108, 4));
    store->add_layer({"base", true}, local.path());
    store->put_big_data("base", manifest_big_data_key, serialize_toc(baseToc));

    // fetching any range would yield 'z' bytes and fail the digest check
    auto data = reg_entry("data", "aaaabbbb", 100, 4);
    data.chunk_size = 4;
    data.chunk_digest = sha256_of("aaaa");
    auto source = std::make_shared<memory_blob_source>(
            to_blob(std::string(200U, 'z')));
    chunked_differ differ(cache(), source,
                          make_layer({data, chunk_entry("data", "bbbb", 104, 4)},
                                     compressed_file_type::none, 200U),
                          options, tuning);

    auto output = differ.apply_diff(target.path(), tarOptions, differOptions);
    TEST_RESULT_REQUIRE(output);
    BOOST_TEST(source->requests().empty());
    BOOST_TEST(target.read_file("data") == "aaaabbbb");
}

BOOST_AUTO_TEST_CASE(files_with_equal_metadata_are_hard_linked)
{
    options.use_hard_links = true;
    add_tool_layer();

    auto source = pull_tool(reg_entry("usr/bin/tool", tool_content, 100, 12));
    BOOST_TEST(source->requests().empty());
    BOOST_TEST(target.read_file("usr/bin/tool") == tool_content);
    BOOST_TEST(inode_of(target.path() / "usr/bin/tool")
               == inode_of(local.path() / "usr/bin/tool"));
}

BOOST_AUTO_TEST_CASE(files_with_other_metadata_are_copied)
{
    options.use_hard_links = true;
    add_tool_layer();

    auto tool = reg_entry("usr/bin/tool", tool_content, 100, 12);
    tool.mode = 0755;
    auto source = pull_tool(tool);
    BOOST_TEST(source->requests().empty());
    BOOST_TEST(target.read_file("usr/bin/tool") == tool_content);
    BOOST_TEST(inode_of(target.path() / "usr/bin/tool")
               != inode_of(local.path() / "usr/bin/tool"));
    BOOST_TEST(file_mode(target.path() / "usr/bin/tool") == 0755U);
    BOOST_TEST(file_mode(local.path() / "usr/bin/tool") != 0755U);
}

BOOST_AUTO_TEST_CASE(copy_workers_are_clamped_to_one)
{
    tuning.copy_workers = 0U;
    add_tool_layer();

    auto source = pull_tool(reg_entry("usr/bin/tool", tool_content, 100, 12));
    BOOST_TEST(source->requests().empty());
    BOOST_TEST(target.read_file("usr/bin/tool") == tool_content);
}

BOOST_AUTO_TEST_CASE(unsupported_fs_verity_is_a_warning_if_optional)
{
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16U);
    auto const previous = spdlog::default_logger();
    spdlog::set_default_logger(
            std::make_shared<spdlog::logger>("fs-verity-test", sink));

    differOptions.fs_verity = fs_verity_mode::if_possible;
    std::string const content(4096U, 'c');
    auto source = std::make_shared<memory_blob_source>(
            blob_with(content, 1000U, 6000U));
    chunked_differ differ(cache(), source,
                          make_layer({reg_entry("data.bin", content, 1000,
                                                4096)},
                                     compressed_file_type::none, 5096U),
                          options, tuning);
    auto output = differ.apply_diff(target.path(), tarOptions, differOptions);
    spdlog::set_default_logger(previous);

    TEST_RESULT_REQUIRE(output);
    BOOST_TEST(target.read_file("data.bin") == content);
    auto const &digests = output.assume_value().fs_verity_digests;
    if (digests.empty())
    {
        // the file system doesn't support fs-verity
        auto const messages = sink->last_formatted();
        BOOST_TEST(std::any_of(messages.begin(), messages.end(),
                               [](std::string const &message) {
                                   return message.find("fs-verity")
                                          != std::string::npos;
                               }));
    }
    else
    {
        BOOST_TEST(digests.contains("/data.bin"));
    }
}

BOOST_AUTO_TEST_CASE(missing_files_are_fetched_in_one_range)
{
    std::string const content(4096U, 'c');
    auto source = std::make_shared<memory_blob_source>(
            blob_with(content, 1000U, 6000U));
    chunked_differ differ(cache(), source,
                          make_layer({reg_entry("data.bin", content, 1000,
                                                4096)},
                                     compressed_file_type::none, 5096U),
                          options, tuning);

    auto output = differ.apply_diff(target.path(), tarOptions, differOptions);
    TEST_RESULT_REQUIRE(output);

    auto const requests = source->requests();
    std::vector<blob_range> const expected{
            {1000U, 4096U}
    };
    BOOST_TEST_REQUIRE(requests.size() == 1U);
    BOOST_TEST(requests[0] == expected);
    BOOST_TEST(target.read_file("data.bin") == content);
}

BOOST_AUTO_TEST_CASE(zero_chunks_become_holes)
{
    std::string const zeros(8192U, '\0');
    auto sparse = reg_entry("sparse.img", zeros, 0, 0);
    sparse.chunk_type = chunk_kind::zeros;
    auto source = std::make_shared<memory_blob_source>(std::vector<std::byte>{});
    chunked_differ differ(cache(), source,
                          make_layer({sparse}, compressed_file_type::none, 0U),
                          options, tuning);

    auto output = differ.apply_diff(target.path(), tarOptions, differOptions);
    TEST_RESULT_REQUIRE(output);
    BOOST_TEST(source->requests().empty());
    BOOST_TEST(target.read_file("sparse.img") == zeros);
}

BOOST_AUTO_TEST_CASE(corrupted_content_is_rejected)
{
    std::string const content(4096U, 'c');
    auto source = std::make_shared<memory_blob_source>(
            blob_with(std::string(4096U, 'd'), 1000U, 6000U));
    chunked_differ differ(cache(), source,
                          make_layer({reg_entry("data.bin", content, 1000,
                                                4096)},
                                     compressed_file_type::none, 5096U),
                          options, tuning);

    auto output = differ.apply_diff(target.path(), tarOptions, differOptions);
    BOOST_TEST_REQUIRE(output.has_error());
    BOOST_TEST(output.assume_error() == chunked_errc::checksum_mismatch);
}

BOOST_AUTO_TEST_CASE(rejected_requests_are_merged)
{
    std::string const first = "first file";
    std::string const second = "second file";
    std::string data(4000U, 'z');
    data.replace(100U, first.size(), first);
    data.replace(3000U, second.size(), second);
    auto source = std::make_shared<memory_blob_source>(to_blob(data));
    source->max_ranges = 1U;
    tuning.auto_merge_threshold = 16U;

    chunked_differ differ(
            cache(), source,
            make_layer({reg_entry("a", first, 100,
                                  static_cast<std::int64_t>(first.size())),
                        reg_entry("b", second, 3000,
                                  static_cast<std::int64_t>(second.size()))},
                       compressed_file_type::none, 4000U),
            options, tuning);

    auto output = differ.apply_diff(target.path(), tarOptions, differOptions);
    TEST_RESULT_REQUIRE(output);

    auto const requests = source->requests();
    BOOST_TEST_REQUIRE(requests.size() == 2U);
    BOOST_TEST(requests[0].size() == 2U);
    std::vector<blob_range> const merged{
            {100U, 3000U + second.size() - 100U}
    };
    BOOST_TEST(requests[1] == merged);
    BOOST_TEST(target.read_file("a") == first);
    BOOST_TEST(target.read_file("b") == second);
}

BOOST_AUTO_TEST_CASE(differs_apply_once)
{
    auto source = std::make_shared<memory_blob_source>(std::vector<std::byte>{});
    chunked_differ differ(cache(), source,
                          make_layer({dir_entry("etc/")},
                                     compressed_file_type::none, 0U),
                          options, tuning);

    TEST_RESULT_REQUIRE(
            differ.apply_diff(target.path(), tarOptions, differOptions));
    auto again = differ.apply_diff(target.path(), tarOptions, differOptions);
    BOOST_TEST_REQUIRE(again.has_error());
    BOOST_TEST(again.assume_error() == chunked_errc::differ_already_used);
}

BOOST_AUTO_TEST_CASE(layers_without_tar_split_need_the_insecure_option)
{
    options.insecure_allow_unpredictable_image_contents = false;
    auto source = std::make_shared<memory_blob_source>(std::vector<std::byte>{});
    chunked_differ differ(cache(), source,
                          make_layer({dir_entry("etc/")},
                                     compressed_file_type::none, 0U),
                          options, tuning);

    auto output = differ.apply_diff(target.path(), tarOptions, differOptions);
    BOOST_TEST_REQUIRE(output.has_error());
    BOOST_TEST(output.assume_error() == chunked_errc::fallback_can_convert);
}

BOOST_AUTO_TEST_CASE(staged_tree_is_digested_like_a_full_pull)
{
    options.insecure_allow_unpredictable_image_contents = false;
    auto const raw = archive();
    auto converted = detail::index_tar_file(make_temp_file(raw)).value();

    chunked_layer layer;
    layer.file_type = compressed_file_type::none;
    layer.manifest = converted.manifest_json;
    layer.toc_digest = digest_of(as_bytes(layer.manifest)).value();
    layer.parsed = converted.manifest;
    layer.toc_offset = static_cast<std::uint64_t>(converted.tar_size);
    layer.tar_split = converted.tar_split;
    layer.tar_size = converted.tar_size;

    auto source = std::make_shared<memory_blob_source>(raw);
    chunked_differ differ(cache(), source, std::move(layer), options, tuning);

    auto output = differ.apply_diff(target.path(), tarOptions, differOptions);
    TEST_RESULT_REQUIRE(output);
    BOOST_TEST(output.assume_value().uncompressed_digest
               == converted.uncompressed_digest);
    BOOST_TEST(output.assume_value().size
               == static_cast<std::int64_t>(raw.size()));

    BOOST_TEST(target.read_file("etc/hosts") == "127.0.0.1 localhost\n");
    BOOST_TEST(target.read_file("etc/empty").empty());
    BOOST_TEST(std::filesystem::read_symlink(target.path() / "etc/link")
                       .string()
               == "hosts");
    BOOST_TEST(file_mode(target.path() / "bin/tool") == 0755U);
    BOOST_TEST(std::filesystem::hard_link_count(target.path() / "bin/tool")
               == 2U);
}

BOOST_AUTO_TEST_CASE(flat_trees_store_files_by_digest)
{
    options.insecure_allow_unpredictable_image_contents = false;
    differOptions.format = output_format::flat;
    auto const raw = archive();
    auto converted = detail::index_tar_file(make_temp_file(raw)).value();

    chunked_layer layer;
    layer.file_type = compressed_file_type::none;
    layer.manifest = converted.manifest_json;
    layer.toc_digest = digest_of(as_bytes(layer.manifest)).value();
    layer.parsed = converted.manifest;
    layer.toc_offset = static_cast<std::uint64_t>(converted.tar_size);
    layer.tar_split = converted.tar_split;
    layer.tar_size = converted.tar_size;

    auto source = std::make_shared<memory_blob_source>(raw);
    chunked_differ differ(cache(), source, std::move(layer), options, tuning);

    auto output = differ.apply_diff(target.path(), tarOptions, differOptions);
    TEST_RESULT_REQUIRE(output);
    BOOST_TEST(output.assume_value().uncompressed_digest
               == converted.uncompressed_digest);

    auto const hostsPath
            = flat_path_for_digest(sha256_of("127.0.0.1 localhost\n")).value();
    BOOST_TEST(target.read_file(hostsPath) == "127.0.0.1 localhost\n");
    BOOST_TEST(!std::filesystem::exists(target.path() / "etc/hosts"));
}

BOOST_AUTO_TEST_CASE(plain_tar_layers_are_converted)
{
    options.insecure_allow_unpredictable_image_contents = false;
    auto const raw = archive();
    auto const blobDigest = digest_of(raw).value();
    auto source = std::make_shared<memory_blob_source>(raw);

    auto differ = chunked_differ::converting(cache(), source, blobDigest,
                                             raw.size(), options, tuning);
    BOOST_TEST(differ->converts());

    auto output = differ->apply_diff(target.path(), tarOptions, differOptions);
    TEST_RESULT_REQUIRE(output);
    auto const &out = output.assume_value();
    BOOST_TEST(out.compressed_digest == blobDigest);
    BOOST_TEST(out.uncompressed_digest == blobDigest);
    BOOST_TEST(out.tar_split.has_value());
    BOOST_TEST(!out.toc_digest.empty());

    std::vector<blob_range> const whole{
            {0U, raw.size()}
    };
    auto const requests = source->requests();
    BOOST_TEST_REQUIRE(requests.size() == 1U);
    BOOST_TEST(requests[0] == whole);
    BOOST_TEST(target.read_file("bin/tool") == std::string(3000U, 't'));
}

BOOST_AUTO_TEST_CASE(conversion_checks_the_blob_digest)
{
    auto const raw = archive();
    auto source = std::make_shared<memory_blob_source>(raw);

    auto differ = chunked_differ::converting(
            cache(), source, sha256_of("something else"), raw.size(), options,
            tuning);
    auto output = differ->apply_diff(target.path(), tarOptions, differOptions);
    BOOST_TEST_REQUIRE(output.has_error());
    BOOST_TEST(output.assume_error() == chunked_errc::checksum_mismatch);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(make_differ_tests, differ_fixture)

BOOST_AUTO_TEST_CASE(disabled_partial_pulls_recommend_a_fallback)
{
    options.enable_partial_images = false;
    auto source = std::make_shared<memory_blob_source>(std::vector<std::byte>{});
    auto differ = make_differ(cache(), source, sha256_of("blob"), 0U, {},
                              options);
    BOOST_TEST_REQUIRE(differ.has_error());
    BOOST_TEST(differ.assume_error() == chunked_errc::fallback_recommended);
}

BOOST_AUTO_TEST_CASE(blobs_without_toc_can_be_converted)
{
    auto source = std::make_shared<memory_blob_source>(std::vector<std::byte>{});
    auto differ = make_differ(cache(), source, sha256_of("blob"), 0U, {},
                              options);
    BOOST_TEST_REQUIRE(differ.has_error());
    BOOST_TEST(differ.assume_error() == chunked_errc::fallback_can_convert);

    options.convert_images = true;
    auto converting = make_differ(cache(), source, sha256_of("blob"), 0U, {},
                                  options);
    TEST_RESULT_REQUIRE(converting);
    BOOST_TEST(converting.assume_value()->converts());
}

BOOST_AUTO_TEST_CASE(ambiguous_annotations_are_rejected)
{
    annotation_map const annotations{
            {std::string(detail::zstd_chunked_manifest_checksum_key),
             sha256_of("toc")},
            {std::string(detail::estargz_toc_digest_key), sha256_of("toc")},
    };
    auto source = std::make_shared<memory_blob_source>(std::vector<std::byte>{});
    options.convert_images = true;
    auto differ = make_differ(cache(), source, sha256_of("blob"), 0U,
                              annotations, options);
    BOOST_TEST_REQUIRE(differ.has_error());
    BOOST_TEST(differ.assume_error() == chunked_errc::invalid_manifest);
}

BOOST_AUTO_TEST_CASE(estargz_needs_the_insecure_option)
{
    options.insecure_allow_unpredictable_image_contents = false;
    annotation_map const annotations{
            {std::string(detail::estargz_toc_digest_key), sha256_of("toc")},
    };
    auto source = std::make_shared<memory_blob_source>(std::vector<std::byte>{});
    auto differ = make_differ(cache(), source, sha256_of("blob"), 0U,
                              annotations, options);
    BOOST_TEST_REQUIRE(differ.has_error());
    BOOST_TEST(differ.assume_error() == chunked_errc::fallback_can_convert);

    options.convert_images = true;
    auto converting = make_differ(cache(), source, sha256_of("blob"), 0U,
                                  annotations, options);
    TEST_RESULT_REQUIRE(converting);
    BOOST_TEST(converting.assume_value()->converts());
}

BOOST_AUTO_TEST_CASE(malformed_toc_digests_are_rejected)
{
    annotation_map const annotations{
            {std::string(detail::zstd_chunked_manifest_checksum_key),
             "sha256:nothex"},
    };
    auto source = std::make_shared<memory_blob_source>(std::vector<std::byte>{});
    auto differ = make_differ(cache(), source, sha256_of("blob"), 0U,
                              annotations, options);
    BOOST_TEST_REQUIRE(differ.has_error());
    BOOST_TEST(differ.assume_error() == chunked_errc::invalid_digest);
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace chunkdiff_tests
