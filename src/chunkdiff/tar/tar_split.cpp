#include "tar_split.hpp"

#include <array>
#include <cerrno>
#include <set>

#include <fcntl.h>
#include <unistd.h>

#include <boost/endian/conversion.hpp>
#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include <chunkdiff/utils/path.hpp>

#include "../fs/under_root.hpp"
#include "tar_reader.hpp"

namespace chunkdiff::detail
{

namespace
{

auto json_int(boost::json::object const &obj, std::string_view key)
        -> result<std::int64_t>
{
    auto const *const value = obj.if_contains(key);
    if (value == nullptr || value->is_null())
    {
        return 0;
    }
    if (auto const *i = value->if_int64())
    {
        return *i;
    }
    if (auto const *u = value->if_uint64();
        u != nullptr && *u <= static_cast<std::uint64_t>(INT64_MAX))
    {
        return static_cast<std::int64_t>(*u);
    }
    return chunked_errc::invalid_manifest;
}

auto json_bytes(boost::json::object const &obj, std::string_view key)
        -> result<std::vector<std::byte>>
{
    auto const *const value = obj.if_contains(key);
    if (value == nullptr || value->is_null())
    {
        return std::vector<std::byte>{};
    }
    auto const *const str = value->if_string();
    if (str == nullptr)
    {
        return chunked_errc::invalid_manifest;
    }
    return decode_base64(std::string_view(*str));
}

auto parse_tar_split_line(std::string_view line) -> result<tar_split_entry>
{
    boost::system::error_code ec;
    auto const parsed = boost::json::parse(line, ec);
    if (ec || !parsed.is_object())
    {
        SPDLOG_DEBUG("invalid tar-split record: {}", ec.message());
        return chunked_errc::invalid_manifest;
    }
    auto const &obj = parsed.get_object();

    tar_split_entry entry;
    CHUNKDIFF_TRY(auto &&type, json_int(obj, "type"));
    switch (type)
    {
    case static_cast<std::int64_t>(tar_split_entry_type::file):
        entry.type = tar_split_entry_type::file;
        break;
    case static_cast<std::int64_t>(tar_split_entry_type::segment):
        entry.type = tar_split_entry_type::segment;
        break;
    default:
        return chunked_errc::invalid_manifest;
    }

    if (auto const *name = obj.if_contains("name");
        name != nullptr && name->is_string())
    {
        entry.name = std::string(name->get_string());
    }
    CHUNKDIFF_TRY(auto &&rawName, json_bytes(obj, "name_raw"));
    if (!rawName.empty())
    {
        entry.name = std::string(as_string_view(rawName));
    }
    CHUNKDIFF_TRY(entry.size, json_int(obj, "size"));
    CHUNKDIFF_TRY(entry.payload, json_bytes(obj, "payload"));
    CHUNKDIFF_TRY(entry.position, json_int(obj, "position"));
    if (entry.size < 0)
    {
        return chunked_errc::invalid_manifest;
    }
    return entry;
}

/**
 * @brief Reproduces the tar stream with every file content replaced by
 * zeros, which suffices to decode the headers.
 */
class header_only_stream final : public blob_stream
{
public:
    explicit header_only_stream(std::span<tar_split_entry const> entries)
        : mEntries(entries)
    {
        load();
    }

    auto read_some(rw_dynblob buffer) -> result<std::size_t> override
    {
        std::size_t filled = 0U;
        while (filled < buffer.size() && !mEntries.empty())
        {
            auto const n = static_cast<std::size_t>(std::min<std::uint64_t>(
                    buffer.size() - filled, mRemaining));
            auto const target = buffer.subspan(filled, n);
            if (mEntries.front().type == tar_split_entry_type::segment)
            {
                auto const &payload = mEntries.front().payload;
                auto const offset = payload.size() - mRemaining;
                copy(ro_dynblob(payload).subspan(offset, n), target);
            }
            else
            {
                fill_blob(target);
            }
            filled += n;
            mRemaining -= n;
            if (mRemaining == 0U)
            {
                mEntries = mEntries.subspan(1U);
                load();
            }
        }
        return filled;
    }

private:
    void load()
    {
        while (!mEntries.empty())
        {
            auto const &front = mEntries.front();
            mRemaining = front.type == tar_split_entry_type::segment
                                 ? front.payload.size()
                                 : static_cast<std::uint64_t>(front.size);
            if (mRemaining != 0U)
            {
                return;
            }
            mEntries = mEntries.subspan(1U);
        }
    }

    std::span<tar_split_entry const> mEntries;
    std::uint64_t mRemaining{0U};
};

auto crc_payload(std::uint64_t checksum) -> std::array<std::byte, 8>
{
    std::array<std::byte, 8> payload;
    boost::endian::store_big_u64(reinterpret_cast<unsigned char *>(
                                         payload.data()),
                                 checksum);
    return payload;
}

auto attributes_match(file_entry const &a, file_entry const &b) -> bool
{
    return a.type == b.type && a.name == b.name && a.linkname == b.linkname
           && a.mode == b.mode && a.size == b.size && a.uid == b.uid
           && a.gid == b.gid && a.devmajor == b.devmajor
           && a.devminor == b.devminor && a.xattrs == b.xattrs;
}

} // namespace

auto parse_tar_split(std::string_view data)
        -> result<std::vector<tar_split_entry>>
{
    std::vector<tar_split_entry> entries;
    while (!data.empty())
    {
        auto const eol = data.find('\n');
        auto const line = data.substr(0U, eol);
        data = eol == std::string_view::npos ? std::string_view{}
                                             : data.substr(eol + 1U);
        if (line.find_first_not_of(" \t\r") == std::string_view::npos)
        {
            continue;
        }
        CHUNKDIFF_TRY(auto &&entry, parse_tar_split_line(line));
        entries.push_back(std::move(entry));
    }
    return entries;
}

void tar_split_writer::add_segment(ro_dynblob data)
{
    boost::json::object obj;
    obj["type"] = static_cast<int>(tar_split_entry_type::segment);
    obj["payload"] = encode_base64(data);
    obj["position"] = mPosition++;
    mData += boost::json::serialize(obj);
    mData += '\n';
}

void tar_split_writer::add_file(std::string_view name,
                                std::int64_t size,
                                std::uint64_t checksum)
{
    auto const payload = crc_payload(checksum);
    boost::json::object obj;
    obj["type"] = static_cast<int>(tar_split_entry_type::file);
    obj["name"] = name;
    obj["size"] = size;
    obj["payload"] = encode_base64(payload);
    obj["position"] = mPosition++;
    mData += boost::json::serialize(obj);
    mData += '\n';
}

auto tar_size_from_tar_split(std::span<tar_split_entry const> entries)
        -> std::int64_t
{
    std::int64_t size = 0;
    for (auto const &entry : entries)
    {
        size += entry.type == tar_split_entry_type::segment
                        ? static_cast<std::int64_t>(entry.payload.size())
                        : entry.size;
    }
    return size;
}

auto staged_file_getter::get(std::string_view name) -> result<unique_fd>
{
    std::string path(name);
    if (mNameMap != nullptr)
    {
        auto const it = mNameMap->find(utils::clean_path(name));
        if (it == mNameMap->end())
        {
            SPDLOG_ERROR("no path mapping exists for tar entry {}", name);
            return errc::no_such_file_or_directory;
        }
        path = it->second;
    }
    return open_file_under_root(mRootFd, path, O_RDONLY | O_CLOEXEC, 0);
}

auto write_output_tar_stream(std::span<tar_split_entry const> entries,
                             file_getter &files,
                             digester &out) -> result<void>
{
    std::array<std::byte, 1 << 16> buffer;
    std::set<std::string, std::less<>> seen;
    for (auto const &entry : entries)
    {
        if (entry.type == tar_split_entry_type::segment)
        {
            CHUNKDIFF_TRY(out.update(entry.payload));
            continue;
        }
        if (!seen.insert(utils::clean_path(entry.name)).second)
        {
            SPDLOG_ERROR("duplicate entry {} in the tar-split", entry.name);
            return chunked_errc::tar_split_mismatch;
        }
        if (entry.size == 0)
        {
            continue;
        }

        CHUNKDIFF_TRY(auto &&file, files.get(entry.name));
        tar_split_crc crc;
        for (;;)
        {
            auto const n = ::read(file.get(), buffer.data(), buffer.size());
            if (n < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return collect_system_error();
            }
            if (n == 0)
            {
                break;
            }
            auto const data
                    = ro_dynblob(buffer).first(static_cast<std::size_t>(n));
            crc.process_bytes(data.data(), data.size());
            CHUNKDIFF_TRY(out.update(data));
        }

        auto const expected = crc_payload(crc.checksum());
        if (!std::equal(expected.begin(), expected.end(),
                        entry.payload.begin(), entry.payload.end()))
        {
            SPDLOG_ERROR("file integrity checksum failed for {}", entry.name);
            return chunked_errc::checksum_mismatch;
        }
    }
    return oc::success();
}

auto tar_split_headers(std::span<tar_split_entry const> entries)
        -> result<std::vector<file_entry>>
{
    header_only_stream stream(entries);
    tar_reader reader(stream);

    std::vector<file_entry> headers;
    for (;;)
    {
        CHUNKDIFF_TRY(auto &&member, reader.next());
        if (!member)
        {
            return headers;
        }
        headers.push_back(to_file_entry(member->header));
    }
}

auto ensure_toc_matches_tar_split(toc const &manifest,
                                  std::span<tar_split_entry const> entries)
        -> result<void>
{
    std::map<std::string_view, file_entry const *> pending;
    for (auto const &entry : manifest.entries)
    {
        if (entry.type == entry_type::chunk)
        {
            continue;
        }
        if (!pending.emplace(entry.name, &entry).second)
        {
            SPDLOG_ERROR("TOC contains duplicate entries for path {}",
                         entry.name);
            return chunked_errc::tar_split_mismatch;
        }
    }

    CHUNKDIFF_TRY(auto &&headers, tar_split_headers(entries));
    for (auto const &header : headers)
    {
        auto const it = pending.find(header.name);
        if (it == pending.end())
        {
            SPDLOG_ERROR("tar-split contains an entry for {} missing in TOC",
                         header.name);
            return chunked_errc::tar_split_mismatch;
        }
        if (!attributes_match(*it->second, header))
        {
            SPDLOG_ERROR("TOC and tar-split metadata of {} don't match",
                         header.name);
            return chunked_errc::tar_split_mismatch;
        }
        pending.erase(it);
    }
    if (!pending.empty())
    {
        SPDLOG_ERROR("TOC contains entries not present in tar-split, incl. {}",
                     pending.begin()->first);
        return chunked_errc::tar_split_mismatch;
    }
    return oc::success();
}

} // namespace chunkdiff::detail
