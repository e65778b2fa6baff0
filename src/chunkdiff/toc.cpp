#include <chunkdiff/toc.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <limits>
#include <locale>
#include <set>

// the Boost.JSON implementation is compiled into this translation unit
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/json/src.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chunkdiff/digest.hpp>
#include <chunkdiff/utils/path.hpp>

namespace chunkdiff
{

namespace
{

constexpr std::array<std::string_view, 8> entry_type_names{
        "reg", "chunk", "hardlink", "symlink",
        "dir", "char",  "block",    "fifo",
};

constexpr std::array<std::string_view, 3> estargz_metadata_files{
        ".prefetch.landmark",
        ".no.prefetch.landmark",
        "stargz.index.json",
};

template <typename T>
auto assign_to(T &target, result<T> rx) -> result<void>
{
    if (rx.has_error())
    {
        return std::move(rx).assume_error();
    }
    target = std::move(rx).assume_value();
    return oc::success();
}

auto as_int64(boost::json::value const &value) -> result<std::int64_t>
{
    switch (value.kind())
    {
    case boost::json::kind::int64:
        return value.get_int64();
    case boost::json::kind::uint64:
        if (value.get_uint64()
            > static_cast<std::uint64_t>(
                    std::numeric_limits<std::int64_t>::max()))
        {
            return chunked_errc::invalid_manifest;
        }
        return static_cast<std::int64_t>(value.get_uint64());
    case boost::json::kind::null:
        return 0;
    default:
        return chunked_errc::invalid_manifest;
    }
}

auto as_string(boost::json::value const &value) -> result<std::string>
{
    if (value.is_null())
    {
        return std::string{};
    }
    if (!value.is_string())
    {
        return chunked_errc::invalid_manifest;
    }
    auto const &str = value.get_string();
    return std::string(str.data(), str.size());
}

auto as_time(boost::json::value const &value) -> result<std::optional<file_time>>
{
    if (value.is_null())
    {
        return std::optional<file_time>{};
    }
    if (!value.is_string())
    {
        return chunked_errc::invalid_manifest;
    }
    auto const &str = value.get_string();
    CHUNKDIFF_TRY(auto &&parsed,
                  parse_file_time(std::string_view(str.data(), str.size())));
    return std::optional<file_time>{parsed};
}

auto parse_entry(boost::json::object const &object) -> result<file_entry>
{
    file_entry entry;
    std::string typeName;
    for (auto const &[rawKey, value] : object)
    {
        auto const key = boost::algorithm::to_lower_copy(
                std::string(rawKey.data(), rawKey.size()),
                std::locale::classic());
        if (key == "type")
        {
            CHUNKDIFF_TRY(assign_to(typeName, as_string(value)));
        }
        else if (key == "name")
        {
            CHUNKDIFF_TRY(assign_to(entry.name, as_string(value)));
        }
        else if (key == "linkname")
        {
            CHUNKDIFF_TRY(assign_to(entry.linkname, as_string(value)));
        }
        else if (key == "mode")
        {
            CHUNKDIFF_TRY(assign_to(entry.mode, as_int64(value)));
        }
        else if (key == "size")
        {
            CHUNKDIFF_TRY(assign_to(entry.size, as_int64(value)));
        }
        else if (key == "uid")
        {
            CHUNKDIFF_TRY(assign_to(entry.uid, as_int64(value)));
        }
        else if (key == "gid")
        {
            CHUNKDIFF_TRY(assign_to(entry.gid, as_int64(value)));
        }
        else if (key == "modtime")
        {
            CHUNKDIFF_TRY(assign_to(entry.modtime, as_time(value)));
        }
        else if (key == "accesstime")
        {
            CHUNKDIFF_TRY(assign_to(entry.accesstime, as_time(value)));
        }
        else if (key == "changetime")
        {
            CHUNKDIFF_TRY(assign_to(entry.changetime, as_time(value)));
        }
        else if (key == "devmajor")
        {
            CHUNKDIFF_TRY(assign_to(entry.devmajor, as_int64(value)));
        }
        else if (key == "devminor")
        {
            CHUNKDIFF_TRY(assign_to(entry.devminor, as_int64(value)));
        }
        else if (key == "digest")
        {
            CHUNKDIFF_TRY(assign_to(entry.digest, as_string(value)));
        }
        else if (key == "offset")
        {
            CHUNKDIFF_TRY(assign_to(entry.offset, as_int64(value)));
        }
        else if (key == "endoffset")
        {
            CHUNKDIFF_TRY(assign_to(entry.end_offset, as_int64(value)));
        }
        else if (key == "chunksize")
        {
            CHUNKDIFF_TRY(assign_to(entry.chunk_size, as_int64(value)));
        }
        else if (key == "chunkoffset")
        {
            CHUNKDIFF_TRY(assign_to(entry.chunk_offset, as_int64(value)));
        }
        else if (key == "chunkdigest")
        {
            CHUNKDIFF_TRY(assign_to(entry.chunk_digest, as_string(value)));
        }
        else if (key == "chunktype")
        {
            CHUNKDIFF_TRY(auto &&chunkType, as_string(value));
            if (chunkType.empty())
            {
                entry.chunk_type = chunk_kind::data;
            }
            else if (chunkType == "zeros")
            {
                entry.chunk_type = chunk_kind::zeros;
            }
            else
            {
                return chunked_errc::invalid_manifest;
            }
        }
        else if (key == "xattrs")
        {
            if (value.is_null())
            {
                continue;
            }
            if (!value.is_object())
            {
                return chunked_errc::invalid_manifest;
            }
            for (auto const &[xattrName, xattrValue] : value.get_object())
            {
                CHUNKDIFF_TRY(auto &&encoded, as_string(xattrValue));
                entry.xattrs.insert_or_assign(
                        std::string(xattrName.data(), xattrName.size()),
                        std::move(encoded));
            }
        }
    }

    CHUNKDIFF_TRY(assign_to(entry.type, parse_entry_type(typeName)));
    if (entry.type == entry_type::reg && entry.size == 0
        && entry.digest.empty())
    {
        entry.digest = std::string(empty_sha256_digest);
    }
    return entry;
}

void put_time(boost::json::object &object,
              std::string_view key,
              std::optional<file_time> const &time)
{
    if (time)
    {
        object[key] = format_file_time(*time);
    }
}

template <typename T>
auto parse_decimal(std::string_view text, T &value) noexcept -> bool
{
    auto const *const end = text.data() + text.size();
    auto const [ptr, ec] = std::from_chars(text.data(), end, value);
    return ec == std::errc{} && ptr == end;
}

} // namespace

auto to_string(entry_type type) noexcept -> std::string_view
{
    return entry_type_names[static_cast<std::size_t>(type)];
}

auto parse_entry_type(std::string_view name) -> result<entry_type>
{
    auto const it = std::ranges::find(entry_type_names, name);
    if (it == entry_type_names.end())
    {
        SPDLOG_DEBUG("unknown table of contents entry type \"{}\"", name);
        return chunked_errc::unsupported_entry_type;
    }
    return static_cast<entry_type>(it - entry_type_names.begin());
}

auto parse_toc(std::string_view manifest) -> result<toc>
{
    boost::json::error_code ec;
    boost::json::value const document = boost::json::parse(manifest, ec);
    if (ec)
    {
        SPDLOG_DEBUG("failed to parse the table of contents: {}",
                     ec.message());
        return chunked_errc::invalid_manifest;
    }
    if (!document.is_object())
    {
        return chunked_errc::invalid_manifest;
    }

    toc parsed;
    for (auto const &[rawKey, value] : document.get_object())
    {
        auto const key = boost::algorithm::to_lower_copy(
                std::string(rawKey.data(), rawKey.size()),
                std::locale::classic());
        if (key == "version")
        {
            CHUNKDIFF_TRY(auto &&version, as_int64(value));
            parsed.version = static_cast<int>(version);
        }
        else if (key == "entries")
        {
            if (value.is_null())
            {
                continue;
            }
            if (!value.is_array())
            {
                return chunked_errc::invalid_manifest;
            }
            auto const &entries = value.get_array();
            parsed.entries.reserve(entries.size());
            for (auto const &entry : entries)
            {
                if (!entry.is_object())
                {
                    return chunked_errc::invalid_manifest;
                }
                CHUNKDIFF_TRY(auto &&decoded, parse_entry(entry.get_object()));
                parsed.entries.push_back(std::move(decoded));
            }
        }
        else if (key == "tarsplitdigest")
        {
            CHUNKDIFF_TRY(assign_to(parsed.tar_split_digest, as_string(value)));
            if (!parsed.tar_split_digest.empty())
            {
                CHUNKDIFF_TRY(parse_digest(parsed.tar_split_digest));
            }
        }
    }
    return parsed;
}

auto serialize_toc(toc const &value) -> std::string
{
    boost::json::array entries;
    entries.reserve(value.entries.size());
    for (auto const &entry : value.entries)
    {
        boost::json::object object;
        object["type"] = to_string(entry.type);
        object["name"] = entry.name;
        if (!entry.linkname.empty())
        {
            object["linkName"] = entry.linkname;
        }
        if (entry.mode != 0)
        {
            object["mode"] = entry.mode;
        }
        if (entry.size != 0)
        {
            object["size"] = entry.size;
        }
        if (entry.uid != 0)
        {
            object["uid"] = entry.uid;
        }
        if (entry.gid != 0)
        {
            object["gid"] = entry.gid;
        }
        put_time(object, "modtime", entry.modtime);
        put_time(object, "accesstime", entry.accesstime);
        put_time(object, "changetime", entry.changetime);
        if (entry.devmajor != 0)
        {
            object["devMajor"] = entry.devmajor;
        }
        if (entry.devminor != 0)
        {
            object["devMinor"] = entry.devminor;
        }
        if (!entry.xattrs.empty())
        {
            boost::json::object xattrs;
            for (auto const &[name, encoded] : entry.xattrs)
            {
                xattrs[name] = encoded;
            }
            object["xattrs"] = std::move(xattrs);
        }
        if (!entry.digest.empty())
        {
            object["digest"] = entry.digest;
        }
        if (entry.offset != 0)
        {
            object["offset"] = entry.offset;
        }
        if (entry.end_offset != 0)
        {
            object["endOffset"] = entry.end_offset;
        }
        if (entry.chunk_size != 0)
        {
            object["chunkSize"] = entry.chunk_size;
        }
        if (entry.chunk_offset != 0)
        {
            object["chunkOffset"] = entry.chunk_offset;
        }
        if (!entry.chunk_digest.empty())
        {
            object["chunkDigest"] = entry.chunk_digest;
        }
        if (entry.chunk_type == chunk_kind::zeros)
        {
            object["chunkType"] = "zeros";
        }
        entries.push_back(std::move(object));
    }

    boost::json::object document;
    document["version"] = value.version;
    document["entries"] = std::move(entries);
    if (!value.tar_split_digest.empty())
    {
        document["tarSplitDigest"] = value.tar_split_digest;
    }
    return boost::json::serialize(document);
}

auto merge_entries(compressed_file_type fileType,
                   std::int64_t tocOffset,
                   std::span<file_entry const> entries)
        -> result<std::vector<file_metadata>>
{
    auto const mustSkip = [fileType](file_entry const &entry) {
        return fileType == compressed_file_type::estargz
               && std::ranges::find(estargz_metadata_files, entry.name)
                          != estargz_metadata_files.end();
    };

    std::vector<file_metadata> merged;
    merged.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        if (mustSkip(entries[i]))
        {
            continue;
        }
        if (entries[i].type == entry_type::chunk)
        {
            SPDLOG_DEBUG("chunk record \"{}\" without a regular file",
                         entries[i].name);
            return chunked_errc::invalid_manifest;
        }

        file_metadata &file = merged.emplace_back(entries[i]);
        if (file.type != entry_type::reg)
        {
            continue;
        }

        std::size_t numChunks = 0;
        while (i + 1 + numChunks < entries.size()
               && entries[i + 1 + numChunks].type == entry_type::chunk)
        {
            ++numChunks;
        }

        file.chunks.reserve(numChunks + 1);
        for (std::size_t j = 0; j <= numChunks; ++j)
        {
            file.chunks.push_back(entries[i + j]);
            file.end_offset = entries[i + j].end_offset;
        }
        i += numChunks;
    }

    // estargz doesn't store the end offsets, they are recovered from the
    // start of the following entry
    auto lastOffset = tocOffset;
    for (auto it = merged.rbegin(); it != merged.rend(); ++it)
    {
        if (it->end_offset == 0)
        {
            it->end_offset = lastOffset;
        }
        if (it->offset != 0)
        {
            lastOffset = it->offset;
        }

        auto lastChunkOffset = it->end_offset;
        for (auto chunk = it->chunks.rbegin(); chunk != it->chunks.rend();
             ++chunk)
        {
            chunk->end_offset = lastChunkOffset;
            chunk->size = chunk->end_offset - chunk->offset;
            lastChunkOffset = chunk->offset;
        }
    }
    return merged;
}

auto flat_path_for_digest(std::string_view digest) -> result<std::string>
{
    CHUNKDIFF_TRY(auto &&parsed, parse_digest(digest));
    return fmt::format("{}/{}", parsed.encoded.substr(0, 2),
                       parsed.encoded.substr(2));
}

auto make_entries_flat(std::vector<file_metadata> entries,
                       std::map<std::string, std::string> *nameMap)
        -> result<std::vector<file_metadata>>
{
    std::vector<file_metadata> flat;
    std::set<std::string> knownPaths;
    for (auto &entry : entries)
    {
        if (entry.type != entry_type::reg)
        {
            continue;
        }
        if (entry.digest.empty())
        {
            SPDLOG_DEBUG("missing digest for \"{}\"", entry.name);
            return chunked_errc::invalid_manifest;
        }
        CHUNKDIFF_TRY(auto &&path, flat_path_for_digest(entry.digest));
        if (nameMap != nullptr)
        {
            nameMap->insert_or_assign(utils::clean_path(entry.name), path);
        }
        if (!knownPaths.insert(path).second)
        {
            continue;
        }

        entry.name = std::move(path);
        entry.skip_set_attrs = true;
        flat.push_back(std::move(entry));
    }
    return flat;
}

auto hard_link_fingerprint(file_entry const &entry) -> result<std::string>
{
    CHUNKDIFF_TRY(auto &&hasher, digester::create(digest_algorithm::sha256));
    CHUNKDIFF_TRY(hasher.update(std::string_view(entry.digest)));
    CHUNKDIFF_TRY(hasher.update(
            fmt::format("{}:{}:{:o}", entry.uid, entry.gid, entry.mode)));

    // std::map iterates the xattrs in sorted key order
    for (auto const &[name, encoded] : entry.xattrs)
    {
        CHUNKDIFF_TRY(hasher.update(std::string_view(name)));
        CHUNKDIFF_TRY(hasher.update(std::string_view(encoded)));
    }
    return hasher.finish();
}

auto format_file_time(file_time time) -> std::string
{
    using namespace std::chrono;

    auto const midnight = floor<std::chrono::days>(time);
    year_month_day const date{midnight};
    hh_mm_ss<nanoseconds> const tod{time - midnight};

    auto text = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                            static_cast<int>(date.year()),
                            static_cast<unsigned>(date.month()),
                            static_cast<unsigned>(date.day()),
                            tod.hours().count(), tod.minutes().count(),
                            tod.seconds().count());
    if (auto const nanos = tod.subseconds().count(); nanos != 0)
    {
        auto fraction = fmt::format("{:09}", nanos);
        fraction.erase(fraction.find_last_not_of('0') + 1);
        text.push_back('.');
        text.append(fraction);
    }
    text.push_back('Z');
    return text;
}

auto parse_file_time(std::string_view text) -> result<file_time>
{
    using namespace std::chrono;

    // YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)
    constexpr std::size_t minimumSize = 20;
    if (text.size() < minimumSize || text[4] != '-' || text[7] != '-'
        || text[10] != 'T' || text[13] != ':' || text[16] != ':')
    {
        return chunked_errc::invalid_manifest;
    }

    int yearValue = 0;
    unsigned monthValue = 0;
    unsigned dayValue = 0;
    int hourValue = 0;
    int minuteValue = 0;
    int secondValue = 0;
    if (!parse_decimal(text.substr(0, 4), yearValue)
        || !parse_decimal(text.substr(5, 2), monthValue)
        || !parse_decimal(text.substr(8, 2), dayValue)
        || !parse_decimal(text.substr(11, 2), hourValue)
        || !parse_decimal(text.substr(14, 2), minuteValue)
        || !parse_decimal(text.substr(17, 2), secondValue))
    {
        return chunked_errc::invalid_manifest;
    }

    year_month_day const date{year{yearValue}, month{monthValue},
                              day{dayValue}};
    if (!date.ok() || hourValue > 23 || minuteValue > 59 || secondValue > 59)
    {
        return chunked_errc::invalid_manifest;
    }

    auto rest = text.substr(19);
    nanoseconds fraction{0};
    if (!rest.empty() && rest.front() == '.')
    {
        rest.remove_prefix(1);
        std::size_t digits = 0;
        std::int64_t scaled = 0;
        while (digits < rest.size() && rest[digits] >= '0'
               && rest[digits] <= '9')
        {
            if (digits < 9)
            {
                scaled = scaled * 10 + (rest[digits] - '0');
            }
            ++digits;
        }
        if (digits == 0)
        {
            return chunked_errc::invalid_manifest;
        }
        for (auto i = digits; i < 9; ++i)
        {
            scaled *= 10;
        }
        fraction = nanoseconds{scaled};
        rest.remove_prefix(digits);
    }

    minutes zoneOffset{0};
    if (rest != "Z")
    {
        if (rest.size() != 6 || (rest[0] != '+' && rest[0] != '-')
            || rest[3] != ':')
        {
            return chunked_errc::invalid_manifest;
        }
        int zoneHours = 0;
        int zoneMinutes = 0;
        if (!parse_decimal(rest.substr(1, 2), zoneHours)
            || !parse_decimal(rest.substr(4, 2), zoneMinutes)
            || zoneHours > 23 || zoneMinutes > 59)
        {
            return chunked_errc::invalid_manifest;
        }
        zoneOffset = hours{zoneHours} + minutes{zoneMinutes};
        if (rest[0] == '-')
        {
            zoneOffset = -zoneOffset;
        }
    }

    return file_time{sys_days{date} + hours{hourValue} + minutes{minuteValue}
                     + seconds{secondValue} + fraction - zoneOffset};
}

auto serialize_layer_data(output_format format) -> std::string
{
    boost::json::object data;
    data["format"] = to_string(format);
    return boost::json::serialize(data);
}

auto parse_layer_data(std::string_view json) -> result<output_format>
{
    boost::json::error_code ec;
    boost::json::value const document = boost::json::parse(json, ec);
    if (ec || !document.is_object())
    {
        return chunked_errc::invalid_manifest;
    }
    auto const *format = document.get_object().if_contains("format");
    if (format == nullptr || format->is_null())
    {
        return output_format::dir;
    }
    CHUNKDIFF_TRY(auto &&name, as_string(*format));
    if (name.empty() || name == to_string(output_format::dir))
    {
        return output_format::dir;
    }
    if (name == to_string(output_format::flat))
    {
        return output_format::flat;
    }
    return chunked_errc::unsupported_format;
}

} // namespace chunkdiff
