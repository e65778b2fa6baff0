#include "tar_reader.hpp"

#include <algorithm>
#include <charconv>

#include <chunkdiff/digest.hpp>
#include <chunkdiff/utils/misc.hpp>

namespace chunkdiff::detail
{

namespace
{

constexpr std::int64_t max_extension_size = 1 << 20;

struct field
{
    std::size_t offset;
    std::size_t size;
};

constexpr field name_field{0U, 100U};
constexpr field mode_field{100U, 8U};
constexpr field uid_field{108U, 8U};
constexpr field gid_field{116U, 8U};
constexpr field size_field{124U, 12U};
constexpr field mtime_field{136U, 12U};
constexpr field checksum_field{148U, 8U};
constexpr std::size_t typeflag_offset = 156U;
constexpr field linkname_field{157U, 100U};
constexpr field magic_field{257U, 8U};
constexpr field devmajor_field{329U, 8U};
constexpr field devminor_field{337U, 8U};
constexpr field prefix_field{345U, 155U};
constexpr field gnu_atime_field{345U, 12U};
constexpr field gnu_ctime_field{357U, 12U};

template <std::size_t N>
auto slice(std::array<std::byte, N> const &block, field f) -> std::string_view
{
    return as_string_view(ro_dynblob(block).subspan(f.offset, f.size));
}

auto parse_string(std::string_view raw) -> std::string
{
    return std::string(raw.substr(0U, raw.find('\0')));
}

auto parse_numeric(std::string_view raw) -> result<std::int64_t>
{
    if (!raw.empty() && (static_cast<unsigned char>(raw[0]) & 0x80U) != 0U)
    {
        // base-256 encoding, negative values are not supported
        if (static_cast<unsigned char>(raw[0]) == 0xffU)
        {
            return chunked_errc::invalid_tar_header;
        }
        std::uint64_t value = static_cast<unsigned char>(raw[0]) & 0x7fU;
        for (auto c : raw.substr(1U))
        {
            if ((value >> 55U) != 0U)
            {
                return chunked_errc::invalid_tar_header;
            }
            value = (value << 8U) | static_cast<unsigned char>(c);
        }
        return static_cast<std::int64_t>(value);
    }

    auto const begin = raw.find_first_not_of(std::string_view(" \0", 2U));
    if (begin == std::string_view::npos)
    {
        return 0;
    }
    raw = raw.substr(begin);
    raw = raw.substr(0U, raw.find_first_of(std::string_view(" \0", 2U)));

    std::int64_t value = 0;
    auto const [end, ec]
            = std::from_chars(raw.data(), raw.data() + raw.size(), value, 8);
    if (ec != std::errc{} || end != raw.data() + raw.size())
    {
        return chunked_errc::invalid_tar_header;
    }
    return value;
}

auto parse_decimal(std::string_view raw) -> result<std::int64_t>
{
    std::int64_t value = 0;
    auto const [end, ec]
            = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || end != raw.data() + raw.size())
    {
        return chunked_errc::invalid_tar_header;
    }
    return value;
}

auto from_seconds(std::int64_t seconds) -> file_time
{
    return file_time{std::chrono::seconds{seconds}};
}

// "<seconds>[.<fraction>]"
auto parse_pax_time(std::string_view raw) -> result<file_time>
{
    auto const dot = raw.find('.');
    CHUNKDIFF_TRY(auto &&seconds, parse_decimal(raw.substr(0U, dot)));
    std::int64_t nanos = 0;
    if (dot != std::string_view::npos)
    {
        auto fraction = raw.substr(dot + 1U, 9U);
        if (fraction.empty())
        {
            return chunked_errc::invalid_tar_header;
        }
        CHUNKDIFF_TRY(nanos, parse_decimal(fraction));
        for (auto i = fraction.size(); i < 9U; ++i)
        {
            nanos *= 10;
        }
        if (seconds < 0 || raw.starts_with('-'))
        {
            nanos = -nanos;
        }
    }
    return from_seconds(seconds) + std::chrono::nanoseconds{nanos};
}

auto parse_pax_records(std::string_view data,
                       std::map<std::string, std::string> &records)
        -> result<void>
{
    while (!data.empty())
    {
        auto const space = data.find(' ');
        if (space == std::string_view::npos)
        {
            return chunked_errc::invalid_tar_header;
        }
        CHUNKDIFF_TRY(auto &&length, parse_decimal(data.substr(0U, space)));
        if (length <= static_cast<std::int64_t>(space) + 1
            || static_cast<std::uint64_t>(length) > data.size()
            || data[static_cast<std::size_t>(length) - 1U] != '\n')
        {
            return chunked_errc::invalid_tar_header;
        }
        auto const record = data.substr(
                space + 1U, static_cast<std::size_t>(length) - space - 2U);
        auto const eq = record.find('=');
        if (eq == std::string_view::npos || eq == 0U)
        {
            return chunked_errc::invalid_tar_header;
        }
        records.insert_or_assign(std::string(record.substr(0U, eq)),
                                 std::string(record.substr(eq + 1U)));
        data = data.substr(static_cast<std::size_t>(length));
    }
    return oc::success();
}

auto verify_checksum(std::array<std::byte, tar_block_size> const &block)
        -> result<void>
{
    CHUNKDIFF_TRY(auto &&expected, parse_numeric(slice(block, checksum_field)));

    std::int64_t unsignedSum = 0;
    std::int64_t signedSum = 0;
    for (std::size_t i = 0U; i < block.size(); ++i)
    {
        auto const isChecksum = i >= checksum_field.offset
                                && i < checksum_field.offset
                                                + checksum_field.size;
        auto const b = isChecksum ? std::byte{' '} : block[i];
        unsignedSum += std::to_integer<unsigned char>(b);
        signedSum += static_cast<signed char>(std::to_integer<unsigned char>(b));
    }
    if (expected != unsignedSum && expected != signedSum)
    {
        return chunked_errc::invalid_tar_header;
    }
    return oc::success();
}

auto to_entry_type(char typeflag) -> result<entry_type>
{
    switch (typeflag)
    {
    case '0':
    case '\0':
        return entry_type::reg;
    case '1':
        return entry_type::hardlink;
    case '2':
        return entry_type::symlink;
    case '3':
        return entry_type::char_device;
    case '4':
        return entry_type::block_device;
    case '5':
        return entry_type::dir;
    case '6':
        return entry_type::fifo;
    default:
        return chunked_errc::unsupported_entry_type;
    }
}

auto is_zero_block(std::array<std::byte, tar_block_size> const &block) -> bool
{
    return std::all_of(block.begin(), block.end(),
                       [](std::byte b) { return b == std::byte{}; });
}

auto apply_pax_records(tar_header &header,
                       std::map<std::string, std::string> const &records)
        -> result<void>
{
    constexpr std::string_view xattrPrefix = "SCHILY.xattr.";
    for (auto const &[key, value] : records)
    {
        if (key == "path")
        {
            header.name = value;
        }
        else if (key == "linkpath")
        {
            header.linkname = value;
        }
        else if (key == "size")
        {
            CHUNKDIFF_TRY(header.size, parse_decimal(value));
        }
        else if (key == "uid")
        {
            CHUNKDIFF_TRY(header.uid, parse_decimal(value));
        }
        else if (key == "gid")
        {
            CHUNKDIFF_TRY(header.gid, parse_decimal(value));
        }
        else if (key == "mtime")
        {
            CHUNKDIFF_TRY(header.modtime, parse_pax_time(value));
        }
        else if (key == "atime")
        {
            CHUNKDIFF_TRY(header.accesstime, parse_pax_time(value));
        }
        else if (key == "ctime")
        {
            CHUNKDIFF_TRY(header.changetime, parse_pax_time(value));
        }
        else if (key.starts_with(xattrPrefix))
        {
            header.xattrs.insert_or_assign(key.substr(xattrPrefix.size()),
                                           value);
        }
    }
    return oc::success();
}

auto is_header_only(entry_type type) noexcept -> bool
{
    return type != entry_type::reg;
}

} // namespace

tar_reader::tar_reader(blob_stream &source) noexcept
    : mSource(source)
    , mPosition(0U)
    , mRemaining(0U)
    , mPadding(0U)
    , mDone(false)
{
}

auto tar_reader::read_block(block &out) -> result<bool>
{
    CHUNKDIFF_TRY(auto &&n, read_full(mSource, out));
    mPosition += n;
    if (n == 0U)
    {
        return false;
    }
    if (n != out.size())
    {
        return chunked_errc::invalid_tar_header;
    }
    return true;
}

auto tar_reader::skip(std::uint64_t size) -> result<void>
{
    CHUNKDIFF_TRY(discard(mSource, size));
    mPosition += size;
    return oc::success();
}

auto tar_reader::read_extension(std::int64_t size) -> result<std::string>
{
    if (size < 0 || size > max_extension_size)
    {
        return chunked_errc::invalid_tar_header;
    }
    std::string content(static_cast<std::size_t>(size), '\0');
    CHUNKDIFF_TRY(auto &&n,
                  read_full(mSource, rw_dynblob(reinterpret_cast<std::byte *>(
                                                        content.data()),
                                                content.size())));
    mPosition += n;
    if (n != content.size())
    {
        return chunked_errc::invalid_tar_header;
    }
    auto const padded = utils::round_up(static_cast<std::uint64_t>(size),
                                        tar_block_size);
    CHUNKDIFF_TRY(skip(padded - static_cast<std::uint64_t>(size)));
    return content;
}

auto tar_reader::next() -> result<std::optional<tar_member>>
{
    if (mDone)
    {
        return std::nullopt;
    }
    CHUNKDIFF_TRY(skip(mRemaining + mPadding));
    mRemaining = 0U;
    mPadding = 0U;

    auto const headerOffset = mPosition;
    std::map<std::string, std::string> paxRecords;
    std::optional<std::string> longName;
    std::optional<std::string> longLink;

    for (;;)
    {
        block raw;
        CHUNKDIFF_TRY(auto &&hasBlock, read_block(raw));
        if (!hasBlock)
        {
            mDone = true;
            return std::nullopt;
        }
        if (is_zero_block(raw))
        {
            CHUNKDIFF_TRY(auto &&hasSecond, read_block(raw));
            if (hasSecond && !is_zero_block(raw))
            {
                return chunked_errc::invalid_tar_header;
            }
            mDone = true;
            return std::nullopt;
        }
        CHUNKDIFF_TRY(verify_checksum(raw));

        auto const typeflag = static_cast<char>(
                std::to_integer<unsigned char>(raw[typeflag_offset]));
        CHUNKDIFF_TRY(auto &&size, parse_numeric(slice(raw, size_field)));

        if (typeflag == 'x' || typeflag == 'g')
        {
            CHUNKDIFF_TRY(auto &&content, read_extension(size));
            // global records aren't applied
            if (typeflag == 'x')
            {
                CHUNKDIFF_TRY(parse_pax_records(content, paxRecords));
            }
            continue;
        }
        if (typeflag == 'L' || typeflag == 'K')
        {
            CHUNKDIFF_TRY(auto &&content, read_extension(size));
            (typeflag == 'L' ? longName : longLink) = parse_string(content);
            continue;
        }

        tar_header header;
        CHUNKDIFF_TRY(header.type, to_entry_type(typeflag));
        header.size = size;
        header.name = parse_string(slice(raw, name_field));
        header.linkname = parse_string(slice(raw, linkname_field));
        CHUNKDIFF_TRY(header.mode, parse_numeric(slice(raw, mode_field)));
        CHUNKDIFF_TRY(header.uid, parse_numeric(slice(raw, uid_field)));
        CHUNKDIFF_TRY(header.gid, parse_numeric(slice(raw, gid_field)));
        CHUNKDIFF_TRY(auto &&mtime, parse_numeric(slice(raw, mtime_field)));
        header.modtime = from_seconds(mtime);

        auto const magic = slice(raw, magic_field);
        if (magic == std::string_view("ustar\0" "00", 8U))
        {
            CHUNKDIFF_TRY(header.devmajor,
                          parse_numeric(slice(raw, devmajor_field)));
            CHUNKDIFF_TRY(header.devminor,
                          parse_numeric(slice(raw, devminor_field)));
            auto prefix = parse_string(slice(raw, prefix_field));
            if (!prefix.empty())
            {
                header.name = prefix + "/" + header.name;
            }
        }
        else if (magic == std::string_view("ustar  \0", 8U))
        {
            CHUNKDIFF_TRY(header.devmajor,
                          parse_numeric(slice(raw, devmajor_field)));
            CHUNKDIFF_TRY(header.devminor,
                          parse_numeric(slice(raw, devminor_field)));
            CHUNKDIFF_TRY(auto &&atime,
                          parse_numeric(slice(raw, gnu_atime_field)));
            CHUNKDIFF_TRY(auto &&ctime,
                          parse_numeric(slice(raw, gnu_ctime_field)));
            if (atime != 0)
            {
                header.accesstime = from_seconds(atime);
            }
            if (ctime != 0)
            {
                header.changetime = from_seconds(ctime);
            }
        }

        CHUNKDIFF_TRY(apply_pax_records(header, paxRecords));
        if (longName)
        {
            header.name = std::move(*longName);
        }
        if (longLink)
        {
            header.linkname = std::move(*longLink);
        }
        if (header.size < 0)
        {
            return chunked_errc::invalid_tar_header;
        }

        auto const dataSize = is_header_only(header.type)
                                      ? 0U
                                      : static_cast<std::uint64_t>(header.size);
        mRemaining = dataSize;
        mPadding = utils::round_up(dataSize, tar_block_size) - dataSize;
        return tar_member{std::move(header), headerOffset, mPosition};
    }
}

auto tar_reader::read(rw_dynblob buffer) -> result<std::size_t>
{
    auto const n = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), mRemaining));
    if (n == 0U)
    {
        return 0U;
    }
    CHUNKDIFF_TRY(auto &&readBytes, mSource.read_some(buffer.first(n)));
    if (readBytes == 0U)
    {
        return chunked_errc::not_enough_data;
    }
    mRemaining -= readBytes;
    mPosition += readBytes;
    return readBytes;
}

auto to_file_entry(tar_header const &header) -> file_entry
{
    file_entry entry;
    entry.type = header.type;
    entry.name = header.name;
    entry.linkname = header.linkname;
    entry.mode = header.mode;
    entry.size = header.size;
    entry.uid = header.uid;
    entry.gid = header.gid;
    entry.modtime = header.modtime;
    entry.accesstime = header.accesstime;
    entry.changetime = header.changetime;
    entry.devmajor = header.devmajor;
    entry.devminor = header.devminor;
    for (auto const &[name, value] : header.xattrs)
    {
        entry.xattrs.emplace(name, encode_base64(as_bytes(value)));
    }
    return entry;
}

} // namespace chunkdiff::detail
