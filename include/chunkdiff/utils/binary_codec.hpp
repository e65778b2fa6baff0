#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <optional>
#include <type_traits>
#include <vector>

#include <boost/endian/conversion.hpp>

#include <chunkdiff/span.hpp>

namespace chunkdiff
{
template <typename T>
    requires std::is_integral_v<T>
inline auto load_primitive(ro_dynblob memory, std::size_t offset = 0) noexcept
        -> T
{
    T stored;
    std::memcpy(&stored, memory.data() + offset, sizeof(T));
    return boost::endian::little_to_native(stored);
}

template <typename T>
    requires std::is_integral_v<T>
inline void
store_primitive(rw_dynblob memory, T value, std::size_t offset = 0) noexcept
{
    auto stored = boost::endian::native_to_little(value);
    std::memcpy(memory.data() + offset, &stored, sizeof(T));
}
} // namespace chunkdiff

namespace chunkdiff::utils
{

/**
 * @brief Appends little endian primitives and LEB128 varints to a growing
 * byte buffer.
 */
class binary_writer final
{
public:
    binary_writer() = default;

    template <typename T>
        requires std::is_integral_v<T>
    void write(T value)
    {
        auto const offset = mBuffer.size();
        mBuffer.resize(offset + sizeof(T));
        store_primitive(rw_dynblob(mBuffer), value, offset);
    }

    void write_varint(std::uint64_t value)
    {
        while (value >= 0x80u)
        {
            mBuffer.push_back(static_cast<std::byte>(value | 0x80u));
            value >>= 7;
        }
        mBuffer.push_back(static_cast<std::byte>(value));
    }

    void write_bytes(ro_dynblob bytes)
    {
        mBuffer.insert(mBuffer.end(), bytes.begin(), bytes.end());
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return mBuffer.size();
    }
    [[nodiscard]] auto release() noexcept -> std::vector<std::byte>
    {
        return std::move(mBuffer);
    }

private:
    std::vector<std::byte> mBuffer;
};

/**
 * @brief Bounds checked cursor over a byte view.
 *
 * Every read returns an empty optional if the view is exhausted.
 */
class binary_reader final
{
public:
    explicit binary_reader(ro_dynblob data) noexcept
        : mData(data)
    {
    }

    template <typename T>
        requires std::is_integral_v<T>
    auto read() noexcept -> std::optional<T>
    {
        if (mData.size() < sizeof(T))
        {
            return std::nullopt;
        }
        auto const value = load_primitive<T>(mData);
        mData = mData.subspan(sizeof(T));
        return value;
    }

    auto read_varint() noexcept -> std::optional<std::uint64_t>
    {
        std::uint64_t value = 0;
        for (unsigned shift = 0; shift < 64; shift += 7)
        {
            if (mData.empty())
            {
                return std::nullopt;
            }
            auto const byte = std::to_integer<std::uint64_t>(mData.front());
            mData = mData.subspan(1);
            if (shift == 63 && byte > 1)
            {
                return std::nullopt;
            }
            value |= (byte & 0x7fu) << shift;
            if ((byte & 0x80u) == 0)
            {
                return value;
            }
        }
        return std::nullopt;
    }

    auto read_bytes(std::size_t n) noexcept -> std::optional<ro_dynblob>
    {
        if (mData.size() < n)
        {
            return std::nullopt;
        }
        auto const bytes = mData.first(n);
        mData = mData.subspan(n);
        return bytes;
    }

    [[nodiscard]] auto remaining() const noexcept -> std::size_t
    {
        return mData.size();
    }

private:
    ro_dynblob mData;
};

} // namespace chunkdiff::utils
