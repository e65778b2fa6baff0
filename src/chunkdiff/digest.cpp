#include <chunkdiff/digest.hpp>

#include <array>

#include <boost/algorithm/hex.hpp>

#include <openssl/err.h>

namespace chunkdiff
{

namespace
{

struct algorithm_info
{
    digest_algorithm algorithm;
    std::string_view name;
    std::size_t size;
};

constexpr std::array<algorithm_info, 3> known_algorithms{{
        {digest_algorithm::sha256, "sha256", 32},
        {digest_algorithm::sha384, "sha384", 48},
        {digest_algorithm::sha512, "sha512", 64},
}};

constexpr auto info_of(digest_algorithm algorithm) noexcept
        -> algorithm_info const &
{
    return known_algorithms[static_cast<std::size_t>(algorithm)];
}

auto evp_md_of(digest_algorithm algorithm) noexcept -> EVP_MD const *
{
    switch (algorithm)
    {
    case digest_algorithm::sha384:
        return EVP_sha384();
    case digest_algorithm::sha512:
        return EVP_sha512();
    case digest_algorithm::sha256:
    default:
        return EVP_sha256();
    }
}

constexpr auto is_lower_hex(char c) noexcept -> bool
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

auto parse_digest(std::string_view digest) -> result<parsed_digest>
{
    auto const sep = digest.find(':');
    if (sep == std::string_view::npos)
    {
        return chunked_errc::invalid_digest;
    }
    auto const algorithmName = digest.substr(0, sep);
    auto const encoded = digest.substr(sep + 1);

    for (auto const &info : known_algorithms)
    {
        if (info.name != algorithmName)
        {
            continue;
        }
        if (encoded.size() != info.size * 2)
        {
            return chunked_errc::invalid_digest;
        }
        for (char c : encoded)
        {
            if (!is_lower_hex(c))
            {
                return chunked_errc::invalid_digest;
            }
        }
        return parsed_digest{info.algorithm, info.name, encoded};
    }
    return chunked_errc::invalid_digest;
}

auto make_binary_digest(std::string_view digest)
        -> result<std::vector<std::byte>>
{
    CHUNKDIFF_TRY(auto &&parsed, parse_digest(digest));

    std::vector<std::byte> binary;
    binary.reserve(parsed.algorithm_name.size() + 1
                   + parsed.encoded.size() / 2);
    auto const prefix = as_bytes(parsed.algorithm_name);
    binary.insert(binary.end(), prefix.begin(), prefix.end());
    binary.push_back(std::byte{':'});

    std::string raw;
    raw.reserve(parsed.encoded.size() / 2);
    boost::algorithm::unhex(parsed.encoded.begin(), parsed.encoded.end(),
                            std::back_inserter(raw));
    auto const rawBytes = as_bytes(raw);
    binary.insert(binary.end(), rawBytes.begin(), rawBytes.end());
    return binary;
}

void digester::ctx_deleter::operator()(EVP_MD_CTX *ctx) const noexcept
{
    EVP_MD_CTX_free(ctx);
}

digester::digester(digest_algorithm algorithm,
                   std::unique_ptr<EVP_MD_CTX, ctx_deleter> ctx) noexcept
    : mAlgorithm(algorithm)
    , mCtx(std::move(ctx))
{
}

auto digester::create(digest_algorithm algorithm) -> result<digester>
{
    ERR_clear_error();

    std::unique_ptr<EVP_MD_CTX, ctx_deleter> ctx{EVP_MD_CTX_new()};
    if (!ctx)
    {
        return errc::not_enough_memory;
    }
    if (EVP_DigestInit_ex(ctx.get(), evp_md_of(algorithm), nullptr) != 1)
    {
        return errc::io_error;
    }
    return digester(algorithm, std::move(ctx));
}

auto digester::create(std::string_view digest) -> result<digester>
{
    CHUNKDIFF_TRY(auto &&parsed, parse_digest(digest));
    return create(parsed.algorithm);
}

auto digester::update(ro_dynblob data) -> result<void>
{
    if (data.empty())
    {
        return oc::success();
    }
    if (EVP_DigestUpdate(mCtx.get(), data.data(), data.size()) != 1)
    {
        return errc::io_error;
    }
    return oc::success();
}

auto digester::finish() -> result<std::string>
{
    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hashSize = 0;
    if (EVP_DigestFinal_ex(mCtx.get(), hash.data(), &hashSize) != 1)
    {
        return errc::io_error;
    }

    auto const &info = info_of(mAlgorithm);
    std::string digest;
    digest.reserve(info.name.size() + 1 + 2 * hashSize);
    digest.append(info.name);
    digest.push_back(':');
    boost::algorithm::hex_lower(hash.data(), hash.data() + hashSize,
                                std::back_inserter(digest));
    return digest;
}

auto digest_of(ro_dynblob data, digest_algorithm algorithm)
        -> result<std::string>
{
    CHUNKDIFF_TRY(auto &&hasher, digester::create(algorithm));
    CHUNKDIFF_TRY(hasher.update(data));
    return hasher.finish();
}

auto verify_digest(ro_dynblob data, std::string_view expected) -> result<bool>
{
    CHUNKDIFF_TRY(auto &&hasher, digester::create(expected));
    CHUNKDIFF_TRY(hasher.update(data));
    CHUNKDIFF_TRY(auto &&actual, hasher.finish());
    return actual == expected;
}

auto encode_base64(ro_dynblob data) -> std::string
{
    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    if (!data.empty())
    {
        auto const written = EVP_EncodeBlock(
                reinterpret_cast<unsigned char *>(encoded.data()),
                reinterpret_cast<unsigned char const *>(data.data()),
                static_cast<int>(data.size()));
        encoded.resize(static_cast<std::size_t>(written));
    }
    return encoded;
}

auto decode_base64(std::string_view encoded) -> result<std::vector<std::byte>>
{
    if (encoded.empty())
    {
        return std::vector<std::byte>{};
    }
    if (encoded.size() % 4 != 0)
    {
        return errc::invalid_argument;
    }

    std::vector<std::byte> decoded(encoded.size() / 4 * 3);
    auto const written = EVP_DecodeBlock(
            reinterpret_cast<unsigned char *>(decoded.data()),
            reinterpret_cast<unsigned char const *>(encoded.data()),
            static_cast<int>(encoded.size()));
    if (written < 0)
    {
        return errc::invalid_argument;
    }

    // EVP_DecodeBlock decodes the padding as zero bytes
    std::size_t padding = 0;
    if (encoded.ends_with("=="))
    {
        padding = 2;
    }
    else if (encoded.ends_with('='))
    {
        padding = 1;
    }
    decoded.resize(static_cast<std::size_t>(written) - padding);
    return decoded;
}

} // namespace chunkdiff
