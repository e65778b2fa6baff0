#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

#include <chunkdiff/disappointment.hpp>
#include <chunkdiff/span.hpp>

namespace chunkdiff
{

enum class digest_algorithm
{
    sha256,
    sha384,
    sha512,
};

inline constexpr std::string_view empty_sha256_digest
        = "sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

/**
 * @brief A validated "<algorithm>:<lowercase hex>" content digest.
 */
struct parsed_digest
{
    digest_algorithm algorithm;
    std::string_view algorithm_name;
    std::string_view encoded;
};

/**
 * @brief Splits and validates a digest string.
 *
 * Fails with chunked_errc::invalid_digest if the algorithm is unknown or the
 * hex part has the wrong length or contains non lowercase hex characters.
 */
auto parse_digest(std::string_view digest) -> result<parsed_digest>;

/**
 * @brief Encodes a digest as the algorithm name followed by ':' and the raw
 * hash bytes.
 */
auto make_binary_digest(std::string_view digest)
        -> result<std::vector<std::byte>>;

/**
 * @brief Incrementally hashes a byte stream.
 */
class digester final
{
public:
    digester(digester const &) = delete;
    digester(digester &&other) noexcept = default;
    auto operator=(digester const &) -> digester & = delete;
    auto operator=(digester &&other) noexcept -> digester & = default;
    ~digester() = default;

    static auto create(digest_algorithm algorithm = digest_algorithm::sha256)
            -> result<digester>;
    static auto create(std::string_view digest) -> result<digester>;

    auto update(ro_dynblob data) -> result<void>;
    auto update(std::string_view data) -> result<void>
    {
        return update(as_bytes(data));
    }

    /**
     * @brief Finalizes the hash and returns it in the digest string format.
     *
     * The digester must not be used afterwards.
     */
    auto finish() -> result<std::string>;

    [[nodiscard]] auto algorithm() const noexcept -> digest_algorithm
    {
        return mAlgorithm;
    }

private:
    struct ctx_deleter
    {
        void operator()(EVP_MD_CTX *ctx) const noexcept;
    };

    digester(digest_algorithm algorithm,
             std::unique_ptr<EVP_MD_CTX, ctx_deleter> ctx) noexcept;

    digest_algorithm mAlgorithm;
    std::unique_ptr<EVP_MD_CTX, ctx_deleter> mCtx;
};

/**
 * @brief Hashes a complete buffer with the given algorithm.
 */
auto digest_of(ro_dynblob data,
               digest_algorithm algorithm = digest_algorithm::sha256)
        -> result<std::string>;

/**
 * @brief Hashes the buffer with the algorithm named by @p expected and
 * compares the result.
 */
auto verify_digest(ro_dynblob data, std::string_view expected)
        -> result<bool>;

auto encode_base64(ro_dynblob data) -> std::string;
auto decode_base64(std::string_view encoded) -> result<std::vector<std::byte>>;

} // namespace chunkdiff
