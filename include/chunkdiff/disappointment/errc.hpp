#pragma once

#include <algorithm>
#include <string_view>

#include <dplx/predef/compiler.h>

#include <status-code/error.hpp>
#include <status-code/system_code.hpp>

#if defined(DPLX_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnon-virtual-dtor"
#endif

namespace chunkdiff
{

namespace system_error = SYSTEM_ERROR2_NAMESPACE;

enum class chunked_errc : int
{
    success = 0,
    fallback_recommended = 1,
    fallback_can_convert,
    bad_request,
    checksum_mismatch,
    corrupt_index,
    invalid_manifest,
    invalid_digest,
    too_many_streams,
    not_enough_data,
    differ_already_used,
    unsupported_entry_type,
    path_escapes_root,
    tar_split_mismatch,
    unsupported_format,
    invalid_tar_header,
    corrupt_compressed_data,
};

class chunked_domain_type;
using chunked_code = system_error::status_code<chunked_domain_type>;

class chunked_domain_type : public system_error::status_code_domain
{
    using base = system_error::status_code_domain;
    template <class DomainType>
    friend class system_error::status_code;

public:
    static constexpr std::string_view uuid
            = "4E0B6A9C-7F2D-4C1B-A8E3-2D5F9B07C641";

    constexpr ~chunked_domain_type() noexcept = default;
    constexpr chunked_domain_type() noexcept
        : base(uuid.data(), base::_uuid_size<uuid.size()>{})
    {
    }
    constexpr chunked_domain_type(chunked_domain_type const &) noexcept
            = default;
    constexpr auto operator=(chunked_domain_type const &) noexcept
            -> chunked_domain_type & = default;

    using value_type = chunked_errc;
    using base::string_ref;

    [[nodiscard]] constexpr auto name() const noexcept -> string_ref override
    {
        return string_ref("chunkdiff-domain");
    }
    [[nodiscard]] constexpr auto payload_info() const noexcept
            -> payload_info_t override
    {
        return {sizeof(value_type),
                sizeof(value_type) + sizeof(chunked_domain_type *),
                std::max(alignof(value_type), alignof(chunked_domain_type *))};
    }

    static constexpr auto get() noexcept -> chunked_domain_type const &;

protected:
    [[nodiscard]] constexpr auto
    _do_failure(system_error::status_code<void> const &code) const noexcept
            -> bool override
    {
        return static_cast<chunked_code const &>(code).value()
               != chunked_errc::success;
    }

    [[nodiscard]] constexpr auto
    map_to_generic(value_type const value) const noexcept -> system_error::errc
    {
        using enum chunked_errc;
        using sys_errc = system_error::errc;
        switch (value)
        {
        case success:
            return sys_errc::success;

        case checksum_mismatch:
        case corrupt_index:
        case invalid_manifest:
        case invalid_digest:
        case tar_split_mismatch:
        case invalid_tar_header:
        case corrupt_compressed_data:
            return sys_errc::bad_message;

        case bad_request:
            return sys_errc::invalid_argument;

        case too_many_streams:
            return sys_errc::value_too_large;

        case not_enough_data:
            return sys_errc::no_message_available;

        case differ_already_used:
            return sys_errc::operation_not_permitted;

        case unsupported_entry_type:
        case unsupported_format:
        case fallback_recommended:
        case fallback_can_convert:
            return sys_errc::not_supported;

        case path_escapes_root:
            return sys_errc::permission_denied;

        default:
            return sys_errc::unknown;
        }
    }

    [[nodiscard]] constexpr auto
    map_to_message(value_type const value) const noexcept -> std::string_view
    {
        using enum chunked_errc;
        using namespace std::string_view_literals;

        switch (value)
        {
        case fallback_recommended:
            return "the layer cannot be pulled partially, a full pull is recommended"sv;

        case fallback_can_convert:
            return "the layer has no usable table of contents but can be converted locally"sv;

        case bad_request:
            return "the registry rejected the requested set of ranges"sv;

        case checksum_mismatch:
            return "the checksum of the reconstructed content did not match the expected digest"sv;

        case corrupt_index:
            return "the content cache index is corrupted and could not be read"sv;

        case invalid_manifest:
            return "the table of contents could not be parsed or failed validation"sv;

        case invalid_digest:
            return "the digest string is malformed or uses an unsupported algorithm"sv;

        case too_many_streams:
            return "the blob source delivered more streams than ranges were requested"sv;

        case not_enough_data:
            return "the blob source closed before delivering all requested data"sv;

        case differ_already_used:
            return "apply_diff has already been called on this differ"sv;

        case unsupported_entry_type:
            return "the entry type is not supported"sv;

        case path_escapes_root:
            return "the path resolves outside of the destination root"sv;

        case tar_split_mismatch:
            return "the tar-split metadata is inconsistent with the table of contents"sv;

        case unsupported_format:
            return "the blob uses an unsupported compression format"sv;

        case invalid_tar_header:
            return "the tar stream contains an invalid header"sv;

        case corrupt_compressed_data:
            return "the compressed data could not be decoded"sv;

        default:
            return "unknown chunkdiff error code"sv;
        }
    }

    [[nodiscard]] constexpr auto
    _do_equivalent(system_error::status_code<void> const &lhs,
                   system_error::status_code<void> const &rhs) const noexcept
            -> bool override
    {
        auto const &clhs = static_cast<chunked_code const &>(lhs);
        if (rhs.domain() == *this)
        {
            return clhs.value()
                   == static_cast<chunked_code const &>(rhs).value();
        }
        if (rhs.domain() == system_error::generic_code_domain)
        {
            system_error::errc sysErrc
                    = static_cast<system_error::generic_code const &>(rhs)
                              .value();

            return system_error::errc::unknown != sysErrc
                   && map_to_generic(clhs.value()) == sysErrc;
        }
        return false;
    }
    [[nodiscard]] constexpr auto
    _generic_code(system_error::status_code<void> const &code) const noexcept
            -> system_error::generic_code override
    {
        return map_to_generic(static_cast<chunked_code const &>(code).value());
    }

    [[nodiscard]] constexpr auto
    _do_message(system_error::status_code<void> const &code) const noexcept
            -> string_ref override
    {
        auto const chunkedCode = static_cast<chunked_code const &>(code);
        auto const message = map_to_message(chunkedCode.value());
        return string_ref(message.data(), message.size());
    }

    SYSTEM_ERROR2_NORETURN void _do_throw_exception(
            system_error::status_code<void> const &code) const override
    {
        throw system_error::status_error<chunked_domain_type>(
                static_cast<chunked_code const &>(code).clone());
    }
};
inline constexpr chunked_domain_type chunked_domain{};

constexpr auto chunked_domain_type::get() noexcept
        -> chunked_domain_type const &
{
    return chunked_domain;
}

constexpr auto make_status_code(chunked_errc c) noexcept -> chunked_code
{
    return chunked_code(system_error::in_place, c);
}

} // namespace chunkdiff

#if defined(DPLX_COMP_GNUC_AVAILABLE)
#pragma GCC diagnostic pop
#endif
