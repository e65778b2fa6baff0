#include "entries.hpp"

#include <array>
#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "under_root.hpp"

namespace chunkdiff::detail
{

namespace
{

auto open_parent(int rootFd, std::string const &parent) -> result<unique_fd>
{
    return open_or_create_dir_under_root(rootFd, parent, 0755);
}

// an invalid descriptor refers to the root itself
auto open_parent_unless_root(int rootFd, std::string const &parent)
        -> result<unique_fd>
{
    if (parent == "/")
    {
        return unique_fd{};
    }
    return open_parent(rootFd, parent);
}

auto copy_with_read_write(int srcFd, int dstFd) -> result<void>
{
    std::array<char, 1 << 16> buffer;
    for (;;)
    {
        auto const n = ::read(srcFd, buffer.data(), buffer.size());
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
            return oc::success();
        }
        for (ssize_t written = 0; written < n;)
        {
            auto const w = ::write(dstFd, buffer.data() + written,
                                   static_cast<std::size_t>(n - written));
            if (w < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return collect_system_error();
            }
            written += w;
        }
    }
}

auto copy_content(int srcFd, int dstFd, std::uint64_t size) -> result<void>
{
    loff_t srcOffset = 0;
    loff_t dstOffset = 0;
    for (std::uint64_t copied = 0U; copied < size;)
    {
        auto const n = ::copy_file_range(srcFd, &srcOffset, dstFd, &dstOffset,
                                         size - copied, 0U);
        if (n < 0)
        {
            if (copied == 0U
                && (errno == EXDEV || errno == ENOSYS || errno == EINVAL
                    || errno == EOPNOTSUPP))
            {
                return copy_with_read_write(srcFd, dstFd);
            }
            return collect_system_error();
        }
        if (n == 0)
        {
            // the source shrank
            return errc::io_error;
        }
        copied += static_cast<std::uint64_t>(n);
    }
    if (::lseek(dstFd, dstOffset, SEEK_SET) < 0)
    {
        return collect_system_error();
    }
    return oc::success();
}

} // namespace

auto safe_mkdir(entry_context const &ctx,
                mode_t mode,
                file_metadata const &metadata) -> result<void>
{
    CHUNKDIFF_TRY(auto &&split, split_path(metadata.name));
    auto const &[parent, base] = split;

    CHUNKDIFF_TRY(auto &&parentFd, open_parent_unless_root(ctx.root_fd, parent));
    int const dirFd = parentFd ? parentFd.get() : ctx.root_fd;

    if (::mkdirat(dirFd, base.c_str(), mode) != 0 && errno != EEXIST)
    {
        return collect_system_error();
    }

    CHUNKDIFF_TRY(auto &&dir,
                  open_file_under_root(dirFd, base,
                                       O_DIRECTORY | O_RDONLY | O_CLOEXEC, 0));
    return set_file_attrs(ctx.root_fd, dir.get(), mode, metadata, ctx.options,
                          ctx.xattrs_to_ignore, false);
}

auto safe_link(entry_context const &ctx,
               mode_t mode,
               file_metadata const &metadata) -> result<void>
{
    CHUNKDIFF_TRY(auto &&source,
                  open_file_under_root(ctx.root_fd, metadata.linkname,
                                       O_PATH | O_RDONLY | O_NOFOLLOW
                                               | O_CLOEXEC,
                                       0));
    CHUNKDIFF_TRY(do_hard_link(ctx.root_fd, source.get(), metadata.name));

    auto newFileRx = open_file_under_root(ctx.root_fd, metadata.name,
                                          O_WRONLY | O_NOFOLLOW | O_CLOEXEC, 0);
    if (newFileRx.has_error())
    {
        if (newFileRx.assume_error() != errc::too_many_symbolic_link_levels)
        {
            return std::move(newFileRx).as_failure();
        }
        // the link target is a symlink
        CHUNKDIFF_TRY(auto &&pathFd,
                      open_file_under_root(ctx.root_fd, metadata.name,
                                           O_PATH | O_NOFOLLOW | O_CLOEXEC,
                                           0));
        return set_file_attrs(ctx.root_fd, pathFd.get(), mode, metadata,
                              ctx.options, ctx.xattrs_to_ignore, true);
    }
    return set_file_attrs(ctx.root_fd, newFileRx.assume_value().get(), mode,
                          metadata, ctx.options, ctx.xattrs_to_ignore, false);
}

auto safe_symlink(entry_context const &ctx, file_metadata const &metadata)
        -> result<void>
{
    CHUNKDIFF_TRY(auto &&split, split_path(metadata.name));
    auto const &[parent, base] = split;

    CHUNKDIFF_TRY(auto &&parentFd, open_parent_unless_root(ctx.root_fd, parent));
    int const dirFd = parentFd ? parentFd.get() : ctx.root_fd;

    if (::symlinkat(metadata.linkname.c_str(), dirFd, base.c_str()) != 0)
    {
        return collect_system_error();
    }
    return set_file_attrs(ctx.root_fd, -1, 0777, metadata, ctx.options,
                          ctx.xattrs_to_ignore, true);
}

auto safe_mknod(entry_context const &ctx,
                mode_t mode,
                file_metadata const &metadata) -> result<void>
{
    mode_t typeBits = 0;
    switch (metadata.type)
    {
    case entry_type::char_device:
        typeBits = S_IFCHR;
        break;
    case entry_type::block_device:
        typeBits = S_IFBLK;
        break;
    case entry_type::fifo:
        typeBits = S_IFIFO;
        break;
    default:
        return chunked_errc::unsupported_entry_type;
    }

    CHUNKDIFF_TRY(auto &&split, split_path(metadata.name));
    auto const &[parent, base] = split;
    CHUNKDIFF_TRY(auto &&parentFd, open_parent(ctx.root_fd, parent));

    auto const device
            = ::makedev(static_cast<unsigned int>(metadata.devmajor),
                        static_cast<unsigned int>(metadata.devminor));
    if (::mknodat(parentFd.get(), base.c_str(), typeBits | mode, device) != 0)
    {
        return collect_system_error();
    }
    return set_file_attrs(ctx.root_fd, -1, mode, metadata, ctx.options,
                          ctx.xattrs_to_ignore, true);
}

auto create_empty_file(entry_context const &ctx,
                       mode_t mode,
                       file_metadata const &metadata) -> result<void>
{
    CHUNKDIFF_TRY(auto &&file, open_file_under_root(ctx.root_fd, metadata.name,
                                                    new_file_flags, 0));
    return set_file_attrs(ctx.root_fd, file.get(), mode, metadata,
                          ctx.options, ctx.xattrs_to_ignore, false);
}

auto do_hard_link(int rootFd, int srcFd, std::string_view destFile)
        -> result<void>
{
    CHUNKDIFF_TRY(auto &&split, split_path(destFile));
    auto const &[parent, base] = split;

    CHUNKDIFF_TRY(auto &&parentFd, open_parent_unless_root(rootFd, parent));
    int const destDirFd = parentFd ? parentFd.get() : rootFd;

    auto const source = proc_path_for_fd(srcFd);
    auto const link = [&]() {
        return ::linkat(AT_FDCWD, source.c_str(), destDirFd, base.c_str(),
                        AT_SYMLINK_FOLLOW);
    };

    if (link() == 0)
    {
        return oc::success();
    }
    if (errno != EEXIST)
    {
        return collect_system_error();
    }
    if (::unlinkat(destDirFd, base.c_str(), 0) != 0 || link() != 0)
    {
        return collect_system_error();
    }
    return oc::success();
}

auto copy_file_content(int rootFd,
                       int srcFd,
                       file_metadata &metadata,
                       mode_t mode,
                       bool useHardLinks) -> result<unique_fd>
{
    struct stat st;
    if (::fstat(srcFd, &st) != 0)
    {
        return collect_system_error();
    }

    if (useHardLinks)
    {
        if (auto linkRx = do_hard_link(rootFd, srcFd, metadata.name);
            linkRx.has_value())
        {
            metadata.skip_set_attrs = true;
            return unique_fd{};
        }
        SPDLOG_DEBUG("hard linking {} failed, copying it instead",
                     metadata.name);
    }

    CHUNKDIFF_TRY(auto &&dst, open_file_under_root(rootFd, metadata.name,
                                                   new_file_flags, mode));
    CHUNKDIFF_TRY(copy_content(srcFd, dst.get(),
                               static_cast<std::uint64_t>(st.st_size)));
    return std::move(dst);
}

} // namespace chunkdiff::detail
