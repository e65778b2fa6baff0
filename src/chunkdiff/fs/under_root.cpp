#include "under_root.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <deque>
#include <vector>

#include <fcntl.h>
#include <linux/openat2.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chunkdiff/utils/path.hpp>

namespace chunkdiff::detail
{

int const new_file_flags = O_CREAT | O_TRUNC | O_EXCL | O_WRONLY | O_CLOEXEC;

namespace
{

constexpr int max_symlink_follows = 255;

// set once the kernel reported that it doesn't know openat2
std::atomic<bool> skipOpenat2{false};

auto split_components(std::string_view path) -> std::deque<std::string>
{
    std::deque<std::string> components;
    while (!path.empty())
    {
        auto const sep = path.find('/');
        auto const component = path.substr(0, sep);
        if (!component.empty())
        {
            components.emplace_back(component);
        }
        if (sep == std::string_view::npos)
        {
            break;
        }
        path.remove_prefix(sep + 1);
    }
    return components;
}

auto read_link(int dirFd, char const *path) -> result<std::string>
{
    std::array<char, 4096> buffer;
    auto const n = ::readlinkat(dirFd, path, buffer.data(), buffer.size());
    if (n < 0)
    {
        return collect_system_error();
    }
    if (static_cast<std::size_t>(n) == buffer.size())
    {
        return errc::filename_too_long;
    }
    return std::string(buffer.data(), static_cast<std::size_t>(n));
}

auto open_openat2(int dirFd, std::string const &name, int flags, mode_t mode)
        -> result<unique_fd>
{
    open_how how{};
    how.flags = static_cast<std::uint64_t>(flags);
    how.mode = static_cast<std::uint64_t>(mode & 07777);
    how.resolve = RESOLVE_IN_ROOT;
    auto const fd = ::syscall(SYS_openat2, dirFd, name.c_str(), &how,
                              sizeof(how));
    if (fd < 0)
    {
        return collect_system_error();
    }
    return unique_fd(static_cast<int>(fd));
}

auto open_fallback(int dirFd, std::string const &name, int flags, mode_t mode)
        -> result<unique_fd>
{
    CHUNKDIFF_TRY(auto &&rootTarget,
                  read_link(AT_FDCWD, proc_path_for_fd(dirFd).c_str()));

    unique_fd fd;
    if ((flags & O_NOFOLLOW) != 0)
    {
        // only the parent directory is resolved, the last component must
        // not be a symlink
        CHUNKDIFF_TRY(auto &&split, split_path(name));
        unique_fd parentFd;
        if (split.first == "/")
        {
            parentFd.reset(::fcntl(dirFd, F_DUPFD_CLOEXEC, 0));
        }
        else
        {
            CHUNKDIFF_TRY(auto &&parent, secure_join(dirFd, split.first));
            parentFd.reset(::openat(dirFd, parent.c_str(),
                                    O_PATH | O_CLOEXEC | O_DIRECTORY));
        }
        if (!parentFd)
        {
            return collect_system_error();
        }
        fd.reset(::openat(parentFd.get(), split.second.c_str(), flags, mode));
    }
    else
    {
        CHUNKDIFF_TRY(auto &&joined, secure_join(dirFd, name));
        fd.reset(::openat(dirFd, joined.c_str(), flags, mode));
    }
    if (!fd)
    {
        return collect_system_error();
    }

    CHUNKDIFF_TRY(auto &&target,
                  read_link(AT_FDCWD, proc_path_for_fd(fd.get()).c_str()));
    if (!target.starts_with(rootTarget))
    {
        SPDLOG_ERROR("{} resolves outside of the root directory", name);
        return chunked_errc::path_escapes_root;
    }
    return fd;
}

auto open_raw(int dirFd, std::string_view name, int flags, mode_t mode)
        -> result<unique_fd>
{
    if (name.empty())
    {
        unique_fd fd(::fcntl(dirFd, F_DUPFD_CLOEXEC, 0));
        if (!fd)
        {
            return collect_system_error();
        }
        return fd;
    }

    std::string const path(name);
    if (skipOpenat2.load(std::memory_order_relaxed))
    {
        return open_fallback(dirFd, path, flags, mode);
    }
    auto openedRx = open_openat2(dirFd, path, flags, mode);
    if (openedRx.has_error() && openedRx.assume_error() == errc::function_not_supported)
    {
        SPDLOG_DEBUG("openat2 is not supported, falling back to a userspace "
                     "path walk");
        skipOpenat2.store(true, std::memory_order_relaxed);
        return open_fallback(dirFd, path, flags, mode);
    }
    return openedRx;
}

auto parent_of(std::string_view name) -> std::string
{
    auto const sep = name.rfind('/');
    if (sep == std::string_view::npos)
    {
        return ".";
    }
    if (sep == 0U)
    {
        return "/";
    }
    return std::string(name.substr(0, sep));
}

auto base_of(std::string_view name) -> std::string
{
    auto const sep = name.rfind('/');
    return std::string(sep == std::string_view::npos ? name
                                                     : name.substr(sep + 1));
}

} // namespace

auto proc_path_for_fd(int fd) -> std::string
{
    return fmt::format("/proc/self/fd/{}", fd);
}

auto reopen_read_only(int fd) -> result<unique_fd>
{
    unique_fd readOnly{
            ::open(proc_path_for_fd(fd).c_str(), O_RDONLY | O_CLOEXEC)};
    if (!readOnly)
    {
        return collect_system_error();
    }
    return readOnly;
}

auto split_path(std::string_view path)
        -> result<std::pair<std::string, std::string>>
{
    auto const cleaned = utils::clean_absolute_path(path);
    auto const sep = cleaned.rfind('/');
    std::string dir = cleaned.substr(0, sep);
    std::string base = cleaned.substr(sep + 1);
    if (base.empty())
    {
        base = ".";
    }
    if (dir.empty())
    {
        dir = "/";
    }
    if (base == ".." || base.find('/') != std::string::npos)
    {
        return errc::invalid_argument;
    }
    return std::pair{std::move(dir), std::move(base)};
}

auto secure_join(int rootFd, std::string_view unsafePath) -> result<std::string>
{
    auto pending = split_components(unsafePath);
    std::vector<std::string> resolved;
    int linksFollowed = 0;

    auto const joined = [&resolved](std::string const *extra) {
        std::string path;
        for (auto const &component : resolved)
        {
            if (!path.empty())
            {
                path += '/';
            }
            path += component;
        }
        if (extra != nullptr)
        {
            if (!path.empty())
            {
                path += '/';
            }
            path += *extra;
        }
        return path;
    };

    while (!pending.empty())
    {
        auto component = std::move(pending.front());
        pending.pop_front();
        if (component == ".")
        {
            continue;
        }
        if (component == "..")
        {
            if (!resolved.empty())
            {
                resolved.pop_back();
            }
            continue;
        }

        auto const candidate = joined(&component);
        auto linkRx = read_link(rootFd, candidate.c_str());
        if (linkRx.has_error())
        {
            // not a symlink or not existing (yet)
            if (linkRx.assume_error() == errc::invalid_argument
                || linkRx.assume_error() == errc::no_such_file_or_directory)
            {
                resolved.push_back(std::move(component));
                continue;
            }
            return std::move(linkRx).assume_error();
        }

        if (++linksFollowed > max_symlink_follows)
        {
            return errc::too_many_symbolic_link_levels;
        }
        auto const &target = linkRx.assume_value();
        if (target.starts_with('/'))
        {
            resolved.clear();
        }
        auto targetComponents = split_components(target);
        pending.insert(pending.begin(), targetComponents.begin(),
                       targetComponents.end());
    }

    auto path = joined(nullptr);
    if (path.empty())
    {
        path = ".";
    }
    return path;
}

auto open_file_under_root(int dirFd,
                          std::string_view name,
                          int flags,
                          mode_t mode) -> result<unique_fd>
{
    auto openedRx = open_raw(dirFd, name, flags, mode);
    if (openedRx.has_value() || (flags & O_CREAT) == 0
        || openedRx.assume_error() != errc::no_such_file_or_directory)
    {
        return openedRx;
    }

    auto const parent = parent_of(name);
    CHUNKDIFF_TRY(auto &&parentFd,
                  open_or_create_dir_under_root(dirFd, parent, 0755));
    return open_raw(parentFd.get(), base_of(name), flags, mode);
}

auto open_or_create_dir_under_root(int dirFd,
                                   std::string_view name,
                                   mode_t mode) -> result<unique_fd>
{
    constexpr int dirFlags = O_DIRECTORY | O_RDONLY | O_CLOEXEC;

    auto openedRx = open_raw(dirFd, name, dirFlags, 0);
    if (openedRx.has_value()
        || openedRx.assume_error() != errc::no_such_file_or_directory)
    {
        return openedRx;
    }

    auto const parent = parent_of(name);
    if (parent == name)
    {
        // the root always exists
        return openedRx;
    }
    CHUNKDIFF_TRY(auto &&parentFd,
                  open_or_create_dir_under_root(dirFd, parent, mode));

    auto const base = base_of(name);
    if (::mkdirat(parentFd.get(), base.c_str(), mode) != 0 && errno != EEXIST)
    {
        return collect_system_error();
    }
    return open_raw(parentFd.get(), base, dirFlags, 0);
}

auto append_hole(int fd, std::uint64_t size) -> result<void>
{
    auto const offset = ::lseek(fd, static_cast<off_t>(size), SEEK_CUR);
    if (offset < 0)
    {
        return collect_system_error();
    }
    // the hole might be at the end of the file
    if (::ftruncate(fd, offset) != 0)
    {
        return collect_system_error();
    }
    return oc::success();
}

} // namespace chunkdiff::detail
