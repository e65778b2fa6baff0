#include "file_attrs.hpp"

#include <array>
#include <cerrno>
#include <map>

#include <fcntl.h>
#include <sys/xattr.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <chunkdiff/digest.hpp>

#include "under_root.hpp"

namespace chunkdiff::detail
{

namespace
{

auto can_ignore(int error) noexcept -> bool
{
    return error == ENOSYS || error == ENOTSUP;
}

auto to_container(std::int64_t hostId, std::span<id_map_entry const> maps)
        -> result<std::int64_t>
{
    if (maps.empty())
    {
        return hostId;
    }
    for (auto const &m : maps)
    {
        if (hostId >= m.host_id
            && hostId < static_cast<std::int64_t>(m.host_id) + m.size)
        {
            return m.container_id + (hostId - m.host_id);
        }
    }
    SPDLOG_ERROR("host id {} cannot be mapped to a container id", hostId);
    return errc::invalid_argument;
}

auto list_xattrs(std::string const &path)
        -> result<std::map<std::string, std::string>>
{
    auto const listSize = ::llistxattr(path.c_str(), nullptr, 0);
    if (listSize < 0)
    {
        return collect_system_error();
    }
    std::string names(static_cast<std::size_t>(listSize), '\0');
    auto const actualSize = ::llistxattr(path.c_str(), names.data(), names.size());
    if (actualSize < 0)
    {
        return collect_system_error();
    }
    names.resize(static_cast<std::size_t>(actualSize));

    std::map<std::string, std::string> xattrs;
    for (std::size_t pos = 0U; pos < names.size();)
    {
        auto const end = names.find('\0', pos);
        std::string name = names.substr(pos, end - pos);
        pos = end == std::string::npos ? names.size() : end + 1U;
        if (name.empty())
        {
            continue;
        }

        auto const valueSize
                = ::lgetxattr(path.c_str(), name.c_str(), nullptr, 0);
        if (valueSize < 0)
        {
            return collect_system_error();
        }
        std::string value(static_cast<std::size_t>(valueSize), '\0');
        auto const actualValueSize = ::lgetxattr(
                path.c_str(), name.c_str(), value.data(), value.size());
        if (actualValueSize < 0)
        {
            return collect_system_error();
        }
        value.resize(static_cast<std::size_t>(actualValueSize));
        xattrs.emplace(std::move(name), std::move(value));
    }
    return xattrs;
}

} // namespace

auto to_timespec(std::optional<file_time> const &time) noexcept -> timespec
{
    timespec ts{};
    if (!time.has_value())
    {
        ts.tv_sec = 0;
        ts.tv_nsec = UTIME_OMIT;
        return ts;
    }
    auto const sinceEpoch = time->time_since_epoch();
    auto const seconds
            = std::chrono::floor<std::chrono::seconds>(sinceEpoch);
    ts.tv_sec = static_cast<time_t>(seconds.count());
    ts.tv_nsec = static_cast<long>((sinceEpoch - seconds).count());
    return ts;
}

auto set_file_attrs(int dirFd,
                    int fd,
                    mode_t mode,
                    file_metadata const &metadata,
                    tar_options const &options,
                    xattr_ignore_set const &xattrsToIgnore,
                    bool usePath) -> result<void>
{
    if (metadata.skip_set_attrs)
    {
        return oc::success();
    }
    if (metadata.type == entry_type::symlink)
    {
        usePath = true;
    }

    unique_fd parentFd;
    std::string baseName;
    if (usePath)
    {
        CHUNKDIFF_TRY(auto &&split, split_path(metadata.name));
        CHUNKDIFF_TRY(auto &&opened,
                      open_file_under_root(dirFd, split.first,
                                           O_PATH | O_DIRECTORY | O_CLOEXEC,
                                           0));
        parentFd = std::move(opened);
        baseName = std::move(split.second);
    }

    auto const uid = static_cast<uid_t>(metadata.uid);
    auto const gid = static_cast<gid_t>(metadata.gid);
    auto const chownRc
            = usePath ? ::fchownat(parentFd.get(), baseName.c_str(), uid, gid,
                                   AT_SYMLINK_NOFOLLOW)
                      : ::fchownat(fd, "", uid, gid, AT_EMPTY_PATH);
    if (chownRc != 0 && !options.ignore_chown_errors)
    {
        auto chownError = collect_system_error();
        if (chownError == errc::invalid_argument)
        {
            SPDLOG_ERROR("potentially insufficient UIDs or GIDs available in "
                         "the user namespace (requested {}:{} for {})",
                         uid, gid, metadata.name);
        }
        return chownError;
    }

    // O_PATH descriptors don't support the xattr calls
    auto const xattrPath
            = usePath ? proc_path_for_fd(parentFd.get()) + "/" + baseName
                      : proc_path_for_fd(fd);
    for (auto const &[name, encoded] : metadata.xattrs)
    {
        if (xattrsToIgnore.contains(name))
        {
            continue;
        }
        CHUNKDIFF_TRY(auto &&value, decode_base64(encoded));
        if (::lsetxattr(xattrPath.c_str(), name.c_str(), value.data(),
                        value.size(), 0)
                    != 0
            && !can_ignore(errno))
        {
            auto xattrError = collect_system_error();
            SPDLOG_DEBUG("failed to set xattr {} of {}", name, metadata.name);
            return xattrError;
        }
    }

    std::array<timespec, 2> const times{to_timespec(metadata.accesstime),
                                        to_timespec(metadata.modtime)};
    auto const utimesRc
            = usePath ? ::utimensat(parentFd.get(), baseName.c_str(),
                                    times.data(), AT_SYMLINK_NOFOLLOW)
                      : ::utimensat(AT_FDCWD, proc_path_for_fd(fd).c_str(),
                                    times.data(), 0);
    if (utimesRc != 0 && !can_ignore(errno))
    {
        return collect_system_error();
    }

    auto const chmodRc
            = usePath ? ::fchmodat(parentFd.get(), baseName.c_str(), mode,
                                   AT_SYMLINK_NOFOLLOW)
                      : ::fchmod(fd, mode);
    if (chmodRc != 0 && !can_ignore(errno))
    {
        return collect_system_error();
    }
    return oc::success();
}

auto remap_ids(std::span<file_metadata> entries, tar_options const &options)
        -> result<void>
{
    if (!options.chown_override && options.uid_maps.empty()
        && options.gid_maps.empty())
    {
        return oc::success();
    }
    for (auto &entry : entries)
    {
        if (options.chown_override)
        {
            entry.uid = options.chown_override->first;
            entry.gid = options.chown_override->second;
            continue;
        }
        CHUNKDIFF_TRY(auto &&uid, to_container(entry.uid, options.uid_maps));
        CHUNKDIFF_TRY(auto &&gid, to_container(entry.gid, options.gid_maps));
        entry.uid = uid;
        entry.gid = gid;
    }
    return oc::success();
}

auto collect_ids(std::span<file_metadata const> entries)
        -> std::pair<std::vector<std::uint32_t>, std::vector<std::uint32_t>>
{
    std::set<std::uint32_t> uids;
    std::set<std::uint32_t> gids;
    for (auto const &entry : entries)
    {
        uids.insert(static_cast<std::uint32_t>(entry.uid));
        gids.insert(static_cast<std::uint32_t>(entry.gid));
    }
    return {{uids.begin(), uids.end()}, {gids.begin(), gids.end()}};
}

auto can_dedup_with_hard_link(file_metadata const &file,
                              int fd,
                              xattr_ignore_set const &xattrsToIgnore) -> bool
{
    struct stat st;
    if (::fstat(fd, &st) != 0)
    {
        return false;
    }
    if (static_cast<std::int64_t>(st.st_uid) != file.uid
        || static_cast<std::int64_t>(st.st_gid) != file.gid
        || (st.st_mode & 07777) != (file.mode & 07777))
    {
        return false;
    }

    auto xattrsRx = list_xattrs(proc_path_for_fd(fd));
    if (xattrsRx.has_error())
    {
        return false;
    }
    auto &existing = xattrsRx.assume_value();
    std::erase_if(existing, [&xattrsToIgnore](auto const &kv) {
        return xattrsToIgnore.contains(kv.first);
    });

    std::map<std::string, std::string> expected;
    for (auto const &[name, encoded] : file.xattrs)
    {
        if (xattrsToIgnore.contains(name))
        {
            continue;
        }
        auto decodedRx = decode_base64(encoded);
        if (decodedRx.has_error())
        {
            return false;
        }
        expected.emplace(name, std::string(as_string_view(
                                       decodedRx.assume_value())));
    }
    return existing == expected;
}

} // namespace chunkdiff::detail
