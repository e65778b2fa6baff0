#include <chunkdiff/pull_options.hpp>

#include <locale>
#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>

namespace chunkdiff
{

auto to_string(output_format format) noexcept -> std::string_view
{
    switch (format)
    {
    case output_format::flat:
        return "flat";
    case output_format::dir:
    default:
        return "dir";
    }
}

auto pull_options::parse(
        std::map<std::string, std::string, std::less<>> const &values)
        -> pull_options
{
    auto const flag = [&values](std::string_view key) {
        auto const it = values.find(key);
        return it != values.end()
               && boost::algorithm::iequals(it->second, "true",
                                            std::locale::classic());
    };

    pull_options options;
    options.enable_partial_images = flag("enable_partial_images");
    options.convert_images = flag("convert_images");
    options.use_hard_links = flag("use_hard_links");
    options.insecure_allow_unpredictable_image_contents
            = flag("insecure_allow_unpredictable_image_contents");

    if (auto const it = values.find("ostree_repos"); it != values.end())
    {
        std::vector<std::string> repos;
        boost::algorithm::split(repos, it->second,
                                boost::algorithm::is_any_of(":"));
        for (auto &repo : repos)
        {
            if (!repo.empty())
            {
                options.ostree_repos.push_back(std::move(repo));
            }
        }
    }
    return options;
}

} // namespace chunkdiff
