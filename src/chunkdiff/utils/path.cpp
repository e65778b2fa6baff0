#include <chunkdiff/utils/path.hpp>

#include <vector>

namespace chunkdiff::utils
{

auto clean_path(std::string_view path) -> std::string
{
    if (path.empty())
    {
        return ".";
    }

    bool const rooted = path.front() == '/';
    std::vector<std::string_view> elements;
    // number of leading ".." elements of a relative path which must be kept
    std::size_t keptParents = 0;

    std::size_t pos = 0;
    while (pos < path.size())
    {
        auto const next = path.find('/', pos);
        auto const end = next == std::string_view::npos ? path.size() : next;
        auto const element = path.substr(pos, end - pos);
        pos = end + 1;

        if (element.empty() || element == ".")
        {
            continue;
        }
        if (element == "..")
        {
            if (elements.size() > keptParents)
            {
                elements.pop_back();
            }
            else if (!rooted)
            {
                elements.push_back(element);
                ++keptParents;
            }
            continue;
        }
        elements.push_back(element);
    }

    std::string cleaned;
    cleaned.reserve(path.size());
    if (rooted)
    {
        cleaned.push_back('/');
    }
    for (std::size_t i = 0; i < elements.size(); ++i)
    {
        if (i != 0)
        {
            cleaned.push_back('/');
        }
        cleaned.append(elements[i]);
    }
    if (cleaned.empty())
    {
        cleaned = ".";
    }
    return cleaned;
}

} // namespace chunkdiff::utils
