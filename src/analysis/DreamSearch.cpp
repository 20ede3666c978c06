#include "analysis/DreamSearch.hpp"

#include <string>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        bool DreamSearch::matches(const core::DreamRecord &dream, const std::string &keyword)
        {
            if (Utils::containsIgnoreCase(dream.title(), keyword) ||
                Utils::containsIgnoreCase(dream.content(), keyword))
            {
                return true;
            }

            for (const auto &tag : dream.tags())
            {
                if (Utils::containsIgnoreCase(tag, keyword))
                    return true;
            }
            return false;
        }

        DreamSearch::Result DreamSearch::search(const std::vector<core::DreamRecord> &dreams,
                                                const std::string &keyword) const
        {
            Result result;

            const std::string needle(Utils::trim(keyword));
            if (needle.empty())
            {
                result.error = core::configurationError("empty-search-keyword", "search",
                                                        "keyword must not be blank");
                Utils::getLogger().error(result.error->describe());
                return result;
            }

            for (const auto &dream : dreams)
            {
                if (matches(dream, needle))
                    result.matches.push_back(dream.id());
            }

            Utils::getLogger().debug("DreamSearch: '" + needle + "' matched " +
                                     std::to_string(result.matches.size()) + " dreams");
            return result;
        }

    } // namespace Analysis
} // namespace LucidLog
