#include "analysis/CalendarRenderer.hpp"

#include <string>

#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

namespace LucidLog
{
    namespace Analysis
    {
        core::CalendarMonth CalendarRenderer::render(const core::YearMonth &month,
                                                     const std::vector<core::DreamRecord> &dreams) const
        {
            core::CalendarMonth calendar{};
            calendar.month = month;

            const int days = Utils::daysInMonth(month.year, month.month);
            calendar.days.reserve(static_cast<std::size_t>(days));
            for (int d = 1; d <= days; ++d)
            {
                core::CalendarDay cell{};
                cell.date = core::Date{month.year, month.month, d};
                calendar.days.push_back(cell);
            }

            std::size_t inMonth = 0;
            for (const auto &dream : dreams)
            {
                const core::Date &date = dream.date();
                if (date.year != month.year || date.month != month.month ||
                    date.day < 1 || date.day > days)
                {
                    continue;
                }

                auto &cell = calendar.days[static_cast<std::size_t>(date.day - 1)];
                ++cell.dreamCount;
                ++inMonth;

                // Lucid wins over a plain dream, whatever order the dreams come in.
                if (dream.isLucid())
                    cell.mark = core::DayMark::LucidDreamLogged;
                else if (cell.mark == core::DayMark::NoEntry)
                    cell.mark = core::DayMark::DreamLogged;
            }

            Utils::getLogger().debug(
                "CalendarRenderer: " + Utils::formatYearMonth(month) + " has " +
                std::to_string(inMonth) + " dreams");

            return calendar;
        }

    } // namespace Analysis
} // namespace LucidLog
