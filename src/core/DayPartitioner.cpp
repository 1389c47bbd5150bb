#include "chronix/core/DayPartitioner.hpp"

#include "chronix/core/TimeUtils.hpp"

namespace chronix {
namespace core {

namespace {
bool touchesDay(const QDateTime &start, const QDateTime &end, const QDate &day)
{
    return start.date() <= day && day <= lastTouchedDate(start, end);
}
} // namespace

std::vector<data::DaySchedule> DayPartitioner::partition(const data::DaySchedule &continuous,
                                                         const QDate &firstDay,
                                                         int numDays) const
{
    std::vector<data::DaySchedule> days;
    if (numDays < 1 || !firstDay.isValid()) {
        return days;
    }
    days.reserve(static_cast<std::size_t>(numDays));

    for (int offset = 0; offset < numDays; ++offset) {
        data::DaySchedule day;
        day.date = firstDay.addDays(offset);
        for (const data::ScheduledTask &scheduled : continuous.scheduledTasks) {
            if (touchesDay(scheduled.start(), scheduled.end(), day.date)) {
                day.scheduledTasks.push_back(scheduled);
            }
        }
        for (const data::TimeBlock &block : continuous.blockedTime) {
            if (touchesDay(block.start(), block.end(), day.date)) {
                day.blockedTime.push_back(block);
            }
        }
        if (offset == 0) {
            day.conflicts = continuous.conflicts;
        }
        days.push_back(std::move(day));
    }
    return days;
}

} // namespace core
} // namespace chronix
