#pragma once

#include <QDate>
#include <QDateTime>
#include <functional>
#include <vector>

#include "chronix/data/DaySchedule.hpp"
#include "chronix/data/Task.hpp"
#include "chronix/data/TimeBlock.hpp"

namespace chronix {
namespace core {

using BlockedTimeProvider = std::function<std::vector<data::TimeBlock>(const QDate &)>;

// Places ordered tasks into the free time between blocked intervals. Work is
// advanced one segment at a time; before every segment the remaining tasks
// are re-scored by deadline slack so that at-risk deadlines move ahead.
class PlacementEngine
{
public:
    // Score offset that keeps undeadlined work behind every live deadline.
    static constexpr qint64 NoDeadlineOffsetMSecs = 10LL * 365 * 24 * 60 * 60 * 1000;

    // Throws InvalidInputError for a naive start instant, a naive blocked
    // boundary or a null task. Deadline misses are reported as conflicts.
    data::DaySchedule place(const std::vector<data::TaskPtr> &tasks,
                            const QDateTime &start,
                            std::vector<data::TimeBlock> blocked) const;

    // One continuous run over numDays days (plus one overflow day of blocked
    // time), split into per-day views.
    std::vector<data::DaySchedule> placeContinuous(const std::vector<data::TaskPtr> &tasks,
                                                   const QDateTime &start,
                                                   int numDays,
                                                   const BlockedTimeProvider &blockedForDay) const;

    // Upper bound on placement steps. Zero derives the bound from the input,
    // which a valid run never reaches.
    void setMaxSteps(int maxSteps);
    int maxSteps() const;

private:
    int m_maxSteps = 0;
};

} // namespace core
} // namespace chronix
