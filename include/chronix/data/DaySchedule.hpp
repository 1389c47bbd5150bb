#pragma once

#include <QDate>
#include <QStringList>
#include <vector>

#include "chronix/data/ScheduledTask.hpp"
#include "chronix/data/TimeBlock.hpp"

namespace chronix {
namespace data {

struct DaySchedule
{
    QDate date;
    std::vector<ScheduledTask> scheduledTasks;
    std::vector<TimeBlock> blockedTime;
    QStringList conflicts;
};

} // namespace data
} // namespace chronix
