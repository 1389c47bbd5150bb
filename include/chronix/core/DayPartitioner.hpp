#pragma once

#include <QDate>
#include <vector>

#include "chronix/data/DaySchedule.hpp"

namespace chronix {
namespace core {

// Splits one continuous schedule into per-day views. A segment that crosses
// midnight appears unclipped on every day it touches. Conflicts of the whole
// run are reported on the first day only.
class DayPartitioner
{
public:
    std::vector<data::DaySchedule> partition(const data::DaySchedule &continuous,
                                             const QDate &firstDay,
                                             int numDays) const;
};

} // namespace core
} // namespace chronix
