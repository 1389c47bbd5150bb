#pragma once

#include <QDate>
#include <QDateTime>
#include <QTimeZone>
#include <utility>
#include <vector>

#include "chronix/config/Settings.hpp"
#include "chronix/data/TimeBlock.hpp"

namespace chronix {
namespace config {

// Turns the recurring rules of the settings into concrete blocked intervals
// and work windows in the configured time zone.
class BlockCalendar
{
public:
    explicit BlockCalendar(const Settings &settings);

    const QTimeZone &timeZone() const { return m_timeZone; }

    std::vector<data::TimeBlock> blocksForDate(const QDate &date) const;
    std::pair<QDateTime, QDateTime> workWindow(const QDate &date) const;

private:
    SchedulingSettings m_scheduling;
    QTimeZone m_timeZone;
};

} // namespace config
} // namespace chronix
