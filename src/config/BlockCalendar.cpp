#include "chronix/config/BlockCalendar.hpp"

#include "chronix/core/Logging.hpp"

namespace chronix {
namespace config {

BlockCalendar::BlockCalendar(const Settings &settings)
    : m_scheduling(settings.scheduling())
    , m_timeZone(settings.scheduling().timezone.toUtf8())
{
    if (!m_timeZone.isValid()) {
        throw ConfigError(QStringLiteral("Unknown timezone '%1'").arg(m_scheduling.timezone));
    }
}

std::vector<data::TimeBlock> BlockCalendar::blocksForDate(const QDate &date) const
{
    std::vector<data::TimeBlock> blocks;
    const int dayOfWeek = date.dayOfWeek();
    for (const TimeBlockRule &rule : m_scheduling.allRules()) {
        if (!rule.appliesTo(dayOfWeek)) {
            continue;
        }
        const QDateTime start(date, rule.startTime, m_timeZone);
        const QDateTime end(date, rule.endTime, m_timeZone);
        // A clock time inside a DST gap has no instant on that date.
        if (!start.isValid() || !end.isValid() || start >= end) {
            qCWarning(lcConfig) << "Skipping" << data::kindToString(rule.kind) << "block" << rule.label << "on"
                                << date.toString(Qt::ISODate) << "in" << m_scheduling.timezone;
            continue;
        }
        blocks.emplace_back(start, end, rule.kind, rule.label);
    }
    return blocks;
}

std::pair<QDateTime, QDateTime> BlockCalendar::workWindow(const QDate &date) const
{
    return { QDateTime(date, m_scheduling.workStart, m_timeZone), QDateTime(date, m_scheduling.workEnd, m_timeZone) };
}

} // namespace config
} // namespace chronix
