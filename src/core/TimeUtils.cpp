#include "chronix/core/TimeUtils.hpp"

namespace chronix {
namespace core {

namespace {
constexpr auto TIMESTAMP_FORMAT = "yyyy-MM-dd HH:mm";
}

bool isZoneAware(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return false;
    }
    return dt.timeSpec() != Qt::LocalTime;
}

QString formatTimestamp(const QDateTime &dt)
{
    return dt.toString(QLatin1String(TIMESTAMP_FORMAT));
}

QString formatDuration(qint64 msecs)
{
    const qint64 totalMinutes = msecs / (60 * 1000);
    const qint64 hours = totalMinutes / 60;
    const qint64 minutes = totalMinutes % 60;
    if (hours > 0 && minutes > 0) {
        return QStringLiteral("%1h %2m").arg(hours).arg(minutes);
    }
    if (hours > 0) {
        return QStringLiteral("%1h").arg(hours);
    }
    return QStringLiteral("%1m").arg(minutes);
}

QDate lastTouchedDate(const QDateTime &start, const QDateTime &end)
{
    if (end <= start) {
        return start.date();
    }
    return end.addMSecs(-1).date();
}

} // namespace core
} // namespace chronix
