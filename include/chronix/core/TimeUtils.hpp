#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>

namespace chronix {
namespace core {

// UTC, fixed offsets and IANA zones are aware. Qt::LocalTime floats with the
// host setting and counts as naive.
bool isZoneAware(const QDateTime &dt);

QString formatTimestamp(const QDateTime &dt);
QString formatDuration(qint64 msecs);

// Last calendar date an interval touches, with the end treated as exclusive.
QDate lastTouchedDate(const QDateTime &start, const QDateTime &end);

} // namespace core
} // namespace chronix
