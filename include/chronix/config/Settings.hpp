#pragma once

#include <QString>
#include <QStringList>
#include <QTime>
#include <stdexcept>
#include <vector>

#include "chronix/data/TimeBlock.hpp"

namespace chronix {
namespace config {

class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const QString &message)
        : std::runtime_error(message.toStdString())
    {
    }
};

// A recurring blocked interval, active on the listed weekdays.
struct TimeBlockRule
{
    QTime startTime;
    QTime endTime;
    data::BlockKind kind = data::BlockKind::Blocked;
    QString label;
    QStringList days = allDays();

    bool appliesTo(int dayOfWeek) const;

    static QStringList allDays();
};

struct SchedulingSettings
{
    QTime workStart = QTime(9, 0);
    QTime workEnd = QTime(18, 0);
    QString timezone = QStringLiteral("UTC");
    int defaultTaskDurationMinutes = 60;

    std::vector<TimeBlockRule> sleepWindows;
    std::vector<TimeBlockRule> breaks;
    std::vector<TimeBlockRule> meetings;

    std::vector<TimeBlockRule> allRules() const;
};

// Scheduling configuration backed by an INI file.
class Settings
{
public:
    Settings() = default;

    // A missing file yields the defaults. Throws ConfigError for invalid
    // values.
    static Settings load(const QString &filePath);
    static QString defaultPath();
    // Defaults plus a weekday lunch break.
    static Settings initial();

    bool save(const QString &filePath) const;

    // Throws ConfigError when the settings are inconsistent.
    void validate() const;

    const SchedulingSettings &scheduling() const { return m_scheduling; }
    SchedulingSettings &scheduling() { return m_scheduling; }

private:
    SchedulingSettings m_scheduling;
};

} // namespace config
} // namespace chronix
