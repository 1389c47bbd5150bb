#include "chronix/config/Settings.hpp"

#include "chronix/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QTimeZone>

namespace chronix {
namespace config {

namespace {
constexpr auto TIME_FORMAT = "HH:mm";

QTime parseTime(const QString &value, const QString &key)
{
    QTime time = QTime::fromString(value.trimmed(), QLatin1String(TIME_FORMAT));
    if (!time.isValid()) {
        time = QTime::fromString(value.trimmed(), QStringLiteral("HH:mm:ss"));
    }
    if (!time.isValid()) {
        throw ConfigError(QStringLiteral("Invalid time for %1: '%2' (expected HH:mm)").arg(key, value));
    }
    return time;
}

std::vector<TimeBlockRule> readRules(QSettings &settings, const QString &group, data::BlockKind defaultKind)
{
    std::vector<TimeBlockRule> rules;
    const int size = settings.beginReadArray(group);
    for (int i = 0; i < size; ++i) {
        settings.setArrayIndex(i);
        const QString key = QStringLiteral("%1/%2").arg(group).arg(i + 1);

        TimeBlockRule rule;
        rule.startTime = parseTime(settings.value(QStringLiteral("start")).toString(), key + QStringLiteral("/start"));
        rule.endTime = parseTime(settings.value(QStringLiteral("end")).toString(), key + QStringLiteral("/end"));
        rule.kind = defaultKind;
        if (settings.contains(QStringLiteral("kind"))) {
            const QString kindName = settings.value(QStringLiteral("kind")).toString();
            const std::optional<data::BlockKind> kind = data::kindFromString(kindName);
            if (!kind) {
                throw ConfigError(QStringLiteral("Invalid kind for %1: '%2'").arg(key, kindName));
            }
            rule.kind = *kind;
        }
        rule.label = settings.value(QStringLiteral("label")).toString();
        if (settings.contains(QStringLiteral("days"))) {
            rule.days.clear();
            for (const QString &day : settings.value(QStringLiteral("days")).toStringList()) {
                rule.days << day.trimmed().toLower();
            }
        }
        rules.push_back(rule);
    }
    settings.endArray();
    return rules;
}

void writeRules(QSettings &settings, const QString &group, const std::vector<TimeBlockRule> &rules)
{
    settings.beginWriteArray(group, static_cast<int>(rules.size()));
    for (int i = 0; i < static_cast<int>(rules.size()); ++i) {
        const TimeBlockRule &rule = rules[static_cast<std::size_t>(i)];
        settings.setArrayIndex(i);
        settings.setValue(QStringLiteral("start"), rule.startTime.toString(QLatin1String(TIME_FORMAT)));
        settings.setValue(QStringLiteral("end"), rule.endTime.toString(QLatin1String(TIME_FORMAT)));
        settings.setValue(QStringLiteral("kind"), data::kindToString(rule.kind));
        if (!rule.label.isEmpty()) {
            settings.setValue(QStringLiteral("label"), rule.label);
        }
        settings.setValue(QStringLiteral("days"), rule.days);
    }
    settings.endArray();
}

void validateRule(const TimeBlockRule &rule)
{
    if (rule.startTime >= rule.endTime) {
        throw ConfigError(QStringLiteral("Block '%1': start_time must be before end_time").arg(rule.label));
    }
    const QStringList valid = TimeBlockRule::allDays();
    for (const QString &day : rule.days) {
        if (!valid.contains(day)) {
            throw ConfigError(QStringLiteral("Invalid day '%1'. Must be one of %2").arg(day, valid.join(QStringLiteral(", "))));
        }
    }
}
} // namespace

QStringList TimeBlockRule::allDays()
{
    return { QStringLiteral("monday"), QStringLiteral("tuesday"), QStringLiteral("wednesday"),
             QStringLiteral("thursday"), QStringLiteral("friday"), QStringLiteral("saturday"),
             QStringLiteral("sunday") };
}

bool TimeBlockRule::appliesTo(int dayOfWeek) const
{
    if (dayOfWeek < 1 || dayOfWeek > 7) {
        return false;
    }
    return days.contains(allDays().at(dayOfWeek - 1));
}

std::vector<TimeBlockRule> SchedulingSettings::allRules() const
{
    std::vector<TimeBlockRule> rules;
    rules.reserve(sleepWindows.size() + breaks.size() + meetings.size());
    rules.insert(rules.end(), sleepWindows.begin(), sleepWindows.end());
    rules.insert(rules.end(), breaks.begin(), breaks.end());
    rules.insert(rules.end(), meetings.begin(), meetings.end());
    return rules;
}

Settings Settings::load(const QString &filePath)
{
    Settings result;
    if (!QFile::exists(filePath)) {
        qCDebug(lcConfig) << "Config file" << filePath << "does not exist, using defaults";
        return result;
    }

    QSettings settings(filePath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        throw ConfigError(QStringLiteral("Could not read config file %1").arg(filePath));
    }

    SchedulingSettings &scheduling = result.m_scheduling;
    settings.beginGroup(QStringLiteral("scheduling"));
    if (settings.contains(QStringLiteral("work_start"))) {
        scheduling.workStart = parseTime(settings.value(QStringLiteral("work_start")).toString(), QStringLiteral("work_start"));
    }
    if (settings.contains(QStringLiteral("work_end"))) {
        scheduling.workEnd = parseTime(settings.value(QStringLiteral("work_end")).toString(), QStringLiteral("work_end"));
    }
    scheduling.timezone = settings.value(QStringLiteral("timezone"), scheduling.timezone).toString().trimmed();
    if (settings.contains(QStringLiteral("default_task_duration_minutes"))) {
        bool ok = false;
        scheduling.defaultTaskDurationMinutes = settings.value(QStringLiteral("default_task_duration_minutes")).toInt(&ok);
        if (!ok) {
            throw ConfigError(QStringLiteral("default_task_duration_minutes must be an integer"));
        }
    }
    settings.endGroup();

    scheduling.sleepWindows = readRules(settings, QStringLiteral("sleep"), data::BlockKind::Sleep);
    scheduling.breaks = readRules(settings, QStringLiteral("breaks"), data::BlockKind::Break);
    scheduling.meetings = readRules(settings, QStringLiteral("meetings"), data::BlockKind::Meeting);

    result.validate();
    qCDebug(lcConfig) << "Loaded configuration from" << filePath << "with"
                      << scheduling.allRules().size() << "recurring blocks";
    return result;
}

QString Settings::defaultPath()
{
    QString folder = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (folder.isEmpty()) {
        folder = QDir::homePath() + QStringLiteral("/.config/chronix");
    }
    return QDir(folder).filePath(QStringLiteral("config.ini"));
}

Settings Settings::initial()
{
    Settings result;
    TimeBlockRule lunch;
    lunch.startTime = QTime(12, 0);
    lunch.endTime = QTime(13, 0);
    lunch.kind = data::BlockKind::Break;
    lunch.label = QStringLiteral("Lunch");
    lunch.days = QStringList(TimeBlockRule::allDays().mid(0, 5));
    result.m_scheduling.breaks.push_back(lunch);
    return result;
}

bool Settings::save(const QString &filePath) const
{
    const QFileInfo info(filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcConfig) << "Could not create config folder" << dir.path();
        return false;
    }

    QSettings settings(filePath, QSettings::IniFormat);
    settings.clear();
    settings.beginGroup(QStringLiteral("scheduling"));
    settings.setValue(QStringLiteral("work_start"), m_scheduling.workStart.toString(QLatin1String(TIME_FORMAT)));
    settings.setValue(QStringLiteral("work_end"), m_scheduling.workEnd.toString(QLatin1String(TIME_FORMAT)));
    settings.setValue(QStringLiteral("timezone"), m_scheduling.timezone);
    settings.setValue(QStringLiteral("default_task_duration_minutes"), m_scheduling.defaultTaskDurationMinutes);
    settings.endGroup();
    writeRules(settings, QStringLiteral("sleep"), m_scheduling.sleepWindows);
    writeRules(settings, QStringLiteral("breaks"), m_scheduling.breaks);
    writeRules(settings, QStringLiteral("meetings"), m_scheduling.meetings);
    settings.sync();

    if (settings.status() != QSettings::NoError) {
        qCWarning(lcConfig) << "Could not write config file" << filePath;
        return false;
    }
    qCDebug(lcConfig) << "Saved configuration to" << filePath;
    return true;
}

void Settings::validate() const
{
    if (m_scheduling.workStart >= m_scheduling.workEnd) {
        throw ConfigError(QStringLiteral("work_start must be before work_end"));
    }
    if (!QTimeZone(m_scheduling.timezone.toUtf8()).isValid()) {
        throw ConfigError(QStringLiteral("Unknown timezone '%1'").arg(m_scheduling.timezone));
    }
    if (m_scheduling.defaultTaskDurationMinutes < 1) {
        throw ConfigError(QStringLiteral("default_task_duration_minutes must be at least 1"));
    }
    for (const TimeBlockRule &rule : m_scheduling.allRules()) {
        validateRule(rule);
    }
}

} // namespace config
} // namespace chronix
