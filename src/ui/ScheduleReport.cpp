#include "chronix/ui/ScheduleReport.hpp"

#include "chronix/core/TimeUtils.hpp"

#include <algorithm>

namespace chronix {
namespace ui {

namespace {
constexpr auto CLOCK_FORMAT = "HH:mm";

QString clockRange(const QDateTime &start, const QDateTime &end)
{
    QString range = QStringLiteral("%1-%2").arg(start.toString(QLatin1String(CLOCK_FORMAT)),
                                                end.toString(QLatin1String(CLOCK_FORMAT)));
    if (start.date() != end.date()) {
        range += QStringLiteral(" (+%1d)").arg(start.date().daysTo(end.date()));
    }
    return range;
}

QString deadlineText(const QDateTime &deadline)
{
    if (!deadline.isValid()) {
        return QStringLiteral("not set");
    }
    return QStringLiteral("%1 %2").arg(core::formatTimestamp(deadline), deadline.timeZoneAbbreviation());
}

void printRules(QTextStream &out, const char *heading, const std::vector<config::TimeBlockRule> &rules)
{
    if (rules.empty()) {
        return;
    }
    out << heading << ":\n";
    for (const config::TimeBlockRule &rule : rules) {
        out << "  " << ScheduleReport::describeRule(rule) << '\n';
    }
}

struct TimelineEntry
{
    QDateTime start;
    QString text;
};
} // namespace

ScheduleReport::ScheduleReport(QTextStream &out)
    : m_out(out)
{
}

void ScheduleReport::printDay(const data::DaySchedule &day, const QDateTime &workStart, const QDateTime &workEnd)
{
    m_out << "== " << day.date.toString(QStringLiteral("dddd yyyy-MM-dd"));
    if (workStart.isValid() && workEnd.isValid()) {
        m_out << "  (work " << workStart.toString(QLatin1String(CLOCK_FORMAT)) << '-'
              << workEnd.toString(QLatin1String(CLOCK_FORMAT)) << ", " << workStart.timeZoneAbbreviation() << ')';
    }
    m_out << '\n';

    std::vector<TimelineEntry> entries;
    for (const data::ScheduledTask &scheduled : day.scheduledTasks) {
        entries.push_back({ scheduled.start(), describeSegment(scheduled) });
    }
    for (const data::TimeBlock &block : day.blockedTime) {
        entries.push_back({ block.start(), describeBlock(block) });
    }
    std::stable_sort(entries.begin(), entries.end(), [](const TimelineEntry &lhs, const TimelineEntry &rhs) {
        return lhs.start < rhs.start;
    });

    if (entries.empty()) {
        m_out << "  (nothing scheduled)\n";
    }
    for (const TimelineEntry &entry : entries) {
        m_out << "  " << entry.text << '\n';
    }
    m_out.flush();
}

void ScheduleReport::printConflicts(const QStringList &conflicts)
{
    if (conflicts.isEmpty()) {
        return;
    }
    m_out << "Conflicts:\n";
    for (const QString &conflict : conflicts) {
        m_out << "  ! " << conflict << '\n';
    }
    m_out.flush();
}

void ScheduleReport::printTotals(const data::DaySchedule &day)
{
    qint64 total = 0;
    for (const data::ScheduledTask &scheduled : day.scheduledTasks) {
        total += scheduled.durationMSecs();
    }
    m_out << "Scheduled " << core::formatDuration(total) << " in " << day.scheduledTasks.size()
          << " segment(s), " << day.conflicts.size() << " conflict(s)\n";
    m_out.flush();
}

void ScheduleReport::printSeparator()
{
    m_out << QString(60, QLatin1Char('-')) << '\n';
}

void ScheduleReport::printTaskDetails(const data::Task &task, const data::ProjectContext &project)
{
    m_out << "Task: " << task.title() << '\n';
    m_out << "  ID: " << task.id() << '\n';
    m_out << "  Status: " << (task.completed() ? "completed" : "open") << '\n';
    m_out << "Origin\n";
    m_out << "  Project: " << project.projectName << '\n';
    if (!task.section().isEmpty()) {
        m_out << "  Section: " << task.section() << '\n';
    }
    m_out << "  Source: " << project.source << '\n';
    if (!project.documentId.isEmpty()) {
        m_out << "  Document: " << project.documentId << '\n';
    }
    m_out << "Duration and deadlines\n";
    m_out << "  Estimated duration: " << core::formatDuration(task.estimatedDurationMSecs()) << '\n';
    m_out << "  User deadline: " << deadlineText(task.userDeadline()) << '\n';
    m_out << "  External deadline: " << deadlineText(task.externalDeadline()) << '\n';
    if (task.effectiveDeadline().isValid()) {
        m_out << "  Effective deadline: " << deadlineText(task.effectiveDeadline()) << " ("
              << (task.effectiveDeadlineIsExternal() ? "external" : "user") << ")\n";
    }
    m_out.flush();
}

void ScheduleReport::printTaskPosition(const data::Task &task, int position, int queueLength, const QDateTime &now)
{
    m_out << "Scheduling position\n";
    if (position <= 0) {
        m_out << "  Task is completed or not in the active queue\n";
        m_out.flush();
        return;
    }
    m_out << "  Position in queue: " << position << " of " << queueLength << '\n';
    const QDateTime deadline = task.effectiveDeadline();
    if (!deadline.isValid()) {
        m_out << "  No deadline set; ranked after deadlined work\n";
    } else if (deadline > now) {
        m_out << "  Time until deadline: " << core::formatDuration(now.msecsTo(deadline)) << '\n';
    } else {
        m_out << "  Deadline passed " << core::formatDuration(deadline.msecsTo(now)) << " ago\n";
    }
    m_out.flush();
}

void ScheduleReport::printSettings(const config::Settings &settings)
{
    const config::SchedulingSettings &scheduling = settings.scheduling();
    m_out << "Scheduling\n";
    m_out << "  Work hours: " << scheduling.workStart.toString(QLatin1String(CLOCK_FORMAT)) << '-'
          << scheduling.workEnd.toString(QLatin1String(CLOCK_FORMAT)) << '\n';
    m_out << "  Timezone: " << scheduling.timezone << '\n';
    m_out << "  Default task duration: " << scheduling.defaultTaskDurationMinutes << " minutes\n";
    printRules(m_out, "Sleep windows", scheduling.sleepWindows);
    printRules(m_out, "Breaks", scheduling.breaks);
    printRules(m_out, "Meetings", scheduling.meetings);
    m_out.flush();
}

QString ScheduleReport::describeSegment(const data::ScheduledTask &scheduled)
{
    const data::Task &task = scheduled.task();
    QString text = QStringLiteral("%1  %2").arg(clockRange(scheduled.start(), scheduled.end()), task.title());
    if (!task.project().isEmpty()) {
        text += QStringLiteral(" [%1]").arg(task.project());
    }
    if (scheduled.isSegment()) {
        text += QStringLiteral(" (part %1/%2)").arg(scheduled.segmentIndex()).arg(scheduled.totalSegments());
    }
    if (scheduled.violatesExternalDeadline() || scheduled.violatesUserDeadline()) {
        text += QStringLiteral(" LATE");
    }
    return text;
}

QString ScheduleReport::describeBlock(const data::TimeBlock &block)
{
    QString text = QStringLiteral("%1  <%2>").arg(clockRange(block.start(), block.end()), data::kindToString(block.kind()));
    if (!block.label().isEmpty()) {
        text += QLatin1Char(' ') + block.label();
    }
    return text;
}

QString ScheduleReport::describeRule(const config::TimeBlockRule &rule)
{
    QString days = QStringList(rule.days.mid(0, 3)).join(QStringLiteral(", "));
    if (rule.days.size() > 3) {
        days += QStringLiteral("...");
    }
    QString text = QStringLiteral("%1-%2 (%3)").arg(rule.startTime.toString(QLatin1String(CLOCK_FORMAT)),
                                                   rule.endTime.toString(QLatin1String(CLOCK_FORMAT)), days);
    if (!rule.label.isEmpty()) {
        text += QStringLiteral(" %1").arg(rule.label);
    }
    return text;
}

} // namespace ui
} // namespace chronix
