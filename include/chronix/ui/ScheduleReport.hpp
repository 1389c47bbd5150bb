#pragma once

#include <QDateTime>
#include <QString>
#include <QTextStream>
#include <vector>

#include "chronix/config/Settings.hpp"
#include "chronix/data/DaySchedule.hpp"
#include "chronix/data/ProjectTodoList.hpp"

namespace chronix {
namespace ui {

// Plain-text rendering of day schedules for the terminal.
class ScheduleReport
{
public:
    explicit ScheduleReport(QTextStream &out);

    void printDay(const data::DaySchedule &day, const QDateTime &workStart, const QDateTime &workEnd);
    void printConflicts(const QStringList &conflicts);
    void printTotals(const data::DaySchedule &day);
    void printSeparator();

    void printTaskDetails(const data::Task &task, const data::ProjectContext &project);
    // A zero position means the task is not queued.
    void printTaskPosition(const data::Task &task, int position, int queueLength, const QDateTime &now);
    void printSettings(const config::Settings &settings);

    static QString describeSegment(const data::ScheduledTask &scheduled);
    static QString describeBlock(const data::TimeBlock &block);
    static QString describeRule(const config::TimeBlockRule &rule);

private:
    QTextStream &m_out;
};

} // namespace ui
} // namespace chronix
