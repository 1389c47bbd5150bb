#include "chronix/core/AppContext.hpp"

#include "chronix/config/BlockCalendar.hpp"
#include "chronix/core/Logging.hpp"
#include "chronix/data/TaskFileSource.hpp"

#include <algorithm>

namespace chronix {
namespace core {

AppContext::AppContext(config::Settings settings)
    : m_settings(std::move(settings))
    , m_calendar(std::make_unique<config::BlockCalendar>(m_settings))
{
}

AppContext::~AppContext() = default;

const config::Settings &AppContext::settings() const
{
    return m_settings;
}

const config::BlockCalendar &AppContext::calendar() const
{
    return *m_calendar;
}

int AppContext::loadTaskFiles(const QStringList &paths)
{
    const data::TaskFileSource source;
    int loaded = 0;
    for (const QString &path : paths) {
        std::optional<data::ProjectTodoList> project = source.load(path);
        if (!project) {
            continue;
        }
        m_projects.push_back(std::move(*project));
        ++loaded;
    }
    return loaded;
}

void AppContext::addProject(data::ProjectTodoList project)
{
    m_projects.push_back(std::move(project));
}

const std::vector<data::ProjectTodoList> &AppContext::projects() const
{
    return m_projects;
}

std::vector<data::TaskPtr> AppContext::prioritizedTasks() const
{
    return m_prioritizer.prioritize(m_projects);
}

std::optional<TaskExplanation> AppContext::explainTask(const QString &taskId) const
{
    const std::vector<AggregatedTask> aggregated = m_prioritizer.aggregate(m_projects);
    const auto found = std::find_if(aggregated.begin(), aggregated.end(), [&taskId](const AggregatedTask &entry) {
        return entry.task->id() == taskId;
    });
    if (found == aggregated.end()) {
        qCDebug(lcCore) << "No task with id" << taskId;
        return std::nullopt;
    }

    TaskExplanation explanation;
    explanation.task = found->task;
    explanation.project = found->project;
    for (const data::TaskPtr &task : m_prioritizer.prioritize(Prioritizer::taskPool(aggregated))) {
        if (task->completed()) {
            continue;
        }
        ++explanation.queueLength;
        if (explanation.position == 0 && task->id() == taskId) {
            explanation.position = explanation.queueLength;
        }
    }
    return explanation;
}

QDateTime AppContext::planningStart(const QDateTime &now) const
{
    const QDateTime local = now.toTimeZone(m_calendar->timeZone());
    const QDateTime workStart = m_calendar->workWindow(local.date()).first;
    return std::max(local, workStart);
}

data::DaySchedule AppContext::scheduleToday(const QDateTime &now) const
{
    const QDateTime start = planningStart(now);
    const QDate today = start.date();
    const QDateTime workEnd = m_calendar->workWindow(today).second;

    std::vector<data::TimeBlock> blocked;
    for (const data::TimeBlock &block : m_calendar->blocksForDate(today)) {
        if (block.overlaps(start, workEnd)) {
            blocked.push_back(block);
        }
    }

    data::DaySchedule schedule = m_engine.place(prioritizedTasks(), start, std::move(blocked));
    // Work spilling into tomorrow belongs to tomorrow's view.
    const auto spill = std::remove_if(schedule.scheduledTasks.begin(), schedule.scheduledTasks.end(),
                                      [&today](const data::ScheduledTask &scheduled) {
        return scheduled.start().date() != today;
    });
    schedule.scheduledTasks.erase(spill, schedule.scheduledTasks.end());
    qCDebug(lcCore) << "Today's schedule holds" << schedule.scheduledTasks.size() << "segments";
    return schedule;
}

std::vector<data::DaySchedule> AppContext::scheduleDays(const QDateTime &now, int numDays) const
{
    const config::BlockCalendar &calendar = *m_calendar;
    return m_engine.placeContinuous(prioritizedTasks(), planningStart(now), numDays,
                                    [&calendar](const QDate &date) { return calendar.blocksForDate(date); });
}

} // namespace core
} // namespace chronix
