#pragma once

#include <QDateTime>
#include <QStringList>
#include <memory>
#include <optional>
#include <vector>

#include "chronix/config/Settings.hpp"
#include "chronix/core/PlacementEngine.hpp"
#include "chronix/core/Prioritizer.hpp"
#include "chronix/data/DaySchedule.hpp"
#include "chronix/data/ProjectTodoList.hpp"

namespace chronix {
namespace config {
class BlockCalendar;
}

namespace core {

// A task's origin and where it stands in the prioritized queue.
struct TaskExplanation
{
    data::TaskPtr task;
    data::ProjectContext project;
    // 1-based among incomplete tasks, 0 for a completed task.
    int position = 0;
    int queueLength = 0;
};

// Settings plus the project lists loaded for one session.
class AppContext
{
public:
    explicit AppContext(config::Settings settings = config::Settings());
    ~AppContext();

    const config::Settings &settings() const;
    const config::BlockCalendar &calendar() const;

    // Returns the number of files that could be read.
    int loadTaskFiles(const QStringList &paths);
    void addProject(data::ProjectTodoList project);
    const std::vector<data::ProjectTodoList> &projects() const;

    std::vector<data::TaskPtr> prioritizedTasks() const;
    std::optional<TaskExplanation> explainTask(const QString &taskId) const;

    // `now` in any zone; it is converted to the configured one.
    QDateTime planningStart(const QDateTime &now) const;
    data::DaySchedule scheduleToday(const QDateTime &now) const;
    std::vector<data::DaySchedule> scheduleDays(const QDateTime &now, int numDays) const;

private:
    config::Settings m_settings;
    std::unique_ptr<config::BlockCalendar> m_calendar;
    std::vector<data::ProjectTodoList> m_projects;
    Prioritizer m_prioritizer;
    PlacementEngine m_engine;
};

} // namespace core
} // namespace chronix
