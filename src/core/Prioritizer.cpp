#include "chronix/core/Prioritizer.hpp"

#include "chronix/core/Logging.hpp"

#include <algorithm>

namespace chronix {
namespace core {

namespace {

// Absent deadlines sort as infinitely far away.
bool deadlineLess(const QDateTime &lhs, const QDateTime &rhs)
{
    if (!lhs.isValid()) {
        return false;
    }
    if (!rhs.isValid()) {
        return true;
    }
    return lhs < rhs;
}

void sortByDeadline(std::vector<data::TaskPtr> &tasks, QDateTime (*deadlineOf)(const data::Task &))
{
    std::stable_sort(tasks.begin(), tasks.end(), [deadlineOf](const data::TaskPtr &lhs, const data::TaskPtr &rhs) {
        const QDateTime lhsDeadline = deadlineOf(*lhs);
        const QDateTime rhsDeadline = deadlineOf(*rhs);
        if (lhsDeadline != rhsDeadline) {
            return deadlineLess(lhsDeadline, rhsDeadline);
        }
        if (lhs->estimatedDurationMSecs() != rhs->estimatedDurationMSecs()) {
            return lhs->estimatedDurationMSecs() < rhs->estimatedDurationMSecs();
        }
        return lhs->title() < rhs->title();
    });
}

QDateTime externalDeadlineOf(const data::Task &task)
{
    return task.externalDeadline();
}

QDateTime userDeadlineOf(const data::Task &task)
{
    return task.userDeadline();
}

QDateTime effectiveDeadlineOf(const data::Task &task)
{
    return task.effectiveDeadline();
}

} // namespace

std::vector<data::TaskPtr> Prioritizer::prioritize(const std::vector<data::ProjectTodoList> &projects) const
{
    return prioritize(taskPool(aggregate(projects)));
}

std::vector<data::TaskPtr> Prioritizer::prioritize(const std::vector<data::TaskPtr> &pool) const
{
    std::vector<data::TaskPtr> hardDeadline;
    std::vector<data::TaskPtr> softDeadline;
    std::vector<data::TaskPtr> noDeadline;
    std::vector<data::TaskPtr> completedWithMetadata;
    std::vector<data::TaskPtr> completedWithoutMetadata;

    for (const data::TaskPtr &task : pool) {
        if (!task) {
            continue;
        }
        if (task->completed()) {
            if (task->estimatedDurationMSecs() > 0) {
                completedWithMetadata.push_back(task);
            } else {
                completedWithoutMetadata.push_back(task);
            }
        } else if (task->hasExternalDeadline()) {
            hardDeadline.push_back(task);
        } else if (task->hasUserDeadline()) {
            softDeadline.push_back(task);
        } else {
            noDeadline.push_back(task);
        }
    }

    sortByDeadline(hardDeadline, &externalDeadlineOf);
    sortByDeadline(softDeadline, &userDeadlineOf);
    std::stable_sort(noDeadline.begin(), noDeadline.end(), [](const data::TaskPtr &lhs, const data::TaskPtr &rhs) {
        if (lhs->estimatedDurationMSecs() != rhs->estimatedDurationMSecs()) {
            return lhs->estimatedDurationMSecs() < rhs->estimatedDurationMSecs();
        }
        return lhs->title() < rhs->title();
    });
    std::stable_sort(completedWithMetadata.begin(), completedWithMetadata.end(),
                     [](const data::TaskPtr &lhs, const data::TaskPtr &rhs) {
        if (lhs->estimatedDurationMSecs() != rhs->estimatedDurationMSecs()) {
            return lhs->estimatedDurationMSecs() < rhs->estimatedDurationMSecs();
        }
        const QDateTime lhsDeadline = effectiveDeadlineOf(*lhs);
        const QDateTime rhsDeadline = effectiveDeadlineOf(*rhs);
        if (lhsDeadline != rhsDeadline) {
            return deadlineLess(lhsDeadline, rhsDeadline);
        }
        return lhs->title() < rhs->title();
    });
    std::stable_sort(completedWithoutMetadata.begin(), completedWithoutMetadata.end(),
                     [](const data::TaskPtr &lhs, const data::TaskPtr &rhs) {
        return lhs->title() < rhs->title();
    });

    qCDebug(lcCore) << "Prioritized" << pool.size() << "tasks:" << hardDeadline.size() << "hard,"
                    << softDeadline.size() << "soft," << noDeadline.size() << "undeadlined,"
                    << completedWithMetadata.size() + completedWithoutMetadata.size() << "completed";

    std::vector<data::TaskPtr> ordered;
    ordered.reserve(pool.size());
    for (auto *tier : { &hardDeadline, &softDeadline, &noDeadline, &completedWithMetadata, &completedWithoutMetadata }) {
        ordered.insert(ordered.end(), tier->begin(), tier->end());
    }
    return ordered;
}

std::vector<AggregatedTask> Prioritizer::aggregate(const std::vector<data::ProjectTodoList> &projects) const
{
    std::vector<AggregatedTask> aggregated;
    for (const data::ProjectTodoList &list : projects) {
        for (const data::TaskPtr &task : list.tasks()) {
            if (!task) {
                continue;
            }
            AggregatedTask entry;
            entry.project = list.context();
            if (task->project().isEmpty()) {
                entry.task = std::make_shared<const data::Task>(task->withProject(list.context().projectName));
            } else {
                entry.task = task;
            }
            aggregated.push_back(std::move(entry));
        }
    }
    return aggregated;
}

std::vector<data::TaskPtr> Prioritizer::taskPool(const std::vector<AggregatedTask> &aggregated)
{
    std::vector<data::TaskPtr> pool;
    pool.reserve(aggregated.size());
    for (const AggregatedTask &entry : aggregated) {
        pool.push_back(entry.task);
    }
    return pool;
}

QMap<QString, std::vector<data::TaskPtr>> Prioritizer::tasksByProject(const std::vector<AggregatedTask> &aggregated)
{
    QMap<QString, std::vector<data::TaskPtr>> byProject;
    for (const AggregatedTask &entry : aggregated) {
        byProject[entry.project.key()].push_back(entry.task);
    }
    return byProject;
}

std::vector<data::ProjectContext> Prioritizer::projects(const std::vector<AggregatedTask> &aggregated)
{
    std::vector<data::ProjectContext> unique;
    for (const AggregatedTask &entry : aggregated) {
        if (std::find(unique.begin(), unique.end(), entry.project) == unique.end()) {
            unique.push_back(entry.project);
        }
    }
    return unique;
}

} // namespace core
} // namespace chronix
