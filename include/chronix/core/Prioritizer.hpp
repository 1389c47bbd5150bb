#pragma once

#include <QMap>
#include <QString>
#include <vector>

#include "chronix/data/ProjectTodoList.hpp"

namespace chronix {
namespace core {

struct AggregatedTask
{
    data::TaskPtr task;
    data::ProjectContext project;
};

// Builds the baseline scheduling order across projects: hard deadlines,
// then soft deadlines, then undeadlined work, with completed tasks last.
class Prioritizer
{
public:
    std::vector<data::TaskPtr> prioritize(const std::vector<data::ProjectTodoList> &projects) const;
    std::vector<data::TaskPtr> prioritize(const std::vector<data::TaskPtr> &pool) const;

    // Tasks without a project label get the name of the list they came from.
    // Input lists are left untouched.
    std::vector<AggregatedTask> aggregate(const std::vector<data::ProjectTodoList> &projects) const;

    static std::vector<data::TaskPtr> taskPool(const std::vector<AggregatedTask> &aggregated);
    static QMap<QString, std::vector<data::TaskPtr>> tasksByProject(const std::vector<AggregatedTask> &aggregated);
    static std::vector<data::ProjectContext> projects(const std::vector<AggregatedTask> &aggregated);
};

} // namespace core
} // namespace chronix
