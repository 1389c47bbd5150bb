#pragma once

#include <QString>
#include <vector>

#include "chronix/data/Task.hpp"

namespace chronix {
namespace data {

struct ProjectContext
{
    QString projectId;
    QString projectName;
    QString source = QStringLiteral("file");
    QString documentId;

    // projectId@source
    QString key() const;

    bool operator==(const ProjectContext &other) const
    {
        return projectId == other.projectId && source == other.source;
    }
    bool operator!=(const ProjectContext &other) const { return !(*this == other); }
};

// One project's TODO list together with its identity.
class ProjectTodoList
{
public:
    ProjectTodoList(QString projectName,
                    std::vector<TaskPtr> tasks,
                    QString projectId = QString(),
                    QString source = QStringLiteral("file"),
                    QString documentId = QString());

    const ProjectContext &context() const { return m_context; }
    const std::vector<TaskPtr> &tasks() const { return m_tasks; }
    std::size_t size() const { return m_tasks.size(); }

    static QString normalizeProjectName(const QString &name);

private:
    ProjectContext m_context;
    std::vector<TaskPtr> m_tasks;
};

} // namespace data
} // namespace chronix
