#include "chronix/data/ProjectTodoList.hpp"

#include <QStringList>

namespace chronix {
namespace data {

QString ProjectContext::key() const
{
    return QStringLiteral("%1@%2").arg(projectId, source);
}

ProjectTodoList::ProjectTodoList(QString projectName,
                                 std::vector<TaskPtr> tasks,
                                 QString projectId,
                                 QString source,
                                 QString documentId)
    : m_tasks(std::move(tasks))
{
    m_context.projectId = projectId.isEmpty() ? normalizeProjectName(projectName) : std::move(projectId);
    m_context.projectName = std::move(projectName);
    m_context.source = std::move(source);
    m_context.documentId = std::move(documentId);
}

QString ProjectTodoList::normalizeProjectName(const QString &name)
{
    const QString lowered = name.trimmed().toLower();
    QString normalized;
    normalized.reserve(lowered.size());
    for (const QChar ch : lowered) {
        if (ch.isLetterOrNumber() || ch == QLatin1Char('-') || ch == QLatin1Char('_')) {
            normalized.append(ch);
        } else {
            normalized.append(QLatin1Char('_'));
        }
    }
    // Collapse runs of underscores and drop them at both ends.
    const QStringList parts = normalized.split(QLatin1Char('_'), Qt::SkipEmptyParts);
    normalized = parts.join(QLatin1Char('_'));
    if (normalized.isEmpty()) {
        return QStringLiteral("unnamed_project");
    }
    return normalized;
}

} // namespace data
} // namespace chronix
