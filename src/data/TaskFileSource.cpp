#include "chronix/data/TaskFileSource.hpp"

#include "chronix/core/Logging.hpp"

#include <QFile>
#include <QFileInfo>
#include <QStringList>
#include <QTextStream>

namespace chronix {
namespace data {

namespace {
QString documentTitle(const QString &text)
{
    const QStringList lines = text.split('\n');
    for (const QString &line : lines) {
        const QString trimmed = line.trimmed();
        if (trimmed.startsWith(QLatin1String("# "))) {
            return trimmed.mid(2).trimmed();
        }
    }
    return QString();
}
} // namespace

TaskFileSource::TaskFileSource(QString source)
    : m_source(std::move(source))
{
}

std::optional<ProjectTodoList> TaskFileSource::load(const QString &filePath) const
{
    QFile file(filePath);
    if (!file.exists()) {
        qCWarning(lcData) << "Task file" << filePath << "does not exist";
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcData) << "Could not open task file" << filePath << "for reading";
        return std::nullopt;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    const QString text = stream.readAll();

    const QFileInfo info(filePath);
    ProjectTodoList list = fromText(text, info.completeBaseName(), info.absoluteFilePath());
    qCDebug(lcData) << "Loaded" << list.size() << "tasks from" << filePath;
    return list;
}

ProjectTodoList TaskFileSource::fromText(const QString &text, const QString &fallbackName, const QString &documentId) const
{
    QString name = documentTitle(text);
    if (name.isEmpty()) {
        name = fallbackName;
    }

    std::vector<TaskPtr> tasks;
    for (Task &task : m_parser.parseDocument(text, m_source)) {
        tasks.push_back(std::make_shared<const Task>(std::move(task)));
    }
    return ProjectTodoList(name, std::move(tasks), QString(), m_source, documentId);
}

} // namespace data
} // namespace chronix
