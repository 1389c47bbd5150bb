#pragma once

#include <QString>
#include <optional>

#include "chronix/data/ProjectTodoList.hpp"
#include "chronix/data/TaskListParser.hpp"

namespace chronix {
namespace data {

// Loads one project's task list from a UTF-8 text file. The project is named
// by the first "# Title" line, or by the file's base name.
class TaskFileSource
{
public:
    explicit TaskFileSource(QString source = QStringLiteral("file"));

    std::optional<ProjectTodoList> load(const QString &filePath) const;
    ProjectTodoList fromText(const QString &text, const QString &fallbackName, const QString &documentId = QString()) const;

private:
    QString m_source;
    TaskListParser m_parser;
};

} // namespace data
} // namespace chronix
