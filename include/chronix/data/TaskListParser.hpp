#pragma once

#include <QString>
#include <optional>
#include <stdexcept>
#include <vector>

#include "chronix/data/Task.hpp"

namespace chronix {
namespace data {

class TaskParseError : public std::runtime_error
{
public:
    TaskParseError(const QString &message,
                   const QString &rawText = QString(),
                   const QString &field = QString(),
                   const QString &value = QString());

    const QString &message() const { return m_message; }
    const QString &rawText() const { return m_rawText; }
    const QString &field() const { return m_field; }
    const QString &value() const { return m_value; }

private:
    static std::string describe(const QString &message, const QString &rawText, const QString &field, const QString &value);

    QString m_message;
    QString m_rawText;
    QString m_field;
    QString m_value;
};

// Reads checkbox task lines of the form
//   - [ ] title ::: duration ; external_deadline ; user_deadline
// where a checked box ("[x]") marks the task completed and "-" leaves a
// deadline unset.
class TaskListParser
{
public:
    static const QString HeaderLine;
    // Ten years; longer estimates are rejected.
    static constexpr qint64 MaxDurationMSecs = qint64(10) * 365 * 24 * 60 * 60 * 1000;

    // nullopt for lines that are not task lines. Throws TaskParseError for
    // task lines with broken metadata.
    std::optional<Task> parseTaskLine(const QString &line, const QString &source = QStringLiteral("file")) const;

    // Parses a whole document. "## Heading" lines set the section of the
    // tasks below them; task lines with broken metadata are skipped.
    std::vector<Task> parseDocument(const QString &text, const QString &source = QStringLiteral("file")) const;

    static qint64 parseDuration(const QString &value, const QString &rawText = QString());
    static QDateTime parseDeadline(const QString &value, const QString &field, const QString &rawText = QString());
};

} // namespace data
} // namespace chronix
