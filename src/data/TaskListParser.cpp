#include "chronix/data/TaskListParser.hpp"

#include "chronix/core/Logging.hpp"

#include <QRegularExpression>
#include <QStringList>

namespace chronix {
namespace data {

namespace {
constexpr int RAW_TEXT_LIMIT = 100;

struct CheckboxLine
{
    QString text;
    bool checked = false;
};

std::optional<CheckboxLine> splitCheckbox(const QString &line)
{
    static const QRegularExpression checkboxPattern(QStringLiteral("^\\s*[-*]\\s+\\[([ xX])\\]\\s*(.*)$"));
    const QRegularExpressionMatch match = checkboxPattern.match(line);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    CheckboxLine result;
    result.checked = match.captured(1).compare(QLatin1String("x"), Qt::CaseInsensitive) == 0;
    result.text = match.captured(2).trimmed();
    return result;
}
} // namespace

const QString TaskListParser::HeaderLine = QStringLiteral("TASKS ::: duration; external_deadline; user_deadline");

TaskParseError::TaskParseError(const QString &message, const QString &rawText, const QString &field, const QString &value)
    : std::runtime_error(describe(message, rawText, field, value))
    , m_message(message)
    , m_rawText(rawText)
    , m_field(field)
    , m_value(value)
{
}

std::string TaskParseError::describe(const QString &message, const QString &rawText, const QString &field, const QString &value)
{
    QStringList parts{ message };
    if (!field.isEmpty()) {
        parts << QStringLiteral("Field: %1").arg(field);
    }
    if (!value.isNull()) {
        parts << QStringLiteral("Value: '%1'").arg(value);
    }
    if (!rawText.isEmpty()) {
        const QString text = rawText.size() <= RAW_TEXT_LIMIT ? rawText : rawText.left(RAW_TEXT_LIMIT - 3) + QStringLiteral("...");
        parts << QStringLiteral("Raw text: '%1'").arg(text);
    }
    return parts.join(QStringLiteral(" | ")).toStdString();
}

std::optional<Task> TaskListParser::parseTaskLine(const QString &line, const QString &source) const
{
    const std::optional<CheckboxLine> checkbox = splitCheckbox(line);
    if (!checkbox || checkbox->text.isEmpty() || checkbox->text == HeaderLine) {
        return std::nullopt;
    }
    const QString &text = checkbox->text;

    static const QRegularExpression metadataPattern(QStringLiteral("^(.*?)\\s*:::\\s*(.+)$"));
    const QRegularExpressionMatch match = metadataPattern.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    const QString title = match.captured(1).trimmed();
    const QString metadata = match.captured(2).trimmed();
    QStringList parts = metadata.split(QLatin1Char(';'));
    for (QString &part : parts) {
        part = part.trimmed();
    }
    if (parts.size() != 3) {
        throw TaskParseError(QStringLiteral("Invalid metadata format: expected 3 fields, got %1. "
                                            "Format: duration ; external_deadline ; user_deadline")
                                 .arg(parts.size()),
                             text, QStringLiteral("metadata"), metadata);
    }

    TaskFields fields;
    fields.title = title;
    fields.estimatedDurationMSecs = parseDuration(parts.at(0), text);
    fields.externalDeadline = parseDeadline(parts.at(1), QStringLiteral("external_deadline"), text);
    fields.userDeadline = parseDeadline(parts.at(2), QStringLiteral("user_deadline"), text);
    fields.completed = checkbox->checked;
    fields.source = source;
    return Task(std::move(fields));
}

std::vector<Task> TaskListParser::parseDocument(const QString &text, const QString &source) const
{
    std::vector<Task> tasks;
    QString section;
    QString normalized = text;
    normalized.replace('\r', QString());
    const QStringList lines = normalized.split('\n');
    for (const QString &line : lines) {
        const QString trimmed = line.trimmed();
        if (trimmed.startsWith(QLatin1String("##"))) {
            int level = 0;
            while (level < trimmed.size() && trimmed.at(level) == QLatin1Char('#')) {
                ++level;
            }
            section = trimmed.mid(level).trimmed();
            continue;
        }
        try {
            std::optional<Task> task = parseTaskLine(line, source);
            if (!task) {
                continue;
            }
            tasks.push_back(section.isEmpty() ? std::move(*task) : task->withSection(section));
        } catch (const TaskParseError &error) {
            qCDebug(lcData) << "Skipping task line:" << error.what();
        } catch (const std::invalid_argument &error) {
            qCDebug(lcData) << "Skipping invalid task:" << error.what() << trimmed;
        }
    }
    return tasks;
}

qint64 TaskListParser::parseDuration(const QString &value, const QString &rawText)
{
    if (value == QLatin1String("-")) {
        throw TaskParseError(QStringLiteral("Duration cannot be unspecified (use a value, not '-')"),
                             rawText, QStringLiteral("duration"), value);
    }

    static const QRegularExpression durationPattern(QStringLiteral("^(\\d+)(hours?|minutes?)$"),
                                                    QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch match = durationPattern.match(value);
    if (!match.hasMatch()) {
        throw TaskParseError(QStringLiteral("Invalid duration format: '%1'. "
                                            "Expected format: <number>hours or <number>minutes")
                                 .arg(value),
                             rawText, QStringLiteral("duration"), value);
    }

    bool ok = false;
    const qint64 amount = match.captured(1).toLongLong(&ok);
    if (!ok || amount <= 0) {
        throw TaskParseError(QStringLiteral("Duration must be positive, got %1").arg(match.captured(1)),
                             rawText, QStringLiteral("duration"), value);
    }

    const QString unit = match.captured(2).toLower();
    const qint64 unitMSecs = unit.startsWith(QLatin1String("hour")) ? 60 * 60 * 1000 : 60 * 1000;
    if (amount > MaxDurationMSecs / unitMSecs) {
        throw TaskParseError(QStringLiteral("Duration %1 exceeds the supported maximum of %2 minutes")
                                 .arg(value)
                                 .arg(MaxDurationMSecs / (60 * 1000)),
                             rawText, QStringLiteral("duration"), value);
    }
    return amount * unitMSecs;
}

QDateTime TaskListParser::parseDeadline(const QString &value, const QString &field, const QString &rawText)
{
    if (value == QLatin1String("-")) {
        return QDateTime();
    }

    QDateTime deadline = QDateTime::fromString(value, Qt::ISODate);
    if (!deadline.isValid()) {
        throw TaskParseError(QStringLiteral("Invalid deadline format: '%1'. Expected ISO-8601 format "
                                            "(e.g., 2026-01-09T12:00 or 2026-01-09T12:00+00:00)")
                                 .arg(value),
                             rawText, field, value);
    }
    // Deadlines written without a zone are read as UTC.
    if (deadline.timeSpec() == Qt::LocalTime) {
        deadline.setTimeSpec(Qt::UTC);
    }
    return deadline;
}

} // namespace data
} // namespace chronix
