#pragma once

#include <QDateTime>
#include <QString>
#include <memory>

namespace chronix {
namespace data {

struct TaskFields
{
    QString id;
    QString title;
    QString project;
    QString section;
    qint64 estimatedDurationMSecs = 0;
    QDateTime userDeadline;
    QDateTime externalDeadline;
    bool completed = false;
    QString source;
};

// A unit of work, independent of where it came from. Absent deadlines are
// invalid QDateTime values, absent labels are empty strings.
class Task
{
public:
    // Generates an id when none is given. Throws std::invalid_argument when
    // the duration is not positive or a deadline carries no time zone.
    explicit Task(TaskFields fields);

    const QString &id() const { return m_fields.id; }
    const QString &title() const { return m_fields.title; }
    const QString &project() const { return m_fields.project; }
    const QString &section() const { return m_fields.section; }
    qint64 estimatedDurationMSecs() const { return m_fields.estimatedDurationMSecs; }
    const QDateTime &userDeadline() const { return m_fields.userDeadline; }
    const QDateTime &externalDeadline() const { return m_fields.externalDeadline; }
    bool completed() const { return m_fields.completed; }
    const QString &source() const { return m_fields.source; }

    bool hasUserDeadline() const { return m_fields.userDeadline.isValid(); }
    bool hasExternalDeadline() const { return m_fields.externalDeadline.isValid(); }

    // External commitments win over personal ones when both are set.
    QDateTime effectiveDeadline() const;
    bool effectiveDeadlineIsExternal() const { return hasExternalDeadline(); }

    Task withProject(const QString &project) const;
    Task withSection(const QString &section) const;

    const TaskFields &fields() const { return m_fields; }

private:
    TaskFields m_fields;
};

using TaskPtr = std::shared_ptr<const Task>;

TaskPtr makeTask(TaskFields fields);

} // namespace data
} // namespace chronix
