#include "chronix/data/Task.hpp"

#include "chronix/core/TimeUtils.hpp"

#include <QUuid>
#include <stdexcept>
#include <string>

namespace chronix {
namespace data {

namespace {
void requireAwareDeadline(const QDateTime &deadline, const char *name)
{
    if (deadline.isValid() && !core::isZoneAware(deadline)) {
        throw std::invalid_argument(std::string(name) + " must be timezone-aware");
    }
}
} // namespace

Task::Task(TaskFields fields)
    : m_fields(std::move(fields))
{
    if (m_fields.id.isEmpty()) {
        m_fields.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
    if (m_fields.estimatedDurationMSecs <= 0) {
        throw std::invalid_argument("estimated duration must be positive");
    }
    requireAwareDeadline(m_fields.userDeadline, "user deadline");
    requireAwareDeadline(m_fields.externalDeadline, "external deadline");
}

QDateTime Task::effectiveDeadline() const
{
    if (hasExternalDeadline()) {
        return m_fields.externalDeadline;
    }
    return m_fields.userDeadline;
}

Task Task::withProject(const QString &project) const
{
    TaskFields copy = m_fields;
    copy.project = project;
    return Task(std::move(copy));
}

Task Task::withSection(const QString &section) const
{
    TaskFields copy = m_fields;
    copy.section = section;
    return Task(std::move(copy));
}

TaskPtr makeTask(TaskFields fields)
{
    return std::make_shared<const Task>(std::move(fields));
}

} // namespace data
} // namespace chronix
