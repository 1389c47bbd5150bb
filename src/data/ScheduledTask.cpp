#include "chronix/data/ScheduledTask.hpp"

#include "chronix/core/TimeUtils.hpp"

#include <stdexcept>

namespace chronix {
namespace data {

ScheduledTask::ScheduledTask(TaskPtr task,
                             QDateTime start,
                             QDateTime end,
                             bool violatesUserDeadline,
                             bool violatesExternalDeadline,
                             std::optional<SegmentInfo> segment)
    : m_task(std::move(task))
    , m_start(std::move(start))
    , m_end(std::move(end))
    , m_violatesUserDeadline(violatesUserDeadline)
    , m_violatesExternalDeadline(violatesExternalDeadline)
    , m_segment(segment)
{
    if (!m_task) {
        throw std::invalid_argument("scheduled task requires a task");
    }
    if (!core::isZoneAware(m_start) || !core::isZoneAware(m_end)) {
        throw std::invalid_argument("scheduled start and end must be timezone-aware");
    }
    if (m_start >= m_end) {
        throw std::invalid_argument("scheduled start must be before end");
    }
    if (!m_segment && m_start.msecsTo(m_end) != m_task->estimatedDurationMSecs()) {
        throw std::invalid_argument("duration must equal the task's estimated duration");
    }
    if (m_segment && (m_segment->index < 1 || m_segment->index > m_segment->total)) {
        throw std::invalid_argument("segment index must be between 1 and total segments");
    }
}

} // namespace data
} // namespace chronix
