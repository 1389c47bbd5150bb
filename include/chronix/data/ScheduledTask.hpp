#pragma once

#include <QDateTime>
#include <optional>

#include "chronix/data/Task.hpp"

namespace chronix {
namespace data {

struct SegmentInfo
{
    int index = 1;
    int total = 1;
};

// A placed unit of work, possibly one segment of a task.
class ScheduledTask
{
public:
    // An unsegmented placement must span exactly the task's estimated
    // duration. Throws std::invalid_argument on any violated invariant.
    ScheduledTask(TaskPtr task,
                  QDateTime start,
                  QDateTime end,
                  bool violatesUserDeadline,
                  bool violatesExternalDeadline,
                  std::optional<SegmentInfo> segment = std::nullopt);

    const Task &task() const { return *m_task; }
    const TaskPtr &taskPtr() const { return m_task; }
    const QDateTime &start() const { return m_start; }
    const QDateTime &end() const { return m_end; }
    qint64 durationMSecs() const { return m_start.msecsTo(m_end); }

    bool violatesUserDeadline() const { return m_violatesUserDeadline; }
    bool violatesExternalDeadline() const { return m_violatesExternalDeadline; }

    bool isSegment() const { return m_segment.has_value(); }
    int segmentIndex() const { return m_segment ? m_segment->index : 1; }
    int totalSegments() const { return m_segment ? m_segment->total : 1; }

private:
    TaskPtr m_task;
    QDateTime m_start;
    QDateTime m_end;
    bool m_violatesUserDeadline = false;
    bool m_violatesExternalDeadline = false;
    std::optional<SegmentInfo> m_segment;
};

} // namespace data
} // namespace chronix
