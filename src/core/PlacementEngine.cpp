#include "chronix/core/PlacementEngine.hpp"

#include "chronix/core/BlockedTimeline.hpp"
#include "chronix/core/DayPartitioner.hpp"
#include "chronix/core/Errors.hpp"
#include "chronix/core/Logging.hpp"
#include "chronix/core/TimeUtils.hpp"

#include <algorithm>
#include <optional>

namespace chronix {
namespace core {

namespace {

struct RawSegment
{
    std::size_t taskIndex = 0;
    QDateTime start;
    QDateTime end;
};

// Working state of one placement run: remaining work per task and a single
// cursor instant.
class PlacementRun
{
public:
    PlacementRun(std::vector<data::TaskPtr> tasks, const QDateTime &start, const BlockedTimeline &timeline)
        : m_tasks(std::move(tasks))
        , m_cursor(start)
        , m_timeline(timeline)
    {
        m_remaining.reserve(m_tasks.size());
        for (const data::TaskPtr &task : m_tasks) {
            m_remaining.push_back(task->estimatedDurationMSecs());
        }
    }

    bool hasRemainingWork() const
    {
        return std::any_of(m_remaining.begin(), m_remaining.end(), [](qint64 left) { return left > 0; });
    }

    std::optional<std::size_t> selectNext()
    {
        m_cursor = m_timeline.skipBlocked(m_cursor);

        std::vector<std::size_t> ranking;
        std::vector<qint64> scores(m_tasks.size(), 0);
        for (std::size_t i = 0; i < m_tasks.size(); ++i) {
            if (m_remaining[i] > 0) {
                scores[i] = urgencyScore(i);
                ranking.push_back(i);
            }
        }
        if (ranking.empty()) {
            return std::nullopt;
        }
        std::stable_sort(ranking.begin(), ranking.end(), [&scores](std::size_t lhs, std::size_t rhs) {
            return scores[lhs] < scores[rhs];
        });

        for (std::size_t candidate : ranking) {
            if (isSafe(candidate)) {
                return candidate;
            }
        }
        qCDebug(lcCore) << "No safe candidate at" << m_cursor << "- placing most urgent"
                        << m_tasks[ranking.front()]->title();
        return ranking.front();
    }

    void placeSegment(std::size_t index)
    {
        const QDateTime start = m_timeline.skipBlocked(m_cursor);
        const QDateTime nextBlock = m_timeline.nextBlockStart(start);
        qint64 length = m_remaining[index];
        if (nextBlock.isValid()) {
            length = std::min(length, start.msecsTo(nextBlock));
        }
        const QDateTime end = start.addMSecs(length);
        m_segments.push_back(RawSegment{ index, start, end });
        m_remaining[index] -= length;
        m_cursor = end;
        qCDebug(lcCore) << "Placed" << m_tasks[index]->title() << start << "->" << end
                        << "remaining" << m_remaining[index] << "ms";
    }

    const std::vector<data::TaskPtr> &tasks() const { return m_tasks; }
    const std::vector<qint64> &remaining() const { return m_remaining; }
    const std::vector<RawSegment> &segments() const { return m_segments; }

private:
    qint64 urgencyScore(std::size_t index) const
    {
        const data::Task &task = *m_tasks[index];
        const QDateTime deadline = task.effectiveDeadline();
        if (!deadline.isValid()) {
            return PlacementEngine::NoDeadlineOffsetMSecs + m_remaining[index];
        }
        if (deadline <= m_cursor) {
            return -PlacementEngine::NoDeadlineOffsetMSecs;
        }
        qint64 slack = m_timeline.estimateCompletion(m_cursor, m_remaining[index]).msecsTo(deadline);
        if (task.effectiveDeadlineIsExternal()) {
            slack = slack >= 0 ? slack / 2 : slack * 2;
        }
        return std::min(slack, PlacementEngine::NoDeadlineOffsetMSecs - 1);
    }

    // Running the candidate to completion must not make another still
    // reachable deadline unreachable.
    bool isSafe(std::size_t candidate) const
    {
        const QDateTime candidateFinish = m_timeline.estimateCompletion(m_cursor, m_remaining[candidate]);
        for (std::size_t other = 0; other < m_tasks.size(); ++other) {
            if (other == candidate || m_remaining[other] <= 0) {
                continue;
            }
            const data::Task &task = *m_tasks[other];
            const QDateTime deadline = task.effectiveDeadline();
            if (!deadline.isValid() || deadline <= m_cursor) {
                continue;
            }
            if (m_timeline.estimateCompletion(m_cursor, m_remaining[other]) > deadline) {
                continue;
            }
            // User and external deadlines are protected alike once they
            // would become unreachable.
            const qint64 slackAfter =
                m_timeline.estimateCompletion(candidateFinish, m_remaining[other]).msecsTo(deadline);
            if (slackAfter < 0) {
                return false;
            }
        }
        return true;
    }

    std::vector<data::TaskPtr> m_tasks;
    std::vector<qint64> m_remaining;
    std::vector<RawSegment> m_segments;
    QDateTime m_cursor;
    const BlockedTimeline &m_timeline;
};

QString deadlineConflict(const data::Task &task, const QDateTime &completion, const char *kind, const QDateTime &deadline)
{
    return QStringLiteral("Task '%1' ends at %2 but %3 deadline is %4")
        .arg(task.title(), formatTimestamp(completion), QString::fromLatin1(kind), formatTimestamp(deadline));
}

void validateInput(const std::vector<data::TaskPtr> &tasks,
                   const QDateTime &start,
                   const std::vector<data::TimeBlock> &blocked)
{
    if (!isZoneAware(start)) {
        throw InvalidInputError("start time must be timezone-aware");
    }
    for (const data::TimeBlock &block : blocked) {
        if (!isZoneAware(block.start()) || !isZoneAware(block.end())) {
            throw InvalidInputError("all blocked time must be timezone-aware");
        }
    }
    for (const data::TaskPtr &task : tasks) {
        if (!task) {
            throw InvalidInputError("task list must not contain null tasks");
        }
    }
}

} // namespace

data::DaySchedule PlacementEngine::place(const std::vector<data::TaskPtr> &tasks,
                                         const QDateTime &start,
                                         std::vector<data::TimeBlock> blocked) const
{
    validateInput(tasks, start, blocked);

    const BlockedTimeline timeline(std::move(blocked));

    std::vector<data::TaskPtr> pending;
    for (const data::TaskPtr &task : tasks) {
        if (!task->completed()) {
            pending.push_back(task);
        }
    }

    // Every step either finishes a task or stops at a distinct blocked start.
    const std::size_t stepLimit = m_maxSteps > 0 ? static_cast<std::size_t>(m_maxSteps)
                                                 : pending.size() + timeline.blocks().size() + 1;

    PlacementRun run(std::move(pending), start, timeline);
    std::size_t steps = 0;
    bool exhausted = false;
    while (run.hasRemainingWork()) {
        if (steps >= stepLimit) {
            exhausted = true;
            break;
        }
        const std::optional<std::size_t> next = run.selectNext();
        if (!next) {
            exhausted = true;
            break;
        }
        run.placeSegment(*next);
        ++steps;
    }
    if (exhausted) {
        qCWarning(lcCore) << "Placement stopped after" << steps << "steps with work left";
    }

    data::DaySchedule schedule;
    schedule.date = start.date();
    schedule.blockedTime = timeline.blocks();

    std::vector<std::vector<const RawSegment *>> byTask(run.tasks().size());
    for (const RawSegment &segment : run.segments()) {
        byTask[segment.taskIndex].push_back(&segment);
    }

    for (std::size_t i = 0; i < run.tasks().size(); ++i) {
        const data::TaskPtr &task = run.tasks()[i];
        const qint64 left = run.remaining()[i];
        auto &segments = byTask[i];
        if (left > 0) {
            schedule.conflicts << QStringLiteral("Scheduling stopped early: '%1' has %2 min unscheduled")
                                      .arg(task->title())
                                      .arg(left / (60 * 1000));
        }
        if (segments.empty()) {
            continue;
        }
        std::stable_sort(segments.begin(), segments.end(), [](const RawSegment *lhs, const RawSegment *rhs) {
            return lhs->start < rhs->start;
        });

        const bool finished = left <= 0;
        const QDateTime completion = segments.back()->end;
        const bool violatesUser =
            task->hasUserDeadline() && (!finished || completion > task->userDeadline());
        const bool violatesExternal =
            task->hasExternalDeadline() && (!finished || completion > task->externalDeadline());

        if (finished && violatesUser) {
            schedule.conflicts << deadlineConflict(*task, completion, "user", task->userDeadline());
        }
        if (finished && violatesExternal) {
            schedule.conflicts << deadlineConflict(*task, completion, "external", task->externalDeadline());
        }

        // An unfinished task is never a whole placement, even in one piece.
        const bool segmented = segments.size() > 1 || !finished;
        const int total = static_cast<int>(segments.size());
        for (int k = 0; k < total; ++k) {
            std::optional<data::SegmentInfo> info;
            if (segmented) {
                info = data::SegmentInfo{ k + 1, total };
            }
            schedule.scheduledTasks.emplace_back(task, segments[k]->start, segments[k]->end,
                                                 violatesUser, violatesExternal, info);
        }
    }

    std::stable_sort(schedule.scheduledTasks.begin(), schedule.scheduledTasks.end(),
                     [](const data::ScheduledTask &lhs, const data::ScheduledTask &rhs) {
        return lhs.start() < rhs.start();
    });

    qCDebug(lcCore) << "Placed" << schedule.scheduledTasks.size() << "segments with"
                    << schedule.conflicts.size() << "conflicts";
    return schedule;
}

std::vector<data::DaySchedule> PlacementEngine::placeContinuous(const std::vector<data::TaskPtr> &tasks,
                                                                const QDateTime &start,
                                                                int numDays,
                                                                const BlockedTimeProvider &blockedForDay) const
{
    if (numDays < 1) {
        throw InvalidInputError("number of days must be positive");
    }
    if (!isZoneAware(start)) {
        throw InvalidInputError("start time must be timezone-aware");
    }

    const QDate firstDay = start.date();
    std::vector<data::TimeBlock> blocked;
    if (blockedForDay) {
        for (int offset = 0; offset <= numDays; ++offset) {
            const std::vector<data::TimeBlock> dayBlocks = blockedForDay(firstDay.addDays(offset));
            blocked.insert(blocked.end(), dayBlocks.begin(), dayBlocks.end());
        }
    }

    const data::DaySchedule continuous = place(tasks, start, std::move(blocked));
    return DayPartitioner().partition(continuous, firstDay, numDays);
}

void PlacementEngine::setMaxSteps(int maxSteps)
{
    m_maxSteps = std::max(0, maxSteps);
}

int PlacementEngine::maxSteps() const
{
    return m_maxSteps;
}

} // namespace core
} // namespace chronix
