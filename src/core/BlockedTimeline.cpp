#include "chronix/core/BlockedTimeline.hpp"

#include <algorithm>

namespace chronix {
namespace core {

BlockedTimeline::BlockedTimeline(std::vector<data::TimeBlock> blocks)
    : m_blocks(std::move(blocks))
{
    std::stable_sort(m_blocks.begin(), m_blocks.end(), [](const data::TimeBlock &lhs, const data::TimeBlock &rhs) {
        return lhs.start() < rhs.start();
    });
}

QDateTime BlockedTimeline::skipBlocked(const QDateTime &instant) const
{
    // Sorted by start and the cursor only moves forward, so one pass also
    // walks through chains of overlapping intervals.
    QDateTime cursor = instant;
    for (const data::TimeBlock &block : m_blocks) {
        if (block.start() > cursor) {
            break;
        }
        if (block.contains(cursor)) {
            cursor = block.end();
        }
    }
    return cursor;
}

QDateTime BlockedTimeline::nextBlockStart(const QDateTime &instant) const
{
    const auto it = std::upper_bound(m_blocks.begin(), m_blocks.end(), instant,
                                     [](const QDateTime &value, const data::TimeBlock &block) {
        return value < block.start();
    });
    if (it == m_blocks.end()) {
        return QDateTime();
    }
    return it->start();
}

QDateTime BlockedTimeline::estimateCompletion(const QDateTime &from, qint64 remainingMSecs) const
{
    QDateTime cursor = from;
    qint64 left = remainingMSecs;
    while (true) {
        cursor = skipBlocked(cursor);
        const QDateTime next = nextBlockStart(cursor);
        if (!next.isValid() || cursor.msecsTo(next) >= left) {
            return cursor.addMSecs(left);
        }
        left -= cursor.msecsTo(next);
        cursor = next;
    }
}

} // namespace core
} // namespace chronix
