#pragma once

#include <QDateTime>
#include <vector>

#include "chronix/data/TimeBlock.hpp"

namespace chronix {
namespace core {

// Blocked intervals sorted by start. Overlapping and touching intervals are
// allowed and behave like their union.
class BlockedTimeline
{
public:
    explicit BlockedTimeline(std::vector<data::TimeBlock> blocks);

    const std::vector<data::TimeBlock> &blocks() const { return m_blocks; }

    // First instant at or after `instant` that lies outside every interval.
    QDateTime skipBlocked(const QDateTime &instant) const;

    // Start of the first interval beginning strictly after `instant`, or an
    // invalid QDateTime when there is none.
    QDateTime nextBlockStart(const QDateTime &instant) const;

    // Instant at which `remainingMSecs` of work started at `from` finishes.
    QDateTime estimateCompletion(const QDateTime &from, qint64 remainingMSecs) const;

private:
    std::vector<data::TimeBlock> m_blocks;
};

} // namespace core
} // namespace chronix
