#include "chronix/data/TimeBlock.hpp"

#include "chronix/core/TimeUtils.hpp"

#include <stdexcept>

namespace chronix {
namespace data {

QString kindToString(BlockKind kind)
{
    switch (kind) {
    case BlockKind::Sleep:
        return QStringLiteral("sleep");
    case BlockKind::Break:
        return QStringLiteral("break");
    case BlockKind::Meeting:
        return QStringLiteral("meeting");
    case BlockKind::Blocked:
    default:
        return QStringLiteral("blocked");
    }
}

std::optional<BlockKind> kindFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("sleep")) {
        return BlockKind::Sleep;
    }
    if (normalized == QLatin1String("break")) {
        return BlockKind::Break;
    }
    if (normalized == QLatin1String("meeting")) {
        return BlockKind::Meeting;
    }
    if (normalized == QLatin1String("blocked")) {
        return BlockKind::Blocked;
    }
    return std::nullopt;
}

TimeBlock::TimeBlock(QDateTime start, QDateTime end, BlockKind kind, QString label)
    : m_start(std::move(start))
    , m_end(std::move(end))
    , m_kind(kind)
    , m_label(std::move(label))
{
    if (!core::isZoneAware(m_start) || !core::isZoneAware(m_end)) {
        throw std::invalid_argument("time block start and end must be timezone-aware");
    }
    if (m_start >= m_end) {
        throw std::invalid_argument("time block start must be before end");
    }
}

} // namespace data
} // namespace chronix
