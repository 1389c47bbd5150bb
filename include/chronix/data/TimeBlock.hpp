#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

namespace chronix {
namespace data {

enum class BlockKind
{
    Sleep,
    Break,
    Meeting,
    Blocked,
};

QString kindToString(BlockKind kind);
std::optional<BlockKind> kindFromString(const QString &value);

// A reserved interval that cannot host work.
class TimeBlock
{
public:
    // Throws std::invalid_argument unless both ends are timezone-aware and
    // start < end.
    TimeBlock(QDateTime start, QDateTime end, BlockKind kind, QString label = QString());

    const QDateTime &start() const { return m_start; }
    const QDateTime &end() const { return m_end; }
    BlockKind kind() const { return m_kind; }
    const QString &label() const { return m_label; }

    qint64 durationMSecs() const { return m_start.msecsTo(m_end); }
    bool contains(const QDateTime &instant) const { return m_start <= instant && instant < m_end; }
    bool overlaps(const QDateTime &start, const QDateTime &end) const { return start < m_end && m_start < end; }

private:
    QDateTime m_start;
    QDateTime m_end;
    BlockKind m_kind = BlockKind::Blocked;
    QString m_label;
};

} // namespace data
} // namespace chronix
