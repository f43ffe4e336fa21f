#pragma once

#include <QMetaType>
#include <QtGlobal>
#include <vector>

#include "agenda/core/Occurrence.hpp"
#include "agenda/core/Settings.hpp"
#include "agenda/data/Entry.hpp"

namespace agenda {
namespace core {

// Position of a day within a multi-day, date-only occurrence.
enum class SpanPart
{
    None,
    Start,
    Middle,
    End,
};

struct DayPlacement
{
    Occurrence occurrence;
    SpanPart span = SpanPart::None;
};

struct DayBucket
{
    qint64 day = 0; // local midnight
    std::vector<DayPlacement> placements;
};

struct DayView
{
    std::vector<DayBucket> days; // ascending by day
    int todayIndex = -1;         // index into days, -1 when today has no bucket
};

class DayProjector
{
public:
    explicit DayProjector(const Settings &settings = Settings());

    DayView project(const std::vector<data::Entry> &entries, qint64 windowStart, qint64 windowEnd, qint64 now) const;

    static SpanPart classify(const data::Entry &occurrence, qint64 day);
    static qint64 lastDay(const data::Entry &occurrence);

private:
    std::vector<Occurrence> expandAll(const std::vector<data::Entry> &entries, qint64 windowStart, qint64 windowEnd) const;

    int m_maxOccurrencesPerEntry;
    int m_totalBudget;
};

DayView buildDayView(const std::vector<data::Entry> &entries, qint64 windowStart, qint64 windowEnd);

} // namespace core
} // namespace agenda

Q_DECLARE_METATYPE(agenda::core::DayView)
