#include "agenda/core/DayProjector.hpp"

#include "agenda/core/Logging.hpp"
#include "agenda/core/RecurrenceExpander.hpp"

#include <QDateTime>
#include <algorithm>
#include <iterator>
#include <map>

namespace agenda {
namespace core {

DayProjector::DayProjector(const Settings &settings)
    : m_maxOccurrencesPerEntry(settings.maxOccurrencesPerEntry)
    , m_totalBudget(settings.totalExpansionBudget)
{
}

std::vector<Occurrence> DayProjector::expandAll(const std::vector<data::Entry> &entries,
                                                qint64 windowStart,
                                                qint64 windowEnd) const
{
    std::vector<data::Entry> exceptions;
    std::vector<const data::Entry *> baseEntries;
    for (const data::Entry &entry : entries) {
        if (entry.isException()) {
            exceptions.push_back(entry);
        } else {
            baseEntries.push_back(&entry);
        }
    }

    const RecurrenceExpander expander(m_maxOccurrencesPerEntry);
    std::vector<Occurrence> occurrences;
    int remaining = m_totalBudget;
    for (const data::Entry *entry : baseEntries) {
        if (remaining <= 0) {
            qCWarning(lcAgendaRecurrence) << "Expansion budget of" << m_totalBudget
                                          << "candidates exhausted, skipping remaining entries";
            break;
        }
        // Candidates skipped before the window are charged as well.
        int candidates = 0;
        auto expanded = expander.expand(*entry, exceptions, windowStart, windowEnd, remaining, &candidates);
        remaining -= std::max(candidates, static_cast<int>(expanded.size()));
        std::move(expanded.begin(), expanded.end(), std::back_inserter(occurrences));
    }
    return occurrences;
}

DayView DayProjector::project(const std::vector<data::Entry> &entries,
                              qint64 windowStart,
                              qint64 windowEnd,
                              qint64 now) const
{
    std::vector<Occurrence> occurrences = expandAll(entries, windowStart, windowEnd);
    std::stable_sort(occurrences.begin(), occurrences.end(), [](const Occurrence &lhs, const Occurrence &rhs) {
        return lhs.start().instant < rhs.start().instant;
    });

    // A day belongs to the window when any part of it does.
    const qint64 firstDay = data::startOfDay(windowStart);
    std::map<qint64, DayBucket> buckets;

    for (const Occurrence &occurrence : occurrences) {
        const qint64 start = occurrence.start().instant;
        if (start > windowEnd || start < windowStart) {
            continue;
        }

        qint64 day = data::startOfDay(start);
        do {
            if (day > windowEnd) {
                break;
            }
            if (day >= firstDay) {
                DayBucket &bucket = buckets[day];
                bucket.day = day;
                bucket.placements.push_back(DayPlacement{ occurrence, classify(occurrence.entry, day) });
            }
            day = data::startOfDay(data::advance(day, 1, data::Frequency::Daily));
        } while (occurrence.end() && day < occurrence.end()->instant);
    }

    DayView view;
    view.days.reserve(buckets.size());
    const qint64 today = data::startOfDay(now);
    for (auto &[day, bucket] : buckets) {
        if (day == today) {
            view.todayIndex = static_cast<int>(view.days.size());
        }
        view.days.push_back(std::move(bucket));
    }
    return view;
}

qint64 DayProjector::lastDay(const data::Entry &occurrence)
{
    if (!occurrence.end || occurrence.end->instant <= occurrence.start.instant) {
        return data::startOfDay(occurrence.start.instant);
    }
    // The end is exclusive: a date-only end at midnight belongs to the previous day.
    return data::startOfDay(occurrence.end->instant - 1);
}

SpanPart DayProjector::classify(const data::Entry &occurrence, qint64 day)
{
    if (!occurrence.start.isDate()) {
        return SpanPart::None;
    }
    const qint64 first = occurrence.start.instant;
    const qint64 last = lastDay(occurrence);
    if (last <= first) {
        return SpanPart::None;
    }
    if (day == first) {
        return SpanPart::Start;
    }
    if (day == last) {
        return SpanPart::End;
    }
    if (day > first && day < last) {
        return SpanPart::Middle;
    }
    return SpanPart::None;
}

DayView buildDayView(const std::vector<data::Entry> &entries, qint64 windowStart, qint64 windowEnd)
{
    return DayProjector().project(entries, windowStart, windowEnd, QDateTime::currentSecsSinceEpoch());
}

} // namespace core
} // namespace agenda
