#include "agenda/ui/AgendaFormatter.hpp"

#include <QDateTime>
#include <QLocale>

namespace agenda {
namespace ui {

namespace {
constexpr int TimeWidth = 7;
constexpr int FirstLineTimeWidth = 17;
constexpr int FollowingLineTimeWidth = 31;
} // namespace

QString AgendaFormatter::formatDay(qint64 day)
{
    return QLocale::c().toString(QDateTime::fromSecsSinceEpoch(day, Qt::LocalTime), QStringLiteral("ddd yyyy-MM-dd"));
}

QString AgendaFormatter::formatTime(qint64 instant)
{
    return QLocale::c().toString(QDateTime::fromSecsSinceEpoch(instant, Qt::LocalTime), QStringLiteral("hh:mmAP"));
}

QString AgendaFormatter::decorateSummary(const QString &summary, core::SpanPart span)
{
    switch (span) {
    case core::SpanPart::Start:
        return QStringLiteral("|->") + summary;
    case core::SpanPart::Middle:
        return QStringLiteral("<->") + summary;
    case core::SpanPart::End:
        return QStringLiteral("<-|") + summary;
    case core::SpanPart::None:
        break;
    }
    return summary;
}

AgendaListing AgendaFormatter::format(const core::DayView &view) const
{
    AgendaListing listing;

    for (std::size_t dayIndex = 0; dayIndex < view.days.size(); ++dayIndex) {
        const core::DayBucket &bucket = view.days[dayIndex];
        if (static_cast<int>(dayIndex) == view.todayIndex) {
            listing.currentLine = listing.lines.size();
        }

        const QString dayLabel = formatDay(bucket.day);
        bool firstEvent = true;
        for (const core::DayPlacement &placement : bucket.placements) {
            const data::Entry &entry = placement.occurrence.entry;

            // Date-only events have no time column.
            QString time;
            if (!entry.start.isDate()) {
                const QString startTime = formatTime(entry.start.instant);
                const QString endTime = entry.end ? formatTime(entry.end->instant) : QString();
                time = QStringLiteral("%1 - %2").arg(startTime, TimeWidth).arg(endTime, TimeWidth);
            }
            const QString summary = decorateSummary(entry.summary, placement.span);

            QString line;
            if (firstEvent) {
                line = QStringLiteral("%1 %2 %3").arg(dayLabel).arg(time, FirstLineTimeWidth).arg(summary);
                firstEvent = false;
            } else {
                line = QStringLiteral(" %1 %2").arg(time, FollowingLineTimeWidth).arg(summary);
            }
            listing.lines << line;
            listing.lineEntries.push_back(placement.occurrence);
        }
    }
    return listing;
}

} // namespace ui
} // namespace agenda
