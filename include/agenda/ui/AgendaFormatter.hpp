#pragma once

#include <QStringList>
#include <QtGlobal>
#include <vector>

#include "agenda/core/DayProjector.hpp"

namespace agenda {
namespace ui {

struct AgendaListing
{
    QStringList lines;
    std::vector<core::Occurrence> lineEntries; // one per line
    int currentLine = -1;                      // first line of today, -1 if none
};

class AgendaFormatter
{
public:
    AgendaListing format(const core::DayView &view) const;

    static QString formatDay(qint64 day);
    static QString formatTime(qint64 instant);
    static QString decorateSummary(const QString &summary, core::SpanPart span);
};

} // namespace ui
} // namespace agenda
