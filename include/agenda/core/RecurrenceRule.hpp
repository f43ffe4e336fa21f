#pragma once

#include <QString>
#include <optional>

#include "agenda/data/TemporalValue.hpp"

namespace agenda {
namespace core {

// FREQ, INTERVAL, UNTIL and COUNT of an RRULE value. Other parts are ignored.
struct RecurrenceRule
{
    data::Frequency frequency = data::Frequency::Unknown;
    int interval = 1;
    std::optional<qint64> until; // inclusive
    std::optional<int> count;

    static RecurrenceRule parse(const QString &text);
};

} // namespace core
} // namespace agenda
