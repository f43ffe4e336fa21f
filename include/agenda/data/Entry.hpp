#pragma once

#include <QString>
#include <optional>

#include "agenda/data/TemporalValue.hpp"

namespace agenda {
namespace data {

struct Entry
{
    TemporalValue start;
    std::optional<TemporalValue> end; // exclusive
    std::optional<QString> recurrenceRule;
    QString summary;
    std::optional<TemporalValue> recurrenceId;
    QString sourcePath;

    // Exceptions replace a single occurrence of another entry and are never expanded themselves.
    bool isException() const { return recurrenceId.has_value(); }
};

} // namespace data
} // namespace agenda
