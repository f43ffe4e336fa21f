#pragma once

#include <QString>
#include <QtGlobal>
#include <limits>
#include <optional>

namespace agenda {
namespace data {

enum class Precision
{
    Date,
    DateTime,
};

enum class Frequency
{
    Unknown,
    Daily,
    Weekly,
    Monthly,
    Yearly,
};

// Floating local time: no time zone is attached to the instant.
struct TemporalValue
{
    Precision precision = Precision::DateTime;
    qint64 instant = 0; // seconds since epoch; local midnight for Date values

    bool isDate() const { return precision == Precision::Date; }
};

inline bool operator==(const TemporalValue &lhs, const TemporalValue &rhs)
{
    return lhs.precision == rhs.precision && lhs.instant == rhs.instant;
}

inline bool operator!=(const TemporalValue &lhs, const TemporalValue &rhs)
{
    return !(lhs == rhs);
}

constexpr int MinYear = 1;
constexpr int MaxYear = 9999;
// Returned by advance() when the result leaves the supported years.
constexpr qint64 BeyondRangeEarlier = std::numeric_limits<qint64>::min();
constexpr qint64 BeyondRangeLater = std::numeric_limits<qint64>::max();

// Accepts YYYYMMDD and YYYYMMDDTHHMMSS (a trailing 'Z' is ignored).
std::optional<TemporalValue> parseTemporalValue(const QString &value, QString *error = nullptr);

Frequency frequencyFromString(const QString &value);

qint64 localInstant(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);
qint64 startOfDay(qint64 instant);

// Calendar field arithmetic. Overflowing days roll into the following month,
// e.g. Jan 31 + 1 month is Mar 2 (or Mar 3 in a non leap year). Results past
// year 9999 saturate to BeyondRangeLater, before year 1 to BeyondRangeEarlier.
qint64 advance(qint64 instant, int interval, Frequency unit);

} // namespace data
} // namespace agenda
