#include "agenda/data/TemporalValue.hpp"

#include <QDate>
#include <QDateTime>
#include <QRegularExpression>
#include <QTime>

namespace agenda {
namespace data {

namespace {
const QString InvalidDateFormat = QStringLiteral("invalid date format");

QDateTime toLocal(qint64 instant)
{
    return QDateTime::fromSecsSinceEpoch(instant, Qt::LocalTime);
}

// Recomposes calendar fields the way mktime does: month overflow carries into
// the year and day overflow carries into the following months. Results outside
// the supported years saturate to BeyondRangeEarlier/BeyondRangeLater.
qint64 compose(qint64 year, qint64 month, qint64 day, const QTime &time)
{
    qint64 normalizedYear = year + (month - 1) / 12;
    qint64 normalizedMonth = (month - 1) % 12;
    if (normalizedMonth < 0) {
        normalizedMonth += 12;
        --normalizedYear;
    }
    if (normalizedYear < MinYear) {
        return BeyondRangeEarlier;
    }
    if (normalizedYear > MaxYear) {
        return BeyondRangeLater;
    }

    const QDate date = QDate(static_cast<int>(normalizedYear), static_cast<int>(normalizedMonth) + 1, 1).addDays(day - 1);
    if (!date.isValid() || date.year() > MaxYear) {
        return day > 0 ? BeyondRangeLater : BeyondRangeEarlier;
    }
    if (date.year() < MinYear) {
        return BeyondRangeEarlier;
    }
    const QDateTime composed(date, time, Qt::LocalTime);
    if (!composed.isValid()) {
        return day > 0 ? BeyondRangeLater : BeyondRangeEarlier;
    }
    return composed.toSecsSinceEpoch();
}

std::optional<TemporalValue> fail(QString *error)
{
    if (error) {
        *error = InvalidDateFormat;
    }
    return std::nullopt;
}
} // namespace

std::optional<TemporalValue> parseTemporalValue(const QString &value, QString *error)
{
    static const QRegularExpression pattern(
        QStringLiteral("^(\\d{4})(\\d{2})(\\d{2})(?:T(\\d{2})(\\d{2})(\\d{2})Z?)?$"));

    const QRegularExpressionMatch match = pattern.match(value.trimmed());
    if (!match.hasMatch()) {
        return fail(error);
    }

    const QDate date(match.captured(1).toInt(), match.captured(2).toInt(), match.captured(3).toInt());
    if (!date.isValid()) {
        return fail(error);
    }

    TemporalValue result;
    if (match.captured(4).isEmpty()) {
        result.precision = Precision::Date;
        result.instant = date.startOfDay(Qt::LocalTime).toSecsSinceEpoch();
        return result;
    }

    const QTime time(match.captured(4).toInt(), match.captured(5).toInt(), match.captured(6).toInt());
    if (!time.isValid()) {
        return fail(error);
    }
    result.precision = Precision::DateTime;
    result.instant = QDateTime(date, time, Qt::LocalTime).toSecsSinceEpoch();
    return result;
}

Frequency frequencyFromString(const QString &value)
{
    if (value == QLatin1String("DAILY")) {
        return Frequency::Daily;
    }
    if (value == QLatin1String("WEEKLY")) {
        return Frequency::Weekly;
    }
    if (value == QLatin1String("MONTHLY")) {
        return Frequency::Monthly;
    }
    if (value == QLatin1String("YEARLY")) {
        return Frequency::Yearly;
    }
    return Frequency::Unknown;
}

qint64 localInstant(int year, int month, int day, int hour, int minute, int second)
{
    return compose(year, month, day, QTime(hour, minute, second));
}

qint64 startOfDay(qint64 instant)
{
    if (instant == BeyondRangeLater || instant == BeyondRangeEarlier) {
        return instant;
    }
    return toLocal(instant).date().startOfDay(Qt::LocalTime).toSecsSinceEpoch();
}

qint64 advance(qint64 instant, int interval, Frequency unit)
{
    if (instant == BeyondRangeLater || instant == BeyondRangeEarlier) {
        return instant;
    }
    const QDateTime local = toLocal(instant);
    const QDate date = local.date();
    qint64 year = date.year();
    qint64 month = date.month();
    qint64 day = date.day();
    const qint64 step = interval;

    switch (unit) {
    case Frequency::Daily:
        day += step;
        break;
    case Frequency::Weekly:
        day += step * 7;
        break;
    case Frequency::Monthly:
        month += step;
        break;
    case Frequency::Yearly:
        year += step;
        break;
    case Frequency::Unknown:
        return instant;
    }
    return compose(year, month, day, local.time());
}

} // namespace data
} // namespace agenda
