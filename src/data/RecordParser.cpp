#include "agenda/data/RecordParser.hpp"

#include <QRegularExpression>
#include <QStringList>
#include <optional>

namespace agenda {
namespace data {

namespace {
constexpr auto BEGIN_MARKER = "BEGIN:VEVENT";
constexpr auto END_MARKER = "END:VEVENT";
} // namespace

std::vector<Record> RecordParser::parse(const QString &text, const QString &sourcePath)
{
    static const QRegularExpression lineBreak(QStringLiteral("[\\r\\n]+"));

    std::vector<Record> records;
    std::optional<Record> current;

    const QStringList lines = text.split(lineBreak, Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        if (line.startsWith(QLatin1String(BEGIN_MARKER))) {
            current = Record{};
            current->sourcePath = sourcePath;
            continue;
        }
        if (line.startsWith(QLatin1String(END_MARKER))) {
            if (current) {
                records.push_back(std::move(*current));
                current.reset();
            }
            continue;
        }
        if (!current) {
            continue;
        }

        QString key;
        QString value;
        if (splitLine(line, &key, &value)) {
            current->fields.insert(key, value);
        }
    }
    return records;
}

// "KEY;PARAM=X:VALUE" yields KEY and VALUE; parameters are dropped.
bool RecordParser::splitLine(const QString &line, QString *key, QString *value)
{
    const int colonIndex = line.indexOf(':');
    if (colonIndex < 0) {
        return false;
    }
    int keyEnd = line.indexOf(';');
    if (keyEnd < 0 || keyEnd > colonIndex) {
        keyEnd = colonIndex;
    }
    if (keyEnd == 0) {
        return false;
    }
    *key = line.left(keyEnd);
    *value = line.mid(colonIndex + 1);
    return true;
}

} // namespace data
} // namespace agenda
