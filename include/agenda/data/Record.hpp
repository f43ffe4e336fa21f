#pragma once

#include <QHash>
#include <QString>

namespace agenda {
namespace data {

// Raw key/value fields of one BEGIN:VEVENT ... END:VEVENT block.
struct Record
{
    QString sourcePath;
    QHash<QString, QString> fields;

    bool contains(const QString &key) const { return fields.contains(key); }
    QString value(const QString &key) const { return fields.value(key); }
};

} // namespace data
} // namespace agenda
