#pragma once

#include <QString>
#include <vector>

#include "agenda/data/Record.hpp"

namespace agenda {
namespace data {

class RecordParser
{
public:
    static std::vector<Record> parse(const QString &text, const QString &sourcePath);

private:
    static bool splitLine(const QString &line, QString *key, QString *value);
};

} // namespace data
} // namespace agenda
