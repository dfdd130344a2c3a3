#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>

namespace recurring {
namespace data {

struct SeriesGroup
{
    qint64 id = 0;
    QString displayName;
    QString description;
    QString color; // "#RRGGBB" or empty
    QUuid createdBy;
    QDateTime createdAt;
    QDateTime updatedAt;
};

} // namespace data
} // namespace recurring
