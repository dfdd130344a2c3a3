#pragma once

#include <QDateTime>

namespace recurring {
namespace data {

// Unit of work for the asynchronous expansion worker.
struct ExpansionJob
{
    qint64 seriesId = 0;
    QDateTime expandUntil;
};

class ExpansionJobSink
{
public:
    virtual ~ExpansionJobSink() = default;

    virtual bool enqueue(const ExpansionJob &job) = 0;
};

} // namespace data
} // namespace recurring
