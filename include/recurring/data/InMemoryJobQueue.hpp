#pragma once

#include <optional>

#include <QMutex>
#include <QQueue>

#include "recurring/data/ExpansionJobSink.hpp"

namespace recurring {
namespace data {

class InMemoryJobQueue : public ExpansionJobSink
{
public:
    InMemoryJobQueue() = default;
    ~InMemoryJobQueue() override = default;

    bool enqueue(const ExpansionJob &job) override;

    std::optional<ExpansionJob> takeNext();
    int size() const;

    // Makes every following enqueue() fail until reset, for exercising rollback paths.
    void setRejecting(bool rejecting);

private:
    mutable QMutex m_mutex;
    QQueue<ExpansionJob> m_jobs;
    bool m_rejecting = false;
};

} // namespace data
} // namespace recurring
