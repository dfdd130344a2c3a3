#include "recurring/data/InMemoryJobQueue.hpp"

#include <QMutexLocker>

namespace recurring {
namespace data {

bool InMemoryJobQueue::enqueue(const ExpansionJob &job)
{
    QMutexLocker locker(&m_mutex);
    if (m_rejecting || job.seriesId <= 0 || !job.expandUntil.isValid()) {
        return false;
    }
    m_jobs.enqueue(job);
    return true;
}

std::optional<ExpansionJob> InMemoryJobQueue::takeNext()
{
    QMutexLocker locker(&m_mutex);
    if (m_jobs.isEmpty()) {
        return std::nullopt;
    }
    return m_jobs.dequeue();
}

int InMemoryJobQueue::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_jobs.size();
}

void InMemoryJobQueue::setRejecting(bool rejecting)
{
    QMutexLocker locker(&m_mutex);
    m_rejecting = rejecting;
}

} // namespace data
} // namespace recurring
