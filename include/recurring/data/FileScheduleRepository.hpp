#pragma once

#include <memory>
#include <optional>

#include "recurring/data/FileScheduleStorage.hpp"
#include "recurring/data/InMemoryScheduleRepository.hpp"

namespace recurring {
namespace data {

// Keeps the schedule in memory and writes it back after every successful change,
// or once per batch. A change that cannot be written is undone and reported as failed.
class FileScheduleRepository : public InMemoryScheduleRepository
{
public:
    explicit FileScheduleRepository(std::shared_ptr<FileScheduleStorage> storage);
    ~FileScheduleRepository() override = default;

    std::optional<SeriesGroup> addGroup(SeriesGroup group) override;
    bool updateGroup(const SeriesGroup &group) override;
    bool removeGroup(qint64 id) override;

    std::optional<Series> addSeries(Series series) override;
    bool updateSeries(const Series &series) override;
    bool removeSeries(qint64 id, const SeriesDeletionKey &key) override;

    std::optional<Instance> addInstance(Instance instance) override;
    bool updateInstance(const Instance &instance) override;
    bool removeInstance(qint64 id) override;

    void beginBatch() override;
    bool commitBatch() override;
    void endBatch() override;

private:
    // State to fall back to if the next write fails. Empty inside a batch.
    std::optional<ScheduleSnapshot> rollbackPoint() const;
    bool persist(const std::optional<ScheduleSnapshot> &before);

    std::shared_ptr<FileScheduleStorage> m_storage;
    int m_batchDepth = 0;
    bool m_dirty = false;
};

} // namespace data
} // namespace recurring
