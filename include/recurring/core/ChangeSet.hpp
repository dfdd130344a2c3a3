#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace recurring {
namespace core {

class ChangeCommand;

// Applies commands one by one and reverts the applied ones, newest first,
// unless commit() is reached.
class ChangeSet
{
public:
    ChangeSet();
    ~ChangeSet();

    ChangeSet(const ChangeSet &) = delete;
    ChangeSet &operator=(const ChangeSet &) = delete;

    // Applies the command. A command that fails is not recorded.
    bool push(std::unique_ptr<ChangeCommand> command);
    bool push(std::function<bool()> apply, std::function<void()> revert);
    // Records the compensation for a change the caller has already made.
    void addRevert(std::function<void()> revert);

    void commit();
    void rollback();
    bool isCommitted() const;
    std::size_t count() const;

private:
    std::vector<std::unique_ptr<ChangeCommand>> m_commands;
    bool m_committed = false;
};

} // namespace core
} // namespace recurring
