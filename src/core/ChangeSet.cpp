#include "recurring/core/ChangeSet.hpp"

#include "recurring/core/ChangeCommand.hpp"

namespace recurring {
namespace core {

ChangeSet::ChangeSet() = default;

ChangeSet::~ChangeSet()
{
    if (!m_committed) {
        rollback();
    }
}

bool ChangeSet::push(std::unique_ptr<ChangeCommand> command)
{
    if (!command || m_committed) {
        return false;
    }
    if (!command->apply()) {
        return false;
    }
    m_commands.push_back(std::move(command));
    return true;
}

bool ChangeSet::push(std::function<bool()> apply, std::function<void()> revert)
{
    return push(std::make_unique<LambdaChangeCommand>(std::move(apply), std::move(revert)));
}

void ChangeSet::addRevert(std::function<void()> revert)
{
    if (m_committed) {
        return;
    }
    m_commands.push_back(std::make_unique<LambdaChangeCommand>(nullptr, std::move(revert)));
}

void ChangeSet::commit()
{
    m_committed = true;
    m_commands.clear();
}

void ChangeSet::rollback()
{
    while (!m_commands.empty()) {
        m_commands.back()->revert();
        m_commands.pop_back();
    }
}

bool ChangeSet::isCommitted() const
{
    return m_committed;
}

std::size_t ChangeSet::count() const
{
    return m_commands.size();
}

} // namespace core
} // namespace recurring
