#pragma once

#include <functional>
#include <utility>

namespace recurring {
namespace core {

class ChangeCommand
{
public:
    virtual ~ChangeCommand() = default;
    // Returns false when nothing was changed.
    virtual bool apply() = 0;
    virtual void revert() = 0;
};

class LambdaChangeCommand : public ChangeCommand
{
public:
    LambdaChangeCommand(std::function<bool()> apply, std::function<void()> revert)
        : m_apply(std::move(apply))
        , m_revert(std::move(revert))
    {
    }

    bool apply() override { return m_apply ? m_apply() : false; }
    void revert() override
    {
        if (m_revert) {
            m_revert();
        }
    }

private:
    std::function<bool()> m_apply;
    std::function<void()> m_revert;
};

} // namespace core
} // namespace recurring
