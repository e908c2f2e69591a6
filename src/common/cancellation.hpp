#pragma once

#include <atomic>
#include <memory>

namespace engage {

// Shared cancellation flag. The scheduler owns the source side and hands
// tokens to launchers; long calls poll isCancelled() at their wait points.
class CancellationToken {
public:
    CancellationToken()
        : m_flag(std::make_shared<std::atomic<bool>>(false))
    {
    }

    bool isCancelled() const
    {
        return m_flag->load();
    }

    void cancel() const
    {
        m_flag->store(true);
    }

    // A token that never reports cancellation unless cancel() is called on it.
    static CancellationToken none()
    {
        return CancellationToken();
    }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace engage
