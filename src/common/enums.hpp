#pragma once

namespace engage {

enum class ConflictPolicy {
    Replace,
    Keep
};

enum class TaskState {
    Idle,
    Queued,
    Running,
    Failed
};

enum class SyncOutcomeKind {
    Success,
    RetryableFailure,
    UnrecoverableFailure
};

enum class ConfirmResult {
    Removed,
    Superseded
};

} // namespace engage
