// Runs one job's sources through the local transfer engine.
#pragma once
#include "JobTypes.hpp"
#include "nmf/LocalTransfer.hpp"

#include <functional>

namespace nmf {

class Job;

class JobExecutor {
public:
    using NotifyFn = std::function<void()>;

    // `transfer.mode` is overridden per job from its type.
    JobExecutor(const TransferOptions &transfer, NotifyFn notify);

    // Processes sources in order and stops at the first failure or cancel.
    // Progress fields of `job` are updated as items complete.
    JobOutcome run(Job &job);

private:
    TransferOptions transfer_;
    NotifyFn notify_;
};

} // namespace nmf
