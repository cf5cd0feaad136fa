// Tunables for the job queue, persisted under the "Jobs" settings group.
#pragma once
#include <QString>

#include <cstddef>

class QSettings;

namespace nmf {

struct JobManagerOptions {
    static constexpr int kDefaultHistoryMax = 100;
    static constexpr int kDefaultCopyBufferKiB = 1024;

    int historyMax = kDefaultHistoryMax; // terminal jobs kept for display
    int copyBufferKiB = kDefaultCopyBufferKiB;
    QString tempSuffix = QStringLiteral(".part");
    bool debugLog = false;

    std::size_t copyBufferBytes() const {
        return static_cast<std::size_t>(copyBufferKiB) * 1024;
    }

    // Clamps out-of-range values and replaces an unusable temp suffix.
    JobManagerOptions normalized() const;

    // Reads Jobs/* keys; NMF_JOBS_DEBUG overrides Jobs/debugLog.
    static JobManagerOptions fromSettings(QSettings &s);
    // Options from the application-wide settings store.
    static JobManagerOptions load();

    void save(QSettings &s) const;
};

} // namespace nmf
