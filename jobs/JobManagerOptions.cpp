#include "JobManagerOptions.hpp"
#include "nmf/RuntimeLogging.hpp"

#include <QSettings>

#include <algorithm>

namespace nmf {

JobManagerOptions JobManagerOptions::normalized() const {
    JobManagerOptions o = *this;
    o.historyMax = std::clamp(o.historyMax, 1, 10000);
    o.copyBufferKiB = std::clamp(o.copyBufferKiB, 4, 64 * 1024);
    if (o.tempSuffix.isEmpty() || o.tempSuffix.contains('/'))
        o.tempSuffix = QStringLiteral(".part");
    return o;
}

JobManagerOptions JobManagerOptions::fromSettings(QSettings &s) {
    JobManagerOptions o;
    o.historyMax = s.value("Jobs/historyMax", kDefaultHistoryMax).toInt();
    o.copyBufferKiB =
        s.value("Jobs/copyBufferKiB", kDefaultCopyBufferKiB).toInt();
    o.tempSuffix = s.value("Jobs/tempSuffix", o.tempSuffix).toString();
    o.debugLog = s.value("Jobs/debugLog", false).toBool();
    if (jobsDebugRequested())
        o.debugLog = true;
    else if (jobsDebugSuppressed())
        o.debugLog = false;
    return o.normalized();
}

JobManagerOptions JobManagerOptions::load() {
    QSettings s("nmf", "nmf");
    return fromSettings(s);
}

void JobManagerOptions::save(QSettings &s) const {
    const JobManagerOptions o = normalized();
    s.setValue("Jobs/historyMax", o.historyMax);
    s.setValue("Jobs/copyBufferKiB", o.copyBufferKiB);
    s.setValue("Jobs/tempSuffix", o.tempSuffix);
    s.setValue("Jobs/debugLog", o.debugLog);
}

} // namespace nmf
