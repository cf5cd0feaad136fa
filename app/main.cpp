// nmf-jobs: queue a copy or move through the background job manager and
// report its progress on the terminal.
#include "JobFormat.hpp"
#include "JobLogging.hpp"
#include "JobManager.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QSettings>
#include <QTextStream>

#include <cstdlib>
#include <mutex>
#include <unordered_map>

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("nmf");
    QCoreApplication::setApplicationName("nmf-jobs");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Copy or move files in the background job queue.");
    parser.addHelpOption();
    QCommandLineOption moveOpt(QStringList{"m", "move"},
                               "Move sources instead of copying them.");
    QCommandLineOption debugOpt(QStringList{"d", "debug"},
                                "Trace every filesystem operation.");
    QCommandLineOption historyOpt(
        "history", "Number of finished jobs to keep (default from settings).",
        "n");
    parser.addOption(moveOpt);
    parser.addOption(debugOpt);
    parser.addOption(historyOpt);
    parser.addPositionalArgument("destination", "Destination directory.");
    parser.addPositionalArgument("sources", "Files or folders to transfer.",
                                 "<source>...");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    QTextStream err(stderr);
    if (args.size() < 2) {
        err << "nmf-jobs: need a destination and at least one source\n";
        parser.showHelp(EXIT_FAILURE);
    }

    QSettings settings("nmf", "nmf");
    nmf::JobManagerOptions opt = nmf::JobManagerOptions::fromSettings(settings);
    if (parser.isSet(debugOpt))
        opt.debugLog = true;
    if (parser.isSet(historyOpt)) {
        bool ok = false;
        const int n = parser.value(historyOpt).toInt(&ok);
        if (!ok || n < 1) {
            err << "nmf-jobs: invalid --history value: "
                << parser.value(historyOpt) << "\n";
            return EXIT_FAILURE;
        }
        opt.historyMax = n;
    }
    nmf::enableJobsDebugLogging(opt.debugLog);

    const QString dest = QFileInfo(args.first()).absoluteFilePath();
    QStringList sources;
    for (int i = 1; i < args.size(); ++i)
        sources << QFileInfo(args.at(i)).absoluteFilePath();

    // Declared before the manager so they outlive its worker thread.
    std::mutex outMtx;
    std::unordered_map<quint64, QString> lastLine;
    QTextStream out(stdout);

    nmf::JobManager manager(opt);

    // Subscribers run on the worker and on this thread; print each job's
    // summary only when it changes.
    manager.subscribe([&]() {
        const auto jobs = manager.list();
        std::lock_guard<std::mutex> lk(outMtx);
        for (const auto &job : jobs) {
            const QString line = nmf::formatJobSummary(job);
            QString &prev = lastLine[job.id];
            if (prev == line)
                continue;
            prev = line;
            out << line << "\n";
            out.flush();
        }
    });

    if (parser.isSet(moveOpt))
        manager.enqueueMove(sources, dest);
    else
        manager.enqueueCopy(sources, dest);

    manager.waitForIdle();

    bool allCompleted = true;
    const auto jobs = manager.list();
    std::lock_guard<std::mutex> lk(outMtx);
    for (const auto &job : jobs) {
        out << nmf::formatJobDetails(job);
        if (job.status != nmf::JobStatus::Completed)
            allCompleted = false;
    }
    out.flush();
    return allCompleted ? EXIT_SUCCESS : EXIT_FAILURE;
}
