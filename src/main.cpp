#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QStandardPaths>
#include <QTextStream>
#include <QDir>
#include <QDebug>

#include "shelfsync_version.h"
#include "profile.h"
#include "sync/progresssyncengine.h"
#include "sync/httpprogressclient.h"
#include "sync/jsonfilestore.h"

using namespace ShelfSync;

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitSyncFailed = 1,
    ExitUsage = 2
};

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

QString defaultProfilePath()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) {
        base = QDir::home().filePath(".shelfsync");
    }
    return base;
}

void configureLogging(bool verbose, bool quiet)
{
    if (quiet) {
        QLoggingCategory::setFilterRules("*.debug=false\n*.info=false\n*.warning=false");
    } else if (!verbose) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }
}

bool openStore(JsonFileStore &store)
{
    if (!store.load()) {
        err() << "Failed to load progress state from " << store.filePath() << Qt::endl;
        return false;
    }
    return true;
}

// ========== Commands ==========

int runInit(Profile &profile, const QCommandLineParser &parser)
{
    if (parser.isSet("server")) {
        profile.setServerAddress(parser.value("server"));
    }
    if (parser.isSet("token")) {
        profile.setToken(parser.value("token"));
    }
    if (parser.isSet("user")) {
        profile.setUserName(parser.value("user"));
    }

    if (!profile.initialize()) {
        err() << "Failed to initialize profile at " << profile.profilePath() << Qt::endl;
        return ExitSyncFailed;
    }

    out() << "Profile " << profile.name() << " written to " << profile.configFilePath() << Qt::endl;
    if (!profile.hasServer()) {
        out() << "Note: set --server and --token before syncing" << Qt::endl;
    }
    return ExitOk;
}

int runRecord(const Profile &profile, const QStringList &args)
{
    if (args.size() < 2 || args.size() > 3) {
        err() << "Usage: shelfsync record ITEM SECONDS [DURATION]" << Qt::endl;
        return ExitUsage;
    }

    bool ok = false;
    const double seconds = args.at(1).toDouble(&ok);
    if (!ok || seconds < 0.0) {
        err() << "Invalid position: " << args.at(1) << Qt::endl;
        return ExitUsage;
    }

    double duration = 0.0;
    if (args.size() == 3) {
        duration = args.at(2).toDouble(&ok);
        if (!ok || duration < 0.0) {
            err() << "Invalid duration: " << args.at(2) << Qt::endl;
            return ExitUsage;
        }
    }

    JsonFileStore store(profile.stateDirectoryPath());
    if (!openStore(store)) {
        return ExitSyncFailed;
    }

    bool stored = false;
    if (duration > 0.0) {
        ProgressRecord record = ProgressRecord::fromPlayback(args.at(0), seconds);
        record.duration = duration;
        record.isFinished = seconds >= duration;
        stored = store.put(record);
    } else {
        stored = store.recordPlayback(args.at(0), seconds);
    }

    if (!stored) {
        err() << "Failed to store progress for " << args.at(0) << Qt::endl;
        return ExitSyncFailed;
    }

    ProgressRecord record;
    store.get(args.at(0), record);
    out() << "Recorded " << record.description() << Qt::endl;
    return ExitOk;
}

int runStatus(const Profile &profile)
{
    JsonFileStore store(profile.stateDirectoryPath());
    if (!openStore(store)) {
        return ExitSyncFailed;
    }

    out() << "Profile: " << profile.name() << Qt::endl;
    out() << "Server:  " << (profile.completeAddress().isEmpty()
                                 ? QString("(not set)")
                                 : profile.completeAddress().toString()) << Qt::endl;
    out() << "Items:   " << store.count() << " (" << store.pendingCount() << " pending)" << Qt::endl;

    for (const ProgressRecord &record : store.allRecords()) {
        out() << (record.pendingUpload ? "  * " : "    ") << record.description() << Qt::endl;
    }
    return ExitOk;
}

int runSync(const Profile &profile, const QStringList &args, bool singleItem, bool quiet)
{
    if (!profile.hasServer()) {
        err() << "No server configured. Run: shelfsync init --server URL --token TOKEN" << Qt::endl;
        return ExitUsage;
    }
    if (singleItem && args.size() != 1) {
        err() << "Usage: shelfsync sync-item ITEM" << Qt::endl;
        return ExitUsage;
    }

    JsonFileStore store(profile.stateDirectoryPath());
    if (!openStore(store)) {
        return ExitSyncFailed;
    }

    const SyncOptions options = profile.syncOptions();
    HttpProgressClient client(profile.completeAddress(), profile.token(), options.timeoutSeconds);

    ProgressSyncEngine engine(&client, &store);
    engine.setOptions(options);
    engine.setShowErrorNotifications(profile.notifyOnErrors(quiet));

    QObject::connect(&engine, &ProgressSyncEngine::notification, [](const QString &message) {
        err() << "! " << message << Qt::endl;
    });
    QObject::connect(&engine, &ProgressSyncEngine::progressUpdated,
                     [](int current, int total, const QString &message) {
        qInfo().noquote() << QString("[%1/%2] %3").arg(current).arg(total).arg(message);
    });

    if (singleItem) {
        ProgressRecord local;
        if (!store.get(args.at(0), local)) {
            err() << "Unknown item: " << args.at(0) << Qt::endl;
            return ExitUsage;
        }
        const bool success = engine.syncItem(local);
        out() << (success ? "Synced " : "Failed to sync ") << args.at(0) << Qt::endl;
        return success ? ExitOk : ExitSyncFailed;
    }

    const SyncResult result = engine.syncAllPending();
    out() << result.summary() << Qt::endl;
    for (const QString &error : result.errors) {
        out() << "  " << error << Qt::endl;
    }
    return result.allSucceeded() ? ExitOk : ExitSyncFailed;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("ShelfSync");
    app.setApplicationVersion(SHELFSYNC_VERSION_STRING);
    app.setOrganizationName("ShelfSync");

    QCommandLineParser parser;
    parser.setApplicationDescription("Keeps listening progress in step with a library server.");
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOption({"profile", "Profile folder (default: " + defaultProfilePath() + ").", "dir"});
    parser.addOption({{"v", "verbose"}, "Show debug output."});
    parser.addOption({{"q", "quiet"}, "Only print results."});
    parser.addOption({"server", "Server address (init).", "url"});
    parser.addOption({"token", "API token (init).", "token"});
    parser.addOption({"user", "User name (init).", "name"});

    parser.addPositionalArgument("command", "init | record | status | sync | sync-item");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");

    parser.process(app);

    Profile profile(parser.isSet("profile") ? parser.value("profile") : defaultProfilePath());

    configureLogging(parser.isSet("verbose") || profile.debugLogging(), parser.isSet("quiet"));

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(ExitUsage);
    }

    const QString command = positional.takeFirst();
    qDebug() << "[main] ShelfSync" << SHELFSYNC_VERSION_STRING << "command" << command
             << "profile" << profile.profilePath();

    if (command == "init") {
        return runInit(profile, parser);
    }

    if (!profile.exists()) {
        err() << "No profile at " << profile.profilePath() << ". Run: shelfsync init" << Qt::endl;
        return ExitUsage;
    }

    if (command == "record") {
        return runRecord(profile, positional);
    }
    if (command == "status") {
        return runStatus(profile);
    }
    if (command == "sync") {
        return runSync(profile, positional, false, parser.isSet("quiet"));
    }
    if (command == "sync-item") {
        return runSync(profile, positional, true, parser.isSet("quiet"));
    }

    err() << "Unknown command: " << command << Qt::endl;
    return ExitUsage;
}
