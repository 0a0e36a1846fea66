// Application entry point: headless front end that queues transfers against a
// local-directory object store and waits until the queue drains.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QTextStream>
#include <memory>
#include "JsonHistoryLog.hpp"
#include "QtLocalFileSystem.hpp"
#include "TransferManager.hpp"
#include "TransferQueue.hpp"
#include "TransferSettings.hpp"
#include "opens3/LocalDirTransferEngine.hpp"

namespace {

void printItem(QTextStream& out, const opens3::TransferItem& t) {
    out << opens3::toString(t.spec.direction) << ' '
        << QString::fromStdString(t.spec.fileName) << ": "
        << opens3::toString(t.status);
    if (t.error) out << " (" << QString::fromStdString(t.error->message) << ')';
    if (!t.resultPath.empty()) out << " -> " << QString::fromStdString(t.resultPath);
    out << Qt::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("OpenS3");
    QCoreApplication::setOrganizationName("OpenS3");

    QCommandLineParser parser;
    parser.setApplicationDescription("Queue uploads and downloads between local files and a bucket.");
    parser.addHelpOption();
    parser.addPositionalArgument("command", "upload | download | download-folder");
    parser.addPositionalArgument("args", "Files to upload, keys to download, or a folder prefix.", "[args...]");
    QCommandLineOption rootOpt("root", "Directory that holds the buckets.", "dir", QDir::currentPath());
    QCommandLineOption accountOpt("account", "Account id recorded in the history.", "id", "local");
    QCommandLineOption bucketOpt("bucket", "Bucket name.", "name");
    QCommandLineOption prefixOpt("prefix", "Key prefix for uploads.", "prefix");
    QCommandLineOption destOpt("dest", "Download directory (overrides settings).", "dir");
    QCommandLineOption maxUpOpt("max-uploads", "Concurrent uploads (overrides settings).", "n");
    QCommandLineOption maxDownOpt("max-downloads", "Concurrent downloads (overrides settings).", "n");
    QCommandLineOption historyOpt("history", "History file (overrides settings).", "file");
    parser.addOptions({rootOpt, accountOpt, bucketOpt, prefixOpt, destOpt, maxUpOpt, maxDownOpt, historyOpt});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream errOut(stderr);
    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) parser.showHelp(1);
    const QString command = args.front();
    const QStringList rest = args.mid(1);

    TransferSettings settings = TransferSettings::load();
    if (parser.isSet(destOpt)) settings.downloadDir = parser.value(destOpt);
    if (parser.isSet(maxUpOpt)) settings.maxConcurrentUploads = qMax(1, parser.value(maxUpOpt).toInt());
    if (parser.isSet(maxDownOpt)) settings.maxConcurrentDownloads = qMax(1, parser.value(maxDownOpt).toInt());
    if (parser.isSet(historyOpt)) settings.historyPath = parser.value(historyOpt);

    QtLocalFileSystem fs;
    opens3::LocalDirTransferEngine engine(parser.value(rootOpt).toStdString());
    std::unique_ptr<JsonHistoryLog> history;
    if (!settings.historyPath.isEmpty()) history = std::make_unique<JsonHistoryLog>(settings.historyPath);

    TransferManager mgr(engine, fs, history.get(), settings);
    mgr.setAccount(parser.value(accountOpt), parser.value(bucketOpt));

    int failures = 0;
    QObject::connect(&mgr, &TransferManager::transferFinished, &app, [&](const QString& id) {
        for (TransferQueue* q : {mgr.uploads(), mgr.downloads()}) {
            if (auto item = q->store().find(id.toStdString())) {
                if (item->status != opens3::TransferStatus::Completed) ++failures;
                printItem(out, *item);
            }
        }
        if (!mgr.busy()) QMetaObject::invokeMethod(&app, []() { QCoreApplication::quit(); }, Qt::QueuedConnection);
    });

    QString err;
    bool ok = false;
    if (command == "upload") {
        ok = mgr.enqueueUploadFiles(rest, parser.value(prefixOpt), err);
    } else if (command == "download") {
        ok = mgr.enqueueDownloads(rest, err);
    } else if (command == "download-folder" && rest.size() == 1) {
        ok = mgr.enqueueFolderDownload(rest.front(), err);
    } else {
        parser.showHelp(1);
    }
    if (!err.isEmpty()) errOut << err << Qt::endl;
    if (!ok) return 1;

    if (mgr.busy()) app.exec();
    return failures == 0 ? 0 : 2;
}
