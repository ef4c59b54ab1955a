#include <signal.h>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <memory>
#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/services/ConfigService.hpp"
#include "core/services/DesktopNotifier.hpp"
#include "core/services/DeviceMonitor.hpp"
#include "core/services/EventBus.hpp"
#include "core/services/NotificationService.hpp"
#include "core/services/UDisksVolumeWatcher.hpp"
#include "core/transfer/FileScanner.hpp"
#include "core/transfer/FileTransferEngine.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("Recorder Bridge");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("RecorderBridge");

    QCommandLineParser parser;
    parser.setApplicationDescription("Moves recordings off attached voice recorders into an inbox folder.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList{"c", "config"},
                                    "YAML configuration file.", "path",
                                    QDir::homePath() + "/.config/recorder-bridge/config.yaml");
    parser.addOption(configOption);
    parser.process(app);

    const QString configPath = parser.value(configOption);
    auto yamlConfig = std::make_shared<rbridge::YamlConfig>();

    QString loadError;
    bool firstRun = false;
    if (QFile::exists(configPath)) {
        try {
            yamlConfig->load(configPath);
        } catch (const YAML::Exception& e) {
            loadError = QString::fromStdString(e.what());
        }
    } else {
        // First run: write the defaults so there is something to edit
        QDir().mkpath(QFileInfo(configPath).absolutePath());
        yamlConfig->save(configPath);
        firstRun = true;
    }

    rbridge::Logging::init(yamlConfig->logLevel(), yamlConfig->logFile());

    if (!loadError.isEmpty())
        BOOST_LOG_TRIVIAL(error) << "[main] Could not read " << configPath.toStdString() << ": "
                                 << loadError.toStdString() << " (continuing with defaults)";
    if (firstRun)
        BOOST_LOG_TRIVIAL(info) << "[main] Wrote default configuration to " << configPath.toStdString();

    if (yamlConfig->destinationFolder().isEmpty())
        BOOST_LOG_TRIVIAL(warning) << "[main] transfer.destination_folder is not set; "
                                   << "transfers will fail until it is configured";

    auto configService = new rbridge::ConfigService(yamlConfig.get(), configPath, &app);

    // --- Event bus: every pipeline event ends up in the debug log ---
    auto eventBus = new rbridge::EventBus(&app);
    eventBus->subscribe("*", [](const QString& topic, const QVariant& payload) {
        const QByteArray json = QJsonDocument(QJsonObject::fromVariantMap(payload.toMap()))
                                    .toJson(QJsonDocument::Compact);
        BOOST_LOG_TRIVIAL(debug) << "[EventBus] " << topic.toStdString() << " " << json.toStdString();
    });

    // --- Notifications ---
    auto notificationService = new rbridge::NotificationService(yamlConfig->maxActiveNotifications(), &app);
    auto desktopNotifier = new rbridge::DesktopNotifier(notificationService, &app);
    desktopNotifier->setEnabled(yamlConfig->desktopNotifications());

    QObject::connect(configService, &rbridge::ConfigService::configChanged,
                     desktopNotifier, [desktopNotifier](const QString& key, const QVariant& value) {
        if (key == "notifications.desktop")
            desktopNotifier->setEnabled(value.toBool());
    });

    // --- Pipeline ---
    auto volumeWatcher = new rbridge::UDisksVolumeWatcher(&app);
    auto scanner = new rbridge::FileScanner(configService, &app);
    auto engine = new rbridge::FileTransferEngine(configService, &app);
    auto monitor = new rbridge::DeviceMonitor(volumeWatcher, scanner, engine,
                                              configService, notificationService, eventBus, &app);

    // SIGINT/SIGTERM -> leave the event loop
    auto requestQuit = [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), []() { QCoreApplication::quit(); },
                                  Qt::QueuedConnection);
    };
    signal(SIGINT, requestQuit);
    signal(SIGTERM, requestQuit);

    monitor->startMonitoring();
    BOOST_LOG_TRIVIAL(info) << "[main] Recorder Bridge running, config " << configPath.toStdString();

    int ret = app.exec();

    // Stop intake before the pipeline objects go away; a running transfer
    // is cancelled between files by the engine's destructor.
    monitor->stopMonitoring();
    BOOST_LOG_TRIVIAL(info) << "[main] Shutting down";

    return ret;
}
