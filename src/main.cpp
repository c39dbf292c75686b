#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "core/dat_url.hpp"
#include "core/logging.hpp"
#include "crypto/keys.hpp"
#include "network/discovery_config.hpp"
#include "network/discovery_engine.hpp"
#include "network/peer_table.hpp"

namespace {

// Default Dat replication port, announced when --port is not given.
constexpr int kDefaultPort = 3282;

int fail(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("datlan");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Find peers sharing a Dat archive on the local network."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption cloneOption(
        QStringList{QStringLiteral("c"), QStringLiteral("clone")},
        QStringLiteral("Clone data from this URL (dat://<key>)."),
        QStringLiteral("link"));
    parser.addOption(cloneOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("Replication port to announce (default %1).").arg(kDefaultPort),
        QStringLiteral("port"),
        QString::number(kDefaultPort));
    parser.addOption(portOption);

    const QCommandLineOption tokenOption(
        QStringList{QStringLiteral("token")},
        QStringLiteral("Identity token to announce (random by default)."),
        QStringLiteral("token"));
    parser.addOption(tokenOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Also append log lines to this file."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption debugDiscoveryOption(
        QStringList{QStringLiteral("debug-discovery")},
        QStringLiteral("Enable discovery and transport debug logging."));
    parser.addOption(debugDiscoveryOption);

    parser.process(app);

    datlan::install_logging(parser.value(logFileOption));
    if (parser.isSet(debugDiscoveryOption)) {
        datlan::enable_discovery_debug();
    }

    if (auto init = datlan::crypto::init(); init.is_err()) {
        return fail(QString::fromStdString(init.unwrap_err().message));
    }

    // Generate a fresh archive identity unless we are cloning an existing one.
    const auto keypair = datlan::crypto::generate_keypair();
    datlan::crypto::PublicKey public_key = keypair.public_key;
    if (parser.isSet(cloneOption)) {
        auto parsed = datlan::parse_dat_url(parser.value(cloneOption));
        if (parsed.is_err()) {
            return fail(QStringLiteral("Invalid --clone link: %1")
                            .arg(QString::fromStdString(parsed.unwrap_err().message)));
        }
        public_key = parsed.unwrap();
    }

    QTextStream(stdout) << datlan::format_dat_url(public_key) << Qt::endl;

    bool port_ok = false;
    const int port = parser.value(portOption).toInt(&port_ok);
    if (!port_ok || port <= 0 || port > 65535) {
        return fail(QStringLiteral("Invalid --port: %1").arg(parser.value(portOption)));
    }

    const auto token = parser.isSet(tokenOption)
        ? parser.value(tokenOption)
        : QString::fromStdString(datlan::crypto::generate_random_token());

    const auto discovery_key = datlan::crypto::generate_discovery_key(public_key);
    auto session = datlan::network::RendezvousSession::create(
        std::vector<uint8_t>(discovery_key.begin(), discovery_key.end()),
        static_cast<uint16_t>(port),
        token);
    if (session.is_err()) {
        return fail(QString::fromStdString(session.unwrap_err().message));
    }

    datlan::network::DiscoveryEngine engine(std::move(session).unwrap(),
                                            datlan::network::DiscoveryConfig::from_environment());

    datlan::network::PeerTable known;
    QObject::connect(&engine.peers(), &datlan::network::PeerStream::peerAvailable, &app, [&]() {
        while (auto peer = engine.peers().next()) {
            if (known.insert(*peer)) {
                QTextStream(stdout) << "New peer: " << peer->address.toString() << ", "
                                    << peer->port << ", " << peer->token << Qt::endl;
            }
        }
    });

    if (auto started = engine.start(); started.is_err()) {
        return fail(QString::fromStdString(started.unwrap_err().message));
    }

    qCInfo(datlanApp) << "announcing port" << port << "token" << token;
    return app.exec();
}
