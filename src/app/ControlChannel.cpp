#include "app/ControlChannel.hpp"

#include <QCryptographicHash>
#include <QDataStream>
#include <QElapsedTimer>
#include <spdlog/spdlog.h>

namespace beamstate::app {

ControlChannel::ControlChannel(const QString& key, QObject* parent)
    : QObject(parent), key_(key) {}

ControlChannel::~ControlChannel() {
    if (server_) {
        server_->close();
    }
}

QString ControlChannel::keyFor(const std::string& configDir) {
    auto hash = QCryptographicHash::hash(QByteArray::fromStdString(configDir),
                                         QCryptographicHash::Sha1)
                    .toHex()
                    .left(12);
    return QStringLiteral("beamstate-") + QString::fromLatin1(hash);
}

bool ControlChannel::listen(Handler handler) {
    // Try to connect to existing instance
    QLocalSocket probe;
    probe.connectToServer(key_);
    if (probe.waitForConnected(500)) {
        spdlog::error("Another BeamState instance is already running for this configuration");
        return false;
    }

    // Stale socket file from a crashed instance
    QLocalServer::removeServer(key_);
    server_ = std::make_unique<QLocalServer>(this);
    server_->setSocketOptions(QLocalServer::UserAccessOption);

    if (!server_->listen(key_)) {
        spdlog::error("Failed to start control channel: {}", server_->errorString().toStdString());
        server_.reset();
        return false;
    }

    handler_ = std::move(handler);
    connect(server_.get(), &QLocalServer::newConnection, this, &ControlChannel::onNewConnection);

    spdlog::debug("Control channel listening on {}", key_.toStdString());
    return true;
}

std::optional<std::string> ControlChannel::request(const QString& key, const std::string& request,
                                                   int timeoutMs) {
    QLocalSocket socket;
    socket.connectToServer(key);

    if (!socket.waitForConnected(timeoutMs)) {
        return std::nullopt;
    }

    QDataStream out(&socket);
    out << QString::fromStdString(request);
    socket.flush();
    if (!socket.waitForBytesWritten(timeoutMs)) {
        return std::nullopt;
    }

    QElapsedTimer timer;
    timer.start();
    QDataStream in(&socket);
    while (timer.elapsed() < timeoutMs) {
        if (!socket.waitForReadyRead(static_cast<int>(timeoutMs - timer.elapsed()))) {
            break;
        }
        in.startTransaction();
        QString reply;
        in >> reply;
        if (in.commitTransaction()) {
            return reply.toStdString();
        }
    }
    return std::nullopt;
}

void ControlChannel::onNewConnection() {
    auto* socket = server_->nextPendingConnection();
    if (!socket) {
        return;
    }

    connect(socket, &QLocalSocket::readyRead, this, [this, socket]() {
        QDataStream in(socket);
        in.startTransaction();
        QString message;
        in >> message;
        if (!in.commitTransaction()) {
            return;
        }

        std::string reply = handler_ ? handler_(message.toStdString()) : std::string{};

        QDataStream out(socket);
        out << QString::fromStdString(reply);
        socket->flush();
        socket->disconnectFromServer();
    });

    connect(socket, &QLocalSocket::disconnected, socket, &QLocalSocket::deleteLater);
}

} // namespace beamstate::app
