#pragma once

#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace beamstate::app {

/**
 * @brief Local socket through which a second invocation talks to the running daemon.
 *
 * The first process to listen() on a key owns the channel; that also keeps a
 * second daemon from monitoring the same configuration directory. Other
 * processes use request() to send one command and wait for the reply.
 */
class ControlChannel : public QObject {
    Q_OBJECT

public:
    using Handler = std::function<std::string(const std::string& request)>;

    explicit ControlChannel(const QString& key, QObject* parent = nullptr);
    ~ControlChannel() override;

    /**
     * @brief Starts listening unless another process already owns the key.
     * @return False if another instance is running or the socket cannot be created.
     */
    bool listen(Handler handler);

    [[nodiscard]] bool isListening() const { return server_ && server_->isListening(); }

    /**
     * @brief Sends request to the owner of key and waits for its reply.
     * @return The reply, or nullopt if no instance answered within timeoutMs.
     */
    static std::optional<std::string> request(const QString& key, const std::string& request,
                                              int timeoutMs = 3000);

    /**
     * @brief Channel key for a configuration directory.
     */
    static QString keyFor(const std::string& configDir);

private slots:
    void onNewConnection();

private:
    QString key_;
    Handler handler_;
    std::unique_ptr<QLocalServer> server_;
};

} // namespace beamstate::app
