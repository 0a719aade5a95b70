#pragma once

#include <QObject>
#include <QString>

// Relays systemd-logind's PrepareForSleep signal. The host delivers it
// whenever the machine suspends or wakes up, at any point in the event loop.
class PowerMonitor : public QObject
{
    Q_OBJECT
public:
    explicit PowerMonitor(QObject* parent = nullptr);

    // Subscribe to logind on the system bus.
    // Returns false and sets lastError() if the bus or the service is missing.
    bool connectToSystem();

    bool    isConnected() const { return m_connected; }
    QString lastError()   const { return m_lastError; }

signals:
    void suspending();
    void resumed();

private slots:
    void onPrepareForSleep(bool sleeping);

private:
    bool    m_connected = false;
    QString m_lastError;

    static constexpr char kService[]   = "org.freedesktop.login1";
    static constexpr char kPath[]      = "/org/freedesktop/login1";
    static constexpr char kInterface[] = "org.freedesktop.login1.Manager";
};
