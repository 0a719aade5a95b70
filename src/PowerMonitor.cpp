#include "PowerMonitor.h"

#include <QDBusConnection>
#include <QDBusError>

#include <spdlog/spdlog.h>

PowerMonitor::PowerMonitor(QObject* parent)
    : QObject(parent)
{}

bool PowerMonitor::connectToSystem()
{
    if (m_connected)
        return true;

    QDBusConnection bus = QDBusConnection::systemBus();
    if (!bus.isConnected()) {
        m_lastError = QString("System bus unavailable: %1").arg(bus.lastError().message());
        return false;
    }

    m_connected = bus.connect(QString::fromLatin1(kService),
                              QString::fromLatin1(kPath),
                              QString::fromLatin1(kInterface),
                              QStringLiteral("PrepareForSleep"),
                              this, SLOT(onPrepareForSleep(bool)));
    if (!m_connected) {
        m_lastError = QString("Subscribing to PrepareForSleep failed: %1")
                      .arg(bus.lastError().message());
        return false;
    }

    spdlog::debug("Listening for suspend/resume on {}", kService);
    return true;
}

void PowerMonitor::onPrepareForSleep(bool sleeping)
{
    if (sleeping) {
        spdlog::info("System is going to sleep");
        emit suspending();
    } else {
        spdlog::info("System resumed");
        emit resumed();
    }
}
