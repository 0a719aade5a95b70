#include "AutostartManager.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QStandardPaths>

AutostartManager::AutostartManager(QObject* parent)
    : AutostartManager(
          QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + "/autostart",
          QCoreApplication::applicationFilePath(),
          parent)
{}

AutostartManager::AutostartManager(const QString& autostartDir, const QString& executable,
                                   QObject* parent)
    : QObject(parent)
    , m_dir(autostartDir)
    , m_executable(executable)
{}

QString AutostartManager::entryPath() const
{
    return QDir(m_dir).filePath(QString::fromLatin1(kEntryName));
}

bool AutostartManager::isEnabled() const
{
    return QFile::exists(entryPath());
}

bool AutostartManager::setEnabled(bool enabled)
{
    const QString path = entryPath();

    if (!enabled) {
        if (QFile::exists(path) && !QFile::remove(path)) {
            m_lastError = QString("Cannot remove %1").arg(path);
            return false;
        }
        return true;
    }

    if (!QDir().mkpath(m_dir)) {
        m_lastError = QString("Cannot create %1").arg(m_dir);
        return false;
    }

    // Exec= needs quoting when the path has spaces
    QString exec = m_executable;
    if (exec.contains(' '))
        exec = QChar('"') + exec + QChar('"');

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        m_lastError = QString("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    const QString entry = QStringLiteral(
        "[Desktop Entry]\n"
        "Type=Application\n"
        "Name=Praymodoro\n"
        "Comment=Pomodoro companion synced to the clock\n"
        "Exec=%1\n"
        "Terminal=false\n"
        "X-GNOME-Autostart-enabled=true\n").arg(exec);

    file.write(entry.toUtf8());
    if (!file.commit()) {
        m_lastError = QString("Cannot write %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}
