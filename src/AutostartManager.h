#pragma once

#include <QObject>
#include <QString>

// Launch-at-login via an XDG autostart entry (praymodoro.desktop).
class AutostartManager : public QObject
{
    Q_OBJECT
public:
    // Uses $XDG_CONFIG_HOME/autostart and the running executable
    explicit AutostartManager(QObject* parent = nullptr);

    AutostartManager(const QString& autostartDir, const QString& executable,
                     QObject* parent = nullptr);

    bool isEnabled() const;

    // Write or remove the entry. Returns false and sets lastError() on failure.
    bool setEnabled(bool enabled);

    QString entryPath() const;
    QString lastError() const { return m_lastError; }

private:
    QString m_dir;
    QString m_executable;
    QString m_lastError;

    static constexpr char kEntryName[] = "praymodoro.desktop";
};
