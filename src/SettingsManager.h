#pragma once

#include <QObject>
#include <QSettings>
#include <QString>

struct WindowSettings {
    int    x       = 100;
    int    y       = 100;
    double scale   = 1.0;   // 0.5 .. 3.0
    double opacity = 1.0;   // 0.5 .. 1.0
};

struct AppSettings {
    WindowSettings window;
    QString        character;
    bool           launchAtStartup = false;
    bool           showInDock      = false;
};

class SettingsManager : public QObject
{
    Q_OBJECT
public:
    static constexpr double kMinScale   = 0.5;
    static constexpr double kMaxScale   = 3.0;
    static constexpr double kMinOpacity = 0.5;
    static constexpr double kMaxOpacity = 1.0;
    static constexpr double kScaleStep  = 0.1;

    // Platform-native store for the current user
    explicit SettingsManager(QObject* parent = nullptr);

    // INI file at |filePath|
    explicit SettingsManager(const QString& filePath, QObject* parent = nullptr);

    static AppSettings defaults();
    static double clampScale(double scale);
    static double clampOpacity(double opacity);

    // Scale after one size step up (+1) or down (-1), clamped
    static double stepScale(double current, int direction);

    // Stored values, falling back to defaults for anything missing or invalid
    AppSettings settings() const;
    QString     character() const;

    // Each save writes through to disk.
    // Returns false and sets lastError() if the store could not be written.
    bool saveSettings(const AppSettings& settings);
    bool saveCharacter(const QString& character);
    bool savePosition(int x, int y);
    bool saveScale(double scale);
    bool saveOpacity(double opacity);
    bool saveLaunchAtStartup(bool enabled);
    bool saveShowInDock(bool visible);

    // Forget everything, back to defaults
    bool reset();

    QString lastError() const { return m_lastError; }

private:
    bool commit();

    QSettings m_store;
    QString   m_lastError;
};
