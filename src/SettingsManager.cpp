#include "SettingsManager.h"
#include "CharacterRoster.h"

#include <QtGlobal>

#include <cmath>

#include <spdlog/spdlog.h>

// ── Keys ──────────────────────────────────────────────────────────────────────

static const char kKeyX[]               = "window/x";
static const char kKeyY[]               = "window/y";
static const char kKeyScale[]           = "window/scale";
static const char kKeyOpacity[]         = "window/opacity";
static const char kKeyCharacter[]       = "character";
static const char kKeyLaunchAtStartup[] = "launchAtStartup";
static const char kKeyShowInDock[]      = "showInDock";

// ── Construction ──────────────────────────────────────────────────────────────

SettingsManager::SettingsManager(QObject* parent)
    : QObject(parent)
    , m_store("Praymodoro", "Praymodoro")
{}

SettingsManager::SettingsManager(const QString& filePath, QObject* parent)
    : QObject(parent)
    , m_store(filePath, QSettings::IniFormat)
{}

AppSettings SettingsManager::defaults()
{
    AppSettings settings;
    settings.character = CharacterRoster::defaultCharacter();
    return settings;
}

double SettingsManager::clampScale(double scale)
{
    return qBound(kMinScale, scale, kMaxScale);
}

double SettingsManager::clampOpacity(double opacity)
{
    return qBound(kMinOpacity, opacity, kMaxOpacity);
}

double SettingsManager::stepScale(double current, int direction)
{
    // Round to one decimal so repeated steps don't drift (1.0 + 0.1 * 3 != 1.3)
    double next = std::round((current + direction * kScaleStep) * 10.0) / 10.0;
    return clampScale(next);
}

// ── Read ──────────────────────────────────────────────────────────────────────

AppSettings SettingsManager::settings() const
{
    const AppSettings fallback = defaults();
    AppSettings out;

    out.window.x       = m_store.value(kKeyX, fallback.window.x).toInt();
    out.window.y       = m_store.value(kKeyY, fallback.window.y).toInt();
    out.window.scale   = clampScale(m_store.value(kKeyScale, fallback.window.scale).toDouble());
    out.window.opacity = clampOpacity(m_store.value(kKeyOpacity, fallback.window.opacity).toDouble());
    out.character       = character();
    out.launchAtStartup = m_store.value(kKeyLaunchAtStartup, fallback.launchAtStartup).toBool();
    out.showInDock      = m_store.value(kKeyShowInDock, fallback.showInDock).toBool();
    return out;
}

QString SettingsManager::character() const
{
    QString stored = m_store.value(kKeyCharacter).toString();
    if (!CharacterRoster::isKnown(stored)) {
        if (!stored.isEmpty())
            spdlog::warn("Unknown character '{}' in settings, using default", stored.toStdString());
        return CharacterRoster::defaultCharacter();
    }
    return stored;
}

// ── Write ─────────────────────────────────────────────────────────────────────

bool SettingsManager::saveSettings(const AppSettings& settings)
{
    m_store.setValue(kKeyX,       settings.window.x);
    m_store.setValue(kKeyY,       settings.window.y);
    m_store.setValue(kKeyScale,   clampScale(settings.window.scale));
    m_store.setValue(kKeyOpacity, clampOpacity(settings.window.opacity));
    m_store.setValue(kKeyCharacter,
                     CharacterRoster::isKnown(settings.character)
                         ? settings.character
                         : CharacterRoster::defaultCharacter());
    m_store.setValue(kKeyLaunchAtStartup, settings.launchAtStartup);
    m_store.setValue(kKeyShowInDock,      settings.showInDock);
    return commit();
}

bool SettingsManager::saveCharacter(const QString& character)
{
    if (!CharacterRoster::isKnown(character)) {
        m_lastError = QString("Unknown character: %1").arg(character);
        return false;
    }
    m_store.setValue(kKeyCharacter, character);
    return commit();
}

bool SettingsManager::savePosition(int x, int y)
{
    m_store.setValue(kKeyX, x);
    m_store.setValue(kKeyY, y);
    return commit();
}

bool SettingsManager::saveScale(double scale)
{
    m_store.setValue(kKeyScale, clampScale(scale));
    return commit();
}

bool SettingsManager::saveOpacity(double opacity)
{
    m_store.setValue(kKeyOpacity, clampOpacity(opacity));
    return commit();
}

bool SettingsManager::saveLaunchAtStartup(bool enabled)
{
    m_store.setValue(kKeyLaunchAtStartup, enabled);
    return commit();
}

bool SettingsManager::saveShowInDock(bool visible)
{
    m_store.setValue(kKeyShowInDock, visible);
    return commit();
}

bool SettingsManager::reset()
{
    m_store.clear();
    return commit();
}

bool SettingsManager::commit()
{
    m_store.sync();
    switch (m_store.status()) {
        case QSettings::NoError:
            return true;
        case QSettings::AccessError:
            m_lastError = QString("Cannot write settings to %1").arg(m_store.fileName());
            break;
        case QSettings::FormatError:
            m_lastError = QString("Settings file %1 is malformed").arg(m_store.fileName());
            break;
    }
    return false;
}
