#pragma once

#include <QObject>
#include <QSystemTrayIcon>
#include <QMenu>
#include <QAction>

#include <memory>

#include "PomodoroPeriod.h"

class CharacterWindow;
class SettingsManager;
class AutostartManager;

// Tray icon plus the menu that controls the overlay. The menu doubles as a
// second countdown display, refreshed on every tick.
class TrayController : public QObject
{
    Q_OBJECT
public:
    TrayController(CharacterWindow* window, SettingsManager* settings,
                   AutostartManager* autostart, QObject* parent = nullptr);

    // Must run once the event loop is up, see main()
    void show();
    void hide();

public slots:
    void onTimerTick(const TimerState& state);

signals:
    void quitRequested();

private slots:
    void onTrayIconActivated(QSystemTrayIcon::ActivationReason reason);
    void onToggleCharacter();
    void onIncreaseSize();
    void onDecreaseSize();
    void onNextCharacter();
    void onLaunchAtStartupToggled(bool enabled);
    void onShowInDockToggled(bool visible);

private:
    void buildMenu();
    void setupConnections();
    void updateMenu();
    void applyScale(double scale);

    CharacterWindow*  m_window    = nullptr;
    SettingsManager*  m_settings  = nullptr;
    AutostartManager* m_autostart = nullptr;

    QSystemTrayIcon*       m_trayIcon = nullptr;
    std::unique_ptr<QMenu> m_menu;

    QAction* m_countdownAction       = nullptr;
    QAction* m_toggleCharacterAction = nullptr;
    QAction* m_sizeAction            = nullptr;
    QAction* m_increaseSizeAction    = nullptr;
    QAction* m_decreaseSizeAction    = nullptr;
    QAction* m_characterAction       = nullptr;
    QAction* m_nextCharacterAction   = nullptr;
    QAction* m_launchAtStartupAction = nullptr;
    QAction* m_showInDockAction      = nullptr;
    QAction* m_quitAction            = nullptr;

    TimerState m_lastState;
};
