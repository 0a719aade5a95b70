#include "TrayController.h"
#include "AutostartManager.h"
#include "CharacterRoster.h"
#include "CharacterWindow.h"
#include "SettingsManager.h"

#include <QApplication>
#include <QCoreApplication>
#include <QIcon>
#include <QSignalBlocker>
#include <QStyle>

#include <spdlog/spdlog.h>

static QIcon buildTrayIcon()
{
    QIcon icon(":/assets/icons/tray-icon.png");
    if (icon.isNull())
        icon = QIcon(QCoreApplication::applicationDirPath() + "/assets/icons/tray-icon.png");
    if (icon.isNull())
        icon = QApplication::style()->standardIcon(QStyle::SP_ComputerIcon);
    return icon;
}

// ── Constructor ───────────────────────────────────────────────────────────────

TrayController::TrayController(CharacterWindow* window, SettingsManager* settings,
                               AutostartManager* autostart, QObject* parent)
    : QObject(parent)
    , m_window(window)
    , m_settings(settings)
    , m_autostart(autostart)
{
    m_trayIcon = new QSystemTrayIcon(buildTrayIcon(), this);
    m_trayIcon->setToolTip(tr("Praymodoro"));

    buildMenu();
    setupConnections();
    updateMenu();
}

void TrayController::show()
{
    if (!QSystemTrayIcon::isSystemTrayAvailable())
        spdlog::warn("No system tray available; the tray menu will not be shown");
    m_trayIcon->show();
}

void TrayController::hide()
{
    m_trayIcon->hide();
}

// ── Build menu ────────────────────────────────────────────────────────────────

void TrayController::buildMenu()
{
    // QMenu needs a QWidget parent, which a QObject can't provide
    m_menu = std::make_unique<QMenu>();

    m_countdownAction = m_menu->addAction(QString());
    m_countdownAction->setEnabled(false);
    m_menu->addSeparator();

    m_toggleCharacterAction = m_menu->addAction(QString());
    m_menu->addSeparator();

    m_sizeAction = m_menu->addAction(QString());
    m_sizeAction->setEnabled(false);
    m_increaseSizeAction = m_menu->addAction(tr("Increase Size"));
    m_decreaseSizeAction = m_menu->addAction(tr("Decrease Size"));
    m_menu->addSeparator();

    m_characterAction = m_menu->addAction(QString());
    m_characterAction->setEnabled(false);
    m_nextCharacterAction = m_menu->addAction(tr("Next Character"));
    m_menu->addSeparator();

    const AppSettings current = m_settings->settings();
    m_launchAtStartupAction = m_menu->addAction(tr("Launch at Startup"));
    m_launchAtStartupAction->setCheckable(true);
    m_launchAtStartupAction->setChecked(current.launchAtStartup);
    m_showInDockAction = m_menu->addAction(tr("Show in Dock"));
    m_showInDockAction->setCheckable(true);
    m_showInDockAction->setChecked(current.showInDock);
    m_menu->addSeparator();

    m_quitAction = m_menu->addAction(tr("Quit"));

    m_trayIcon->setContextMenu(m_menu.get());
}

void TrayController::setupConnections()
{
    connect(m_trayIcon, &QSystemTrayIcon::activated,
            this, &TrayController::onTrayIconActivated);

    connect(m_toggleCharacterAction, &QAction::triggered, this, &TrayController::onToggleCharacter);
    connect(m_increaseSizeAction,    &QAction::triggered, this, &TrayController::onIncreaseSize);
    connect(m_decreaseSizeAction,    &QAction::triggered, this, &TrayController::onDecreaseSize);
    connect(m_nextCharacterAction,   &QAction::triggered, this, &TrayController::onNextCharacter);
    connect(m_launchAtStartupAction, &QAction::toggled,
            this, &TrayController::onLaunchAtStartupToggled);
    connect(m_showInDockAction,      &QAction::toggled,
            this, &TrayController::onShowInDockToggled);
    connect(m_quitAction,            &QAction::triggered, this, &TrayController::quitRequested);

    // Hiding via double-click on the overlay must flip the menu label too
    connect(m_window, &CharacterWindow::visibilityChanged, this, [this] { updateMenu(); });
}

// ── Refresh ───────────────────────────────────────────────────────────────────

void TrayController::onTimerTick(const TimerState& state)
{
    m_lastState = state;
    m_trayIcon->setToolTip(tr("Praymodoro - %1").arg(state.formattedTime));
    updateMenu();
}

void TrayController::updateMenu()
{
    const QString countdown = m_lastState.formattedTime.isEmpty()
                              ? QStringLiteral("--:--")
                              : m_lastState.formattedTime;
    if (m_lastState.mode == PomodoroMode::Work)
        m_countdownAction->setText(tr("Work for: %1").arg(countdown));
    else
        m_countdownAction->setText(tr("Rest for: %1").arg(countdown));

    m_toggleCharacterAction->setText(
        m_window->isVisible() ? tr("Hide Character") : tr("Show Character"));

    const double scale = m_window->scale();
    m_sizeAction->setText(tr("Size: %1%").arg(qRound(scale * 100)));
    m_increaseSizeAction->setEnabled(scale < SettingsManager::kMaxScale);
    m_decreaseSizeAction->setEnabled(scale > SettingsManager::kMinScale);

    m_characterAction->setText(
        tr("Character: %1").arg(CharacterRoster::displayName(m_window->character())));
}

// ── Tray slots ────────────────────────────────────────────────────────────────

void TrayController::onTrayIconActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::DoubleClick)
        onToggleCharacter();
}

void TrayController::onToggleCharacter()
{
    // updateMenu() runs through visibilityChanged
    m_window->toggleVisible();
}

void TrayController::onIncreaseSize()
{
    applyScale(SettingsManager::stepScale(m_window->scale(), +1));
}

void TrayController::onDecreaseSize()
{
    applyScale(SettingsManager::stepScale(m_window->scale(), -1));
}

void TrayController::applyScale(double scale)
{
    m_window->setScale(scale);
    if (!m_settings->saveScale(m_window->scale()))
        spdlog::error("Saving scale failed: {}", m_settings->lastError().toStdString());
    updateMenu();
}

void TrayController::onNextCharacter()
{
    const QString next = CharacterRoster::nextCharacter(m_window->character());
    m_window->setCharacter(next);
    if (!m_settings->saveCharacter(next))
        spdlog::error("Saving character failed: {}", m_settings->lastError().toStdString());
    spdlog::info("Character switched to {}", next.toStdString());
    updateMenu();
}

void TrayController::onLaunchAtStartupToggled(bool enabled)
{
    if (!m_autostart->setEnabled(enabled)) {
        spdlog::error("Updating autostart entry failed: {}",
                      m_autostart->lastError().toStdString());
        // Reflect what is actually on disk
        QSignalBlocker blocker(m_launchAtStartupAction);
        m_launchAtStartupAction->setChecked(m_autostart->isEnabled());
        return;
    }
    if (!m_settings->saveLaunchAtStartup(enabled))
        spdlog::error("Saving launchAtStartup failed: {}", m_settings->lastError().toStdString());
}

void TrayController::onShowInDockToggled(bool visible)
{
    m_window->setShowInDock(visible);
    if (!m_settings->saveShowInDock(visible))
        spdlog::error("Saving showInDock failed: {}", m_settings->lastError().toStdString());
}
