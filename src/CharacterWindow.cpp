#include "CharacterWindow.h"
#include "CharacterRoster.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFont>
#include <QGuiApplication>
#include <QMouseEvent>
#include <QScreen>
#include <QVBoxLayout>

#include <cmath>

#include <spdlog/spdlog.h>

// ── Constructor ───────────────────────────────────────────────────────────────

CharacterWindow::CharacterWindow(const AppSettings& settings, QWidget* parent)
    : QWidget(parent)
    , m_character(settings.character)
    , m_showInDock(settings.showInDock)
{
    setAttribute(Qt::WA_TranslucentBackground);
    setWindowTitle(tr("Praymodoro"));
    applyWindowFlags();
    buildUI();

    // Position is only persisted once the user stops moving the window
    m_savePositionTimer.setSingleShot(true);
    m_savePositionTimer.setInterval(500);
    connect(&m_savePositionTimer, &QTimer::timeout, this, [this] {
        emit positionChanged(pos().x(), pos().y());
    });

    setScale(settings.window.scale);
    setOverlayOpacity(settings.window.opacity);
    move(ensureOnScreen(QPoint(settings.window.x, settings.window.y)));
}

QSize CharacterWindow::scaledSize(double scale)
{
    return QSize(static_cast<int>(std::floor(kBaseWidth * scale)),
                 static_cast<int>(std::floor(kBaseHeight * scale)));
}

// ── Build UI ──────────────────────────────────────────────────────────────────

void CharacterWindow::buildUI()
{
    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_artLabel = new QLabel(this);
    m_artLabel->setAlignment(Qt::AlignHCenter | Qt::AlignBottom);
    layout->addWidget(m_artLabel, 1);

    m_countdownLabel = new QLabel(QStringLiteral("--:--"), this);
    m_countdownLabel->setAlignment(Qt::AlignCenter);
    m_countdownLabel->setStyleSheet(
        "color: white; background-color: rgba(0, 0, 0, 140); border-radius: 6px;");
    layout->addWidget(m_countdownLabel, 0, Qt::AlignHCenter);
}

// Tool windows stay out of the taskbar / dock
void CharacterWindow::applyWindowFlags()
{
    Qt::WindowFlags flags = Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint;
    flags |= m_showInDock ? Qt::Window : Qt::Tool;
    setWindowFlags(flags);
}

// ── Timer slots ───────────────────────────────────────────────────────────────

void CharacterWindow::onTimerTick(const TimerState& state)
{
    m_countdownLabel->setText(state.formattedTime);

    // The first tick after start carries the mode without a periodChanged()
    if (state.mode != m_mode) {
        m_mode = state.mode;
        updateArtwork();
    }
}

void CharacterWindow::onPeriodChanged(PomodoroMode mode)
{
    m_mode = mode;
    updateArtwork();
}

// ── Appearance ────────────────────────────────────────────────────────────────

void CharacterWindow::setCharacter(const QString& character)
{
    if (!CharacterRoster::isKnown(character)) {
        spdlog::warn("Ignoring unknown character '{}'", character.toStdString());
        return;
    }
    m_character = character;
    updateArtwork();
}

void CharacterWindow::setScale(double scale)
{
    m_scale = SettingsManager::clampScale(scale);

    // Keeps the top-left corner where it is
    setFixedSize(scaledSize(m_scale));
    updateCountdownFont();
    updateArtwork();
}

void CharacterWindow::setOverlayOpacity(double opacity)
{
    setWindowOpacity(SettingsManager::clampOpacity(opacity));
}

void CharacterWindow::setShowInDock(bool visible)
{
    if (m_showInDock == visible)
        return;

    // setWindowFlags() hides the window; put it back if it was showing
    bool wasVisible = isVisible();
    m_showInDock = visible;
    applyWindowFlags();
    if (wasVisible)
        show();
}

void CharacterWindow::toggleVisible()
{
    if (isVisible()) {
        hide();
    } else {
        show();
        raise();
    }
    emit visibilityChanged(isVisible());
}

void CharacterWindow::updateCountdownFont()
{
    QFont f = m_countdownLabel->font();
    f.setPointSizeF(14.0 * m_scale);
    f.setBold(true);
    m_countdownLabel->setFont(f);
}

void CharacterWindow::updateArtwork()
{
    QPixmap art = loadArtwork();
    if (art.isNull()) {
        // No artwork installed: show the name so the overlay is still usable
        m_artLabel->setPixmap(QPixmap());
        m_artLabel->setText(CharacterRoster::displayName(m_character));
        return;
    }

    const QSize area = scaledSize(m_scale);
    m_artLabel->setPixmap(art.scaled(area, Qt::KeepAspectRatio, Qt::SmoothTransformation));
}

// Looks in the working directory first (development), then next to the
// executable (installed), then in the compiled-in resources.
QPixmap CharacterWindow::loadArtwork() const
{
    const QString relative = QString("assets/characters/%1/%2")
                             .arg(m_character, CharacterRoster::imageFile(m_mode));

    const QStringList candidates = {
        QDir::currentPath() + '/' + relative,
        QCoreApplication::applicationDirPath() + '/' + relative,
        QStringLiteral(":/") + relative,
    };

    for (const QString& path : candidates) {
        if (!QFile::exists(path))
            continue;
        QPixmap pm(path);
        if (!pm.isNull())
            return pm;
        spdlog::warn("Could not decode artwork {}", path.toStdString());
    }
    return QPixmap();
}

// A saved position from a monitor that is no longer attached would put the
// window out of reach, so fall back to the primary screen.
QPoint CharacterWindow::ensureOnScreen(const QPoint& pos) const
{
    const QRect frame(pos, scaledSize(m_scale));
    for (QScreen* screen : QGuiApplication::screens()) {
        if (screen->geometry().contains(frame))
            return pos;
    }

    QScreen* primary = QGuiApplication::primaryScreen();
    if (!primary)
        return pos;
    return primary->geometry().topLeft() + QPoint(100, 100);
}

// ── Dragging ──────────────────────────────────────────────────────────────────

void CharacterWindow::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        m_dragging   = true;
        m_dragOffset = event->globalPosition().toPoint() - frameGeometry().topLeft();
        m_savePositionTimer.stop();
        event->accept();
        return;
    }
    QWidget::mousePressEvent(event);
}

void CharacterWindow::mouseMoveEvent(QMouseEvent* event)
{
    if (m_dragging && (event->buttons() & Qt::LeftButton)) {
        move(event->globalPosition().toPoint() - m_dragOffset);
        event->accept();
        return;
    }
    QWidget::mouseMoveEvent(event);
}

void CharacterWindow::mouseReleaseEvent(QMouseEvent* event)
{
    if (m_dragging && event->button() == Qt::LeftButton) {
        m_dragging = false;
        m_savePositionTimer.start();
        event->accept();
        return;
    }
    QWidget::mouseReleaseEvent(event);
}

void CharacterWindow::mouseDoubleClickEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        hide();
        emit visibilityChanged(false);
        event->accept();
        return;
    }
    QWidget::mouseDoubleClickEvent(event);
}
