#pragma once

#include <QWidget>
#include <QLabel>
#include <QPixmap>
#include <QPoint>
#include <QTimer>

#include "PomodoroPeriod.h"
#include "SettingsManager.h"

// Frameless, always-on-top overlay showing the character artwork for the
// current period and the time left in it.
class CharacterWindow : public QWidget
{
    Q_OBJECT
public:
    // Unscaled size, matching the aspect ratio of the trimmed artwork
    static constexpr int kBaseWidth  = 160;
    static constexpr int kBaseHeight = 395;

    explicit CharacterWindow(const AppSettings& settings, QWidget* parent = nullptr);

    double       scale()     const { return m_scale; }
    QString      character() const { return m_character; }
    PomodoroMode mode()      const { return m_mode; }

    static QSize scaledSize(double scale);

public slots:
    void onTimerTick(const TimerState& state);
    void onPeriodChanged(PomodoroMode mode);

    void setCharacter(const QString& character);
    void setScale(double scale);
    void setOverlayOpacity(double opacity);
    void setShowInDock(bool visible);
    void toggleVisible();

signals:
    // Emitted once a drag has settled
    void positionChanged(int x, int y);
    void visibilityChanged(bool visible);

protected:
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;

private:
    void buildUI();
    void applyWindowFlags();
    void updateArtwork();
    void updateCountdownFont();
    QPixmap loadArtwork() const;
    QPoint ensureOnScreen(const QPoint& pos) const;

    QLabel* m_artLabel       = nullptr;
    QLabel* m_countdownLabel = nullptr;

    QString      m_character;
    PomodoroMode m_mode       = PomodoroMode::Work;
    double       m_scale      = 1.0;
    bool         m_showInDock = false;

    bool   m_dragging = false;
    QPoint m_dragOffset;
    QTimer m_savePositionTimer;
};
