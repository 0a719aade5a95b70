#include <gtest/gtest.h>

#include <QEventLoop>
#include <QTimer>

#include <memory>
#include <vector>

#include "PowerMonitor.h"
#include "TimerEngine.h"

namespace {

struct Emission {
    enum Kind { Tick, PeriodChanged };

    Kind         kind;
    PomodoroMode mode;
    int          remainingSeconds;
};

class TimerEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_engine = std::make_unique<TimerEngine>([this] { return m_now; });
        m_engine->setResumeSource(&m_monitor);
        listen();
    }

    void TearDown() override
    {
        m_engine->destroy();
    }

    void listen()
    {
        QObject::connect(m_engine.get(), &TimerEngine::tick, [this](const TimerState& state) {
            m_emissions.push_back({ Emission::Tick, state.mode, state.remainingSeconds });
        });
        QObject::connect(m_engine.get(), &TimerEngine::periodChanged, [this](PomodoroMode mode) {
            m_emissions.push_back({ Emission::PeriodChanged, mode, -1 });
        });
    }

    int count(Emission::Kind kind) const
    {
        int n = 0;
        for (const Emission& e : m_emissions)
            n += e.kind == kind ? 1 : 0;
        return n;
    }

    QTime                        m_now = QTime(0, 10, 0);
    PowerMonitor                 m_monitor;
    std::unique_ptr<TimerEngine> m_engine;
    std::vector<Emission>        m_emissions;
};

} // namespace

TEST_F(TimerEngineTest, StartEmitsOneInitialTick)
{
    m_engine->start();

    EXPECT_TRUE(m_engine->isRunning());
    ASSERT_EQ(m_emissions.size(), 1u);
    EXPECT_EQ(m_emissions[0].kind, Emission::Tick);
    EXPECT_EQ(m_emissions[0].mode, PomodoroMode::Work);
    EXPECT_EQ(m_emissions[0].remainingSeconds, 900);
    EXPECT_EQ(m_engine->state().formattedTime, QStringLiteral("15:00"));
}

TEST_F(TimerEngineTest, SecondStartIsIgnored)
{
    m_engine->start();
    m_engine->start();

    EXPECT_EQ(count(Emission::Tick), 1);
}

TEST_F(TimerEngineTest, StopIsIdempotentAndSilencesResume)
{
    m_engine->start();
    m_engine->stop();
    m_engine->stop();
    emit m_monitor.resumed();

    EXPECT_FALSE(m_engine->isRunning());
    EXPECT_EQ(m_emissions.size(), 1u);
}

TEST_F(TimerEngineTest, ResumeMidSegmentEmitsExtraTickOnly)
{
    m_engine->start();
    m_now = QTime(0, 10, 30);
    emit m_monitor.resumed();

    ASSERT_EQ(m_emissions.size(), 2u);
    EXPECT_EQ(m_emissions[1].kind, Emission::Tick);
    EXPECT_EQ(m_emissions[1].mode, PomodoroMode::Work);
    EXPECT_EQ(m_emissions[1].remainingSeconds, 870);
    EXPECT_EQ(count(Emission::PeriodChanged), 0);
}

TEST_F(TimerEngineTest, ModeChangeFollowsTheTick)
{
    m_now = QTime(0, 24, 59);
    m_engine->start();
    m_now = QTime(0, 25, 0);
    emit m_monitor.resumed();

    ASSERT_EQ(m_emissions.size(), 3u);
    EXPECT_EQ(m_emissions[0].remainingSeconds, 1);
    EXPECT_EQ(m_emissions[1].kind, Emission::Tick);
    EXPECT_EQ(m_emissions[1].mode, PomodoroMode::Rest);
    EXPECT_EQ(m_emissions[1].remainingSeconds, 300);
    EXPECT_EQ(m_emissions[2].kind, Emission::PeriodChanged);
    EXPECT_EQ(m_emissions[2].mode, PomodoroMode::Rest);
}

TEST_F(TimerEngineTest, WrapIntoNextHourReturnsToWork)
{
    m_now = QTime(0, 59, 59);
    m_engine->start();
    m_now = QTime(1, 0, 0);
    emit m_monitor.resumed();

    ASSERT_EQ(m_emissions.size(), 3u);
    EXPECT_EQ(m_emissions[1].mode, PomodoroMode::Work);
    EXPECT_EQ(m_emissions[1].remainingSeconds, 1500);
    EXPECT_EQ(m_emissions[2].kind, Emission::PeriodChanged);
    EXPECT_EQ(m_emissions[2].mode, PomodoroMode::Work);
}

TEST_F(TimerEngineTest, RestartDoesNotReportStaleModeChange)
{
    m_engine->start();
    m_engine->stop();
    m_now = QTime(0, 26, 0);
    m_engine->start();

    EXPECT_EQ(count(Emission::Tick), 2);
    EXPECT_EQ(count(Emission::PeriodChanged), 0);
    EXPECT_EQ(m_engine->state().mode, PomodoroMode::Rest);
}

TEST_F(TimerEngineTest, DestroyBeforeStartIsSafe)
{
    m_engine->destroy();
    m_engine->destroy();

    EXPECT_FALSE(m_engine->isRunning());
    EXPECT_TRUE(m_emissions.empty());
}

TEST_F(TimerEngineTest, DestroyDropsListenersAndResumeSource)
{
    m_engine->start();
    m_engine->destroy();
    m_engine->destroy();
    m_emissions.clear();

    // Nobody is listening any more, and resume no longer reaches the engine
    m_engine->start();
    EXPECT_TRUE(m_emissions.empty());

    int ticks = 0;
    QObject::connect(m_engine.get(), &TimerEngine::tick, [&ticks] { ++ticks; });
    emit m_monitor.resumed();
    EXPECT_EQ(ticks, 0);
}

TEST_F(TimerEngineTest, TicksOncePerSecondWhileRunning)
{
    m_engine->start();

    QEventLoop loop;
    QTimer::singleShot(2500, &loop, &QEventLoop::quit);
    loop.exec();

    // Initial tick plus two periodic ones; allow one late timeout either way
    EXPECT_GE(count(Emission::Tick), 2);
    EXPECT_LE(count(Emission::Tick), 4);
}

TEST_F(TimerEngineTest, BrokenClockSurfacesConfigurationFault)
{
    // An invalid QTime reports minute -1, which no segment covers
    m_now = QTime();

    EXPECT_THROW(m_engine->start(), ConfigurationFault);
    EXPECT_FALSE(m_engine->isRunning());
    EXPECT_TRUE(m_emissions.empty());
}
