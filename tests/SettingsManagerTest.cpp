#include <gtest/gtest.h>

#include <QSettings>
#include <QTemporaryDir>

#include "CharacterRoster.h"
#include "SettingsManager.h"

namespace {

class SettingsManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_path = m_dir.filePath("praymodoro.ini");
    }

    QTemporaryDir m_dir;
    QString       m_path;
};

} // namespace

TEST_F(SettingsManagerTest, EmptyStoreYieldsDefaults)
{
    SettingsManager mgr(m_path);
    AppSettings s = mgr.settings();

    EXPECT_EQ(s.window.x, 100);
    EXPECT_EQ(s.window.y, 100);
    EXPECT_DOUBLE_EQ(s.window.scale, 1.0);
    EXPECT_DOUBLE_EQ(s.window.opacity, 1.0);
    EXPECT_EQ(s.character, QStringLiteral("augustine-of-hippo"));
    EXPECT_FALSE(s.launchAtStartup);
    EXPECT_FALSE(s.showInDock);
}

TEST_F(SettingsManagerTest, SavedValuesSurviveReopen)
{
    {
        SettingsManager mgr(m_path);
        EXPECT_TRUE(mgr.savePosition(320, 48));
        EXPECT_TRUE(mgr.saveScale(1.5));
        EXPECT_TRUE(mgr.saveOpacity(0.8));
        EXPECT_TRUE(mgr.saveCharacter("thomas-more"));
        EXPECT_TRUE(mgr.saveLaunchAtStartup(true));
        EXPECT_TRUE(mgr.saveShowInDock(true));
    }

    SettingsManager reopened(m_path);
    AppSettings s = reopened.settings();
    EXPECT_EQ(s.window.x, 320);
    EXPECT_EQ(s.window.y, 48);
    EXPECT_DOUBLE_EQ(s.window.scale, 1.5);
    EXPECT_DOUBLE_EQ(s.window.opacity, 0.8);
    EXPECT_EQ(s.character, QStringLiteral("thomas-more"));
    EXPECT_TRUE(s.launchAtStartup);
    EXPECT_TRUE(s.showInDock);
}

TEST_F(SettingsManagerTest, SaveSettingsWritesEverything)
{
    AppSettings wanted = SettingsManager::defaults();
    wanted.window.x    = -40;
    wanted.window.y    = 900;
    wanted.character   = "saint-patrick";
    wanted.showInDock  = true;

    SettingsManager mgr(m_path);
    ASSERT_TRUE(mgr.saveSettings(wanted));

    AppSettings s = SettingsManager(m_path).settings();
    EXPECT_EQ(s.window.x, -40);
    EXPECT_EQ(s.window.y, 900);
    EXPECT_EQ(s.character, QStringLiteral("saint-patrick"));
    EXPECT_TRUE(s.showInDock);
    EXPECT_FALSE(s.launchAtStartup);
}

TEST_F(SettingsManagerTest, ScaleAndOpacityAreClamped)
{
    SettingsManager mgr(m_path);

    mgr.saveScale(5.0);
    EXPECT_DOUBLE_EQ(mgr.settings().window.scale, 3.0);
    mgr.saveScale(0.1);
    EXPECT_DOUBLE_EQ(mgr.settings().window.scale, 0.5);

    mgr.saveOpacity(0.2);
    EXPECT_DOUBLE_EQ(mgr.settings().window.opacity, 0.5);
    mgr.saveOpacity(1.7);
    EXPECT_DOUBLE_EQ(mgr.settings().window.opacity, 1.0);
}

TEST_F(SettingsManagerTest, OutOfRangeValuesOnDiskAreClampedOnRead)
{
    {
        QSettings raw(m_path, QSettings::IniFormat);
        raw.setValue("window/scale", 9.0);
        raw.setValue("window/opacity", 0.0);
    }

    AppSettings s = SettingsManager(m_path).settings();
    EXPECT_DOUBLE_EQ(s.window.scale, 3.0);
    EXPECT_DOUBLE_EQ(s.window.opacity, 0.5);
}

TEST_F(SettingsManagerTest, UnknownCharacterIsRejected)
{
    SettingsManager mgr(m_path);
    ASSERT_TRUE(mgr.saveCharacter("thomas-aquinas"));

    EXPECT_FALSE(mgr.saveCharacter("francis-of-assisi"));
    EXPECT_FALSE(mgr.lastError().isEmpty());
    EXPECT_EQ(mgr.character(), QStringLiteral("thomas-aquinas"));
}

TEST_F(SettingsManagerTest, UnknownStoredCharacterFallsBackToDefault)
{
    {
        QSettings raw(m_path, QSettings::IniFormat);
        raw.setValue("character", "francis-of-assisi");
    }

    SettingsManager mgr(m_path);
    EXPECT_EQ(mgr.character(), CharacterRoster::defaultCharacter());
}

TEST_F(SettingsManagerTest, ResetRestoresDefaults)
{
    SettingsManager mgr(m_path);
    mgr.savePosition(1, 2);
    mgr.saveCharacter("thomas-more");

    ASSERT_TRUE(mgr.reset());
    AppSettings s = mgr.settings();
    EXPECT_EQ(s.window.x, 100);
    EXPECT_EQ(s.character, CharacterRoster::defaultCharacter());
}

TEST(SettingsManagerScaleTest, StepScaleMovesByTenthsWithinBounds)
{
    EXPECT_DOUBLE_EQ(SettingsManager::stepScale(1.0, +1), 1.1);
    EXPECT_DOUBLE_EQ(SettingsManager::stepScale(1.0, -1), 0.9);
    EXPECT_DOUBLE_EQ(SettingsManager::stepScale(3.0, +1), 3.0);
    EXPECT_DOUBLE_EQ(SettingsManager::stepScale(0.5, -1), 0.5);

    double scale = 1.0;
    for (int i = 0; i < 3; ++i)
        scale = SettingsManager::stepScale(scale, +1);
    EXPECT_DOUBLE_EQ(scale, 1.3);
}
