#include "utilities/VolumeSettings.h"

#include <gtest/gtest.h>
#include <QSettings>
#include <QTemporaryDir>

namespace {

QString settingsPath(const QTemporaryDir &dir)
{
    return dir.filePath("volume.ini");
}

} // namespace

TEST(VolumeSettings, Defaults) {
    VolumeSettings s;
    EXPECT_DOUBLE_EQ(s.gridResolution, 1.0);
    EXPECT_EQ(s.interpolation, QString("linear"));
    EXPECT_DOUBLE_EQ(s.idwPower, 2.0);
    EXPECT_DOUBLE_EQ(s.idwSmoothing, 1.0);
    EXPECT_DOUBLE_EQ(s.sliceThickness, 1.0);
    EXPECT_DOUBLE_EQ(s.gridTolerance, 1e-9);
    EXPECT_DOUBLE_EQ(s.maxGridCells, 25000000.0);
    EXPECT_DOUBLE_EQ(s.maxSliceBands, 10000.0);
    EXPECT_DOUBLE_EQ(s.stationInterval, 100.0);
    EXPECT_DOUBLE_EQ(s.freeHaul, 500.0);
}

TEST(VolumeSettings, MissingKeysLoadDefaults) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QSettings settings(settingsPath(dir), QSettings::IniFormat);

    VolumeSettings loaded = VolumeSettings::load(settings);
    EXPECT_DOUBLE_EQ(loaded.gridResolution, 1.0);
    EXPECT_EQ(loaded.interpolation, QString("linear"));
}

TEST(VolumeSettings, SaveThenLoad) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    VolumeSettings stored;
    stored.gridResolution = 0.25;
    stored.interpolation = "nearest";
    stored.idwPower = 3.0;
    stored.idwSmoothing = 0.0;
    stored.sliceThickness = 0.5;
    stored.maxGridCells = 1000.0;
    stored.maxSliceBands = 50.0;
    stored.stationInterval = 25.0;
    stored.freeHaul = 0.0;

    {
        QSettings settings(settingsPath(dir), QSettings::IniFormat);
        stored.save(settings);
        settings.sync();
        EXPECT_EQ(settings.status(), QSettings::NoError);
        EXPECT_TRUE(settings.contains("volume/gridResolution"));
    }

    QSettings settings(settingsPath(dir), QSettings::IniFormat);
    VolumeSettings loaded = VolumeSettings::load(settings);
    EXPECT_DOUBLE_EQ(loaded.gridResolution, 0.25);
    EXPECT_EQ(loaded.interpolation, QString("nearest"));
    EXPECT_DOUBLE_EQ(loaded.idwPower, 3.0);
    EXPECT_DOUBLE_EQ(loaded.idwSmoothing, 0.0);
    EXPECT_DOUBLE_EQ(loaded.sliceThickness, 0.5);
    EXPECT_DOUBLE_EQ(loaded.maxGridCells, 1000.0);
    EXPECT_DOUBLE_EQ(loaded.maxSliceBands, 50.0);
    EXPECT_DOUBLE_EQ(loaded.stationInterval, 25.0);
    EXPECT_DOUBLE_EQ(loaded.freeHaul, 0.0);
}

TEST(VolumeSettings, InvalidValuesFallBack) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QSettings settings(settingsPath(dir), QSettings::IniFormat);
    settings.setValue("volume/gridResolution", -2.0);
    settings.setValue("volume/sliceThickness", "thick");
    settings.setValue("volume/interpolation", "kriging");
    settings.setValue("volume/gridTolerance", -1.0);
    settings.setValue("volume/maxSliceBands", 0.0);
    settings.setValue("volume/freeHaul", -10.0);

    VolumeSettings loaded = VolumeSettings::load(settings);
    EXPECT_DOUBLE_EQ(loaded.gridResolution, 1.0);
    EXPECT_DOUBLE_EQ(loaded.sliceThickness, 1.0);
    EXPECT_EQ(loaded.interpolation, QString("linear"));
    EXPECT_DOUBLE_EQ(loaded.gridTolerance, 1e-9);
    EXPECT_DOUBLE_EQ(loaded.maxSliceBands, 10000.0);
    EXPECT_DOUBLE_EQ(loaded.freeHaul, 500.0);
}

TEST(VolumeSettings, InterpolationNamesAreCaseInsensitive) {
    EXPECT_TRUE(VolumeSettings::isKnownInterpolation("Linear"));
    EXPECT_TRUE(VolumeSettings::isKnownInterpolation(" invdist "));
    EXPECT_TRUE(VolumeSettings::isKnownInterpolation("NEAREST"));
    EXPECT_FALSE(VolumeSettings::isKnownInterpolation("cubic"));
    EXPECT_FALSE(VolumeSettings::isKnownInterpolation(""));
}
