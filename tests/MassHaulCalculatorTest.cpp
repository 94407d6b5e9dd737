#include "analysis/MassHaulCalculator.h"
#include "analysis/CalculationDiagnostics.h"
#include "analysis/GridBuilder.h"

#include <gtest/gtest.h>

namespace {

// 11 x 1 nodes along y = 0: fill of 1 for x < 5, nothing at x = 5, cut of 1 beyond
VolumeResult sampleDifference()
{
    SamplingGrid grid;
    CalculationDiagnostics diag;
    GridBuilder::build(BoundingBox(0.0, 0.0, 10.0, 0.0), 1.0, grid, diag);

    QVector<double> existing(grid.pointCount(), 0.0);
    QVector<double> proposed;
    for (const QPointF &p : grid.points) {
        proposed.append(p.x() < 5.0 ? 1.0 : (p.x() > 5.0 ? -1.0 : 0.0));
    }
    return DifferenceEngine::difference(existing, proposed, grid, diag);
}

} // namespace

TEST(MassHaulCalculator, StationsAndCumulativeCurve) {
    const VolumeResult difference = sampleDifference();
    ASSERT_EQ(difference.validCells, 11);

    // Offsetting the alignment sideways must not change the projection
    for (double offset : {0.0, -3.0}) {
        const QVector<QPointF> alignment = {QPointF(0.0, offset), QPointF(10.0, offset)};
        CalculationDiagnostics diag;
        bool ok = false;
        const MassHaulResult haul = MassHaulCalculator::build(difference, alignment, 1.0, 5.0, 0.0,
                                                              diag, &ok);
        ASSERT_TRUE(ok);
        EXPECT_DOUBLE_EQ(haul.alignmentLength, 10.0);
        ASSERT_EQ(haul.stations.size(), 3);

        EXPECT_DOUBLE_EQ(haul.stations[0].station, 0.0);
        EXPECT_DOUBLE_EQ(haul.stations[0].fill, 5.0);
        EXPECT_DOUBLE_EQ(haul.stations[0].cut, 0.0);
        EXPECT_DOUBLE_EQ(haul.stations[0].cumulative, 5.0);

        EXPECT_DOUBLE_EQ(haul.stations[1].station, 5.0);
        EXPECT_DOUBLE_EQ(haul.stations[1].cut, 4.0);
        EXPECT_DOUBLE_EQ(haul.stations[1].cumulative, 1.0);

        EXPECT_DOUBLE_EQ(haul.stations[2].station, 10.0);
        EXPECT_DOUBLE_EQ(haul.stations[2].cut, 1.0);
        EXPECT_DOUBLE_EQ(haul.stations[2].cumulative, 0.0);

        // 4 x 5 + 5 x 10 + 1 x 5
        EXPECT_DOUBLE_EQ(haul.overhaul, 75.0);
    }
}

TEST(MassHaulCalculator, FreeHaulReducesOverhaul) {
    const VolumeResult difference = sampleDifference();
    const QVector<QPointF> alignment = {QPointF(0.0, 0.0), QPointF(10.0, 0.0)};

    CalculationDiagnostics diag;
    EXPECT_DOUBLE_EQ(MassHaulCalculator::build(difference, alignment, 1.0, 5.0, 5.0, diag).overhaul, 25.0);
    EXPECT_DOUBLE_EQ(MassHaulCalculator::build(difference, alignment, 1.0, 5.0, 10.0, diag).overhaul, 0.0);
    EXPECT_DOUBLE_EQ(MassHaulCalculator::build(difference, alignment, 1.0, 5.0, 1e300, diag).overhaul, 0.0);
    EXPECT_FALSE(diag.hasError());
}

TEST(MassHaulCalculator, CellSizeScalesVolumes) {
    const VolumeResult difference = sampleDifference();
    const QVector<QPointF> alignment = {QPointF(0.0, 0.0), QPointF(10.0, 0.0)};

    CalculationDiagnostics diag;
    const MassHaulResult haul = MassHaulCalculator::build(difference, alignment, 2.0, 5.0, 0.0, diag);
    ASSERT_EQ(haul.stations.size(), 3);
    EXPECT_DOUBLE_EQ(haul.stations[0].fill, 20.0);
}

TEST(MassHaulCalculator, InvalidParameters) {
    const VolumeResult difference = sampleDifference();
    const QVector<QPointF> alignment = {QPointF(0.0, 0.0), QPointF(10.0, 0.0)};

    struct Case {
        QVector<QPointF> alignment;
        double interval;
        double freeHaul;
        CalculationDiagnostics::Error expected;
    };
    const QVector<Case> cases = {
        {alignment, 0.0, 0.0, CalculationDiagnostics::Error::InvalidResolution},
        {alignment, -5.0, 0.0, CalculationDiagnostics::Error::InvalidResolution},
        {alignment, 1e-9, 0.0, CalculationDiagnostics::Error::InvalidResolution},
        {alignment, 5.0, -1.0, CalculationDiagnostics::Error::InvalidInput},
        {{QPointF(0.0, 0.0)}, 5.0, 0.0, CalculationDiagnostics::Error::InvalidInput},
        {{QPointF(2.0, 2.0), QPointF(2.0, 2.0)}, 5.0, 0.0, CalculationDiagnostics::Error::InvalidInput},
    };

    for (const Case &c : cases) {
        CalculationDiagnostics diag;
        bool ok = true;
        const MassHaulResult haul = MassHaulCalculator::build(difference, c.alignment, 1.0,
                                                              c.interval, c.freeHaul, diag, &ok);
        EXPECT_FALSE(ok);
        EXPECT_TRUE(haul.stations.isEmpty());
        EXPECT_EQ(diag.error(), c.expected) << diag.errorMessage().toStdString();
    }
}

TEST(MassHaulCalculator, VariantMap) {
    const VolumeResult difference = sampleDifference();
    const QVector<QPointF> alignment = {QPointF(0.0, 0.0), QPointF(10.0, 0.0)};

    CalculationDiagnostics diag;
    const QVariantMap map = MassHaulCalculator::build(difference, alignment, 1.0, 5.0, 0.0, diag).toVariantMap();
    const QVariantList stations = map["stations"].toList();
    ASSERT_EQ(stations.size(), 3);
    EXPECT_DOUBLE_EQ(stations[1].toMap()["cumulative"].toDouble(), 1.0);
    EXPECT_DOUBLE_EQ(map["overhaul"].toDouble(), 75.0);
    EXPECT_DOUBLE_EQ(map["alignmentLength"].toDouble(), 10.0);
}
