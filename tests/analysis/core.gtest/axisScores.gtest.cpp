#include "analysis/core/axisScores.hpp"

#include <gtest/gtest.h>

namespace facesharp::analysis::core {
namespace gtest {

static QualityReport makeQuality(double laplacian, double tenengrad, double frequency, double contrast, double exposureScore,
                                 double overPct = 0.0, double underPct = 0.0) {
	QualityReport q{};
	q.sharpnessLaplacian       = laplacian;
	q.sharpnessTenengrad       = tenengrad;
	q.sharpnessFrequency       = frequency;
	q.contrastRms              = contrast;
	q.exposure.score           = exposureScore;
	q.exposure.overexposedPct  = overPct;
	q.exposure.underexposedPct = underPct;
	return q;
}

TEST(AxisScores, SharpnessCombinesAllEstimators) {
	const AxisScores axes = aggregateAxes(makeQuality(1000.0, 100000.0, 0.5, 0.0, 0.0), std::nullopt, std::nullopt);
	EXPECT_NEAR(axes.sharpness, 50.0 + 30.0 + 10.0, 1e-9);
}

TEST(AxisScores, SharpnessAndContrastAreCapped) {
	const AxisScores axes = aggregateAxes(makeQuality(50000.0, 1e9, 1.0, 80.0, 100.0), std::nullopt, std::nullopt);
	EXPECT_DOUBLE_EQ(axes.sharpness, 100.0);
	EXPECT_DOUBLE_EQ(axes.contrast, 100.0);

	const AxisScores moderate = aggregateAxes(makeQuality(0.0, 0.0, 0.0, 30.0, 100.0), std::nullopt, std::nullopt);
	EXPECT_DOUBLE_EQ(moderate.contrast, 60.0);
	EXPECT_DOUBLE_EQ(moderate.sharpness, 0.0);
}

TEST(AxisScores, LightingFromExposureAndClipping) {
	EXPECT_NEAR(aggregateAxes(makeQuality(0, 0, 0, 0, 100.0), std::nullopt, std::nullopt).lighting, 100.0, 1e-9);
	EXPECT_NEAR(aggregateAxes(makeQuality(0, 0, 0, 0, 50.0, 10.0, 5.0), std::nullopt, std::nullopt).lighting, 35.0 + 85.0 * 0.3, 1e-9);
}

TEST(AxisScores, MissingMesh_NeutralPoseAndJawline) {
	const AxisScores axes = aggregateAxes(makeQuality(0, 0, 0, 0, 0), std::nullopt, std::nullopt);
	EXPECT_DOUBLE_EQ(axes.pose, 50.0);
	EXPECT_DOUBLE_EQ(axes.jawline, 50.0);

	AxisConfig config{};
	config.missingMeshScore = 40.0;
	EXPECT_DOUBLE_EQ(aggregateAxes(makeQuality(0, 0, 0, 0, 0), std::nullopt, std::nullopt, config).pose, 40.0);
}

TEST(AxisScores, MeshPresent_UsesGeometryScores) {
	Proportions proportions{};
	proportions.jawAngle = 70.0;
	proportions.symmetry = 50.0;

	const AxisScores axes = aggregateAxes(makeQuality(0, 0, 0, 0, 0), Pose{10.0, 0.0, 0.0}, proportions);
	EXPECT_NEAR(axes.pose, poseScore(Pose{10.0, 0.0, 0.0}), 1e-12);
	EXPECT_NEAR(axes.pose, 92.0, 1e-9);
	EXPECT_NEAR(axes.jawline, 80.0, 1e-9);
}

TEST(AxisScores, IndexingAndStatistics) {
	const AxisScores axes{10.0, 20.0, 30.0, 40.0, 50.0};

	EXPECT_DOUBLE_EQ(axes[Axis::Sharpness], 10.0);
	EXPECT_DOUBLE_EQ(axes[Axis::Lighting], 20.0);
	EXPECT_DOUBLE_EQ(axes[Axis::Pose], 30.0);
	EXPECT_DOUBLE_EQ(axes[Axis::Jawline], 40.0);
	EXPECT_DOUBLE_EQ(axes[Axis::Contrast], 50.0);
	EXPECT_DOUBLE_EQ(axes.mean(), 30.0);
	EXPECT_DOUBLE_EQ(axes.min(), 10.0);

	EXPECT_EQ(toString(Axis::Jawline), "jawline");
	EXPECT_EQ(ALL_AXES.size(), 5u);
}

} // namespace gtest
} // namespace facesharp::analysis::core
