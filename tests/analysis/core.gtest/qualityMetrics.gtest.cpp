#include "analysis/core/qualityMetrics.hpp"

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

namespace facesharp::analysis::core {
namespace gtest {

//! Checkerboard with square size cell and the two given gray levels.
static cv::Mat makeCheckerboard(int size, int cell, uchar dark, uchar bright) {
	cv::Mat image(size, size, CV_8UC1);
	for (int r = 0; r < size; ++r) {
		for (int c = 0; c < size; ++c) {
			image.at<uchar>(r, c) = ((r / cell + c / cell) % 2 == 0) ? dark : bright;
		}
	}
	cv::Mat bgr;
	cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
	return bgr;
}

static cv::Mat blurred(const cv::Mat& image) {
	cv::Mat out;
	cv::GaussianBlur(image, out, cv::Size(15, 15), 5.0);
	return out;
}

TEST(QualityMetrics, EmptyImage_ReturnsSentinels) {
	const cv::Mat empty;
	EXPECT_DOUBLE_EQ(sharpnessLaplacian(empty), 0.0);
	EXPECT_DOUBLE_EQ(sharpnessTenengrad(empty), 0.0);
	EXPECT_DOUBLE_EQ(sharpnessFrequency(empty), 0.0);
	EXPECT_DOUBLE_EQ(contrastRms(empty), 0.0);
	EXPECT_DOUBLE_EQ(noiseEstimate(empty), 0.0);
	EXPECT_DOUBLE_EQ(backgroundBokeh(empty, cv::Rect(0, 0, 10, 10)), 50.0);
	EXPECT_TRUE(localSharpnessMap(empty).empty());

	const ExposureReport exposure = measureExposure(empty);
	EXPECT_DOUBLE_EQ(exposure.score, 0.0);
	EXPECT_DOUBLE_EQ(exposure.meanBrightness, 0.0);
}

TEST(QualityMetrics, UniformMidGray_IsFlatAndIdeallyExposed) {
	const cv::Mat gray(64, 64, CV_8UC3, cv::Scalar(128, 128, 128));

	EXPECT_NEAR(sharpnessLaplacian(gray), 0.0, 1e-9);
	EXPECT_NEAR(sharpnessTenengrad(gray), 0.0, 1e-9);
	EXPECT_NEAR(sharpnessFrequency(gray), 0.0, 1e-6);
	EXPECT_NEAR(contrastRms(gray), 0.0, 1e-9);
	EXPECT_NEAR(noiseEstimate(gray), 0.0, 1e-6);

	const ExposureReport exposure = measureExposure(gray);
	EXPECT_DOUBLE_EQ(exposure.score, 100.0);
	EXPECT_DOUBLE_EQ(exposure.meanBrightness, 128.0);
	EXPECT_DOUBLE_EQ(exposure.deviation, 0.0);
	EXPECT_DOUBLE_EQ(exposure.overexposedPct, 0.0);
	EXPECT_DOUBLE_EQ(exposure.underexposedPct, 0.0);
}

TEST(QualityMetrics, BlackImage_ZeroContrastAndFullyUnderexposed) {
	const cv::Mat black(32, 48, CV_8UC3, cv::Scalar(0, 0, 0));

	EXPECT_DOUBLE_EQ(contrastRms(black), 0.0);

	const ExposureReport exposure = measureExposure(black);
	EXPECT_DOUBLE_EQ(exposure.score, 0.0);
	EXPECT_DOUBLE_EQ(exposure.underexposedPct, 100.0);
	EXPECT_DOUBLE_EQ(exposure.overexposedPct, 0.0);
	EXPECT_DOUBLE_EQ(exposure.deviation, -128.0);
}

TEST(QualityMetrics, WhiteImage_FullyOverexposed) {
	const cv::Mat white(32, 32, CV_8UC1, cv::Scalar(255));

	const ExposureReport exposure = measureExposure(white);
	EXPECT_NEAR(exposure.score, 100.0 - 127.0 / 128.0 * 100.0, 1e-9);
	EXPECT_DOUBLE_EQ(exposure.overexposedPct, 100.0);
	EXPECT_DOUBLE_EQ(exposure.underexposedPct, 0.0);
	EXPECT_DOUBLE_EQ(exposure.deviation, 127.0);
}

TEST(QualityMetrics, Checkerboard_SharperThanBlurredCopy) {
	const cv::Mat sharp = makeCheckerboard(128, 8, 40, 210);
	const cv::Mat soft  = blurred(sharp);

	EXPECT_GT(sharpnessLaplacian(sharp), sharpnessLaplacian(soft));
	EXPECT_GT(sharpnessTenengrad(sharp), sharpnessTenengrad(soft));
	EXPECT_GT(sharpnessFrequency(sharp), sharpnessFrequency(soft));
	EXPECT_GT(noiseEstimate(sharp), noiseEstimate(soft));
}

TEST(QualityMetrics, FrequencyRatio_StaysInUnitRange) {
	cv::Mat noise(97, 61, CV_8UC1);
	cv::randu(noise, 0, 256);

	for (const cv::Mat& image: {noise, makeCheckerboard(50, 3, 0, 255), blurred(noise)}) {
		const double ratio = sharpnessFrequency(image);
		EXPECT_GE(ratio, 0.0);
		EXPECT_LE(ratio, 1.0);
	}
}

TEST(QualityMetrics, Contrast_IsRelativeToMean) {
	// Half 50, half 150: mean 100, stddev 50 -> 50 %.
	cv::Mat image(20, 20, CV_8UC1, cv::Scalar(50));
	image(cv::Rect(0, 0, 20, 10)).setTo(cv::Scalar(150));

	EXPECT_NEAR(contrastRms(image), 50.0, 1e-9);
}

TEST(QualityMetrics, ChannelLayouts_GiveSameResult) {
	const cv::Mat bgr = makeCheckerboard(64, 4, 30, 220);
	cv::Mat bgra, gray;
	cv::cvtColor(bgr, bgra, cv::COLOR_BGR2BGRA);
	cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

	EXPECT_DOUBLE_EQ(sharpnessLaplacian(bgr), sharpnessLaplacian(gray));
	EXPECT_DOUBLE_EQ(sharpnessLaplacian(bgra), sharpnessLaplacian(gray));
	EXPECT_DOUBLE_EQ(contrastRms(bgra), contrastRms(gray));
}

TEST(QualityMetrics, Bokeh_FlatBackgroundBehindSharpFace) {
	cv::Mat image(120, 120, CV_8UC1, cv::Scalar(90));
	cv::Mat face = image(cv::Rect(30, 30, 60, 60));
	cv::randu(face, 0, 256);

	EXPECT_DOUBLE_EQ(backgroundBokeh(image, cv::Rect(30, 30, 60, 60)), 100.0);
}

TEST(QualityMetrics, Bokeh_FallbackWithoutBackgroundOrFaceDetail) {
	cv::Mat noise(80, 80, CV_8UC1);
	cv::randu(noise, 0, 256);

	// Face box covers the whole image (also when it reaches outside).
	EXPECT_DOUBLE_EQ(backgroundBokeh(noise, cv::Rect(0, 0, 80, 80)), 50.0);
	EXPECT_DOUBLE_EQ(backgroundBokeh(noise, cv::Rect(-10, -10, 200, 200)), 50.0);

	// Flat face.
	cv::Mat flatFace = noise.clone();
	flatFace(cv::Rect(20, 20, 40, 40)).setTo(cv::Scalar(128));
	EXPECT_DOUBLE_EQ(backgroundBokeh(flatFace, cv::Rect(20, 20, 40, 40)), 50.0);

	QualityConfig config{};
	config.bokehFallback = 12.5;
	EXPECT_DOUBLE_EQ(backgroundBokeh(noise, cv::Rect(0, 0, 80, 80), config), 12.5);
}

TEST(QualityMetrics, Bokeh_StaysInRange) {
	cv::Mat image(100, 100, CV_8UC1);
	cv::randu(image, 0, 256);
	image(cv::Rect(40, 40, 20, 20)).setTo(cv::Scalar(100));
	image.at<uchar>(50, 50) = 255; // Barely any detail in the face.

	const double bokeh = backgroundBokeh(image, cv::Rect(40, 40, 20, 20));
	EXPECT_GE(bokeh, 0.0);
	EXPECT_LE(bokeh, 100.0);
}

TEST(QualityMetrics, SharpnessMap_MatchesInputSize) {
	const cv::Mat image = makeCheckerboard(40, 5, 0, 255);
	const cv::Mat map   = localSharpnessMap(image);

	ASSERT_FALSE(map.empty());
	EXPECT_EQ(map.size(), image.size());
	EXPECT_EQ(map.type(), CV_64F);

	double minV = 0.0;
	cv::minMaxLoc(map, &minV);
	EXPECT_GE(minV, 0.0);
}

TEST(QualityMetrics, MeasureQuality_FillsReportAndDebugStage) {
	const cv::Mat image = makeCheckerboard(96, 6, 50, 200);

	DebugVisualizer debugger;
	const QualityReport report = measureQuality(image, cv::Rect(0, 0, image.cols, image.rows), &debugger);

	EXPECT_DOUBLE_EQ(report.sharpnessLaplacian, sharpnessLaplacian(image));
	EXPECT_DOUBLE_EQ(report.contrastRms, contrastRms(image));
	EXPECT_DOUBLE_EQ(report.exposure.meanBrightness, 125.0);
	EXPECT_DOUBLE_EQ(report.bokeh, 50.0);
	EXPECT_EQ(report.sharpnessMap.size(), image.size());

	ASSERT_EQ(debugger.stages().size(), 1u);
	EXPECT_EQ(debugger.stages()[0].name, "Quality");
	EXPECT_EQ(debugger.stages()[0].images.size(), 2u);
	EXPECT_FALSE(debugger.buildMosaic().empty());
}

} // namespace gtest
} // namespace facesharp::analysis::core
