#include "analysis/core/qualityMetrics.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include <opencv2/opencv.hpp>

namespace facesharp::analysis::core {

namespace {

//! Convert image to 8-bit luminance independent of channel format.
static bool toGray8U(const cv::Mat& image, cv::Mat& outGray) {
	if (image.empty()) {
		return false;
	}

	cv::Mat gray;
	switch (image.channels()) {
	case 1:
		gray = image;
		break;
	case 3:
		cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
		break;
	case 4:
		cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
		break;
	default:
		return false;
	}

	if (gray.depth() != CV_8U) {
		gray.convertTo(outGray, CV_8U);
	} else {
		outGray = gray;
	}
	return true;
}

//! Population variance of a single channel matrix.
static double variance(const cv::Mat& values) {
	cv::Scalar mean, stddev;
	cv::meanStdDev(values, mean, stddev);
	return stddev[0] * stddev[0];
}

} // namespace

double sharpnessLaplacian(const cv::Mat& image) {
	cv::Mat gray;
	if (!toGray8U(image, gray)) {
		return 0.0;
	}

	cv::Mat laplacian;
	cv::Laplacian(gray, laplacian, CV_64F);
	return variance(laplacian);
}

double sharpnessTenengrad(const cv::Mat& image) {
	cv::Mat gray;
	if (!toGray8U(image, gray)) {
		return 0.0;
	}

	cv::Mat gx, gy;
	cv::Sobel(gray, gx, CV_64F, 1, 0, 3);
	cv::Sobel(gray, gy, CV_64F, 0, 1, 3);

	const cv::Mat magnitudeSq = gx.mul(gx) + gy.mul(gy);
	return cv::sum(magnitudeSq)[0];
}

double sharpnessFrequency(const cv::Mat& image, const QualityConfig& config) {
	cv::Mat gray;
	if (!toGray8U(image, gray)) {
		return 0.0;
	}

	cv::Mat gray64;
	gray.convertTo(gray64, CV_64F);

	cv::Mat spectrum;
	cv::dft(gray64, spectrum, cv::DFT_COMPLEX_OUTPUT);

	std::vector<cv::Mat> planes;
	cv::split(spectrum, planes);
	cv::Mat magnitude;
	cv::magnitude(planes[0], planes[1], magnitude);

	const int h       = magnitude.rows;
	const int w       = magnitude.cols;
	const int centerX = w / 2;
	const int centerY = h / 2;
	const int radius  = std::min(h, w) / std::max(1, config.frequencyRadiusDivisor);
	const long long radiusSq = static_cast<long long>(radius) * radius;

	// Element (r, c) of the unshifted spectrum sits at ((r + h/2) % h, (c + w/2) % w) once the
	// zero frequency is moved to the centre.
	double total = 0.0;
	double high  = 0.0;
	for (int r = 0; r < h; ++r) {
		const double* row    = magnitude.ptr<double>(r);
		const long long dy   = ((r + h / 2) % h) - centerY;
		for (int c = 0; c < w; ++c) {
			const long long dx = ((c + w / 2) % w) - centerX;
			total += row[c];
			if (dx * dx + dy * dy > radiusSq) {
				high += row[c];
			}
		}
	}

	return total > 0.0 ? high / total : 0.0;
}

double contrastRms(const cv::Mat& image) {
	cv::Mat gray;
	if (!toGray8U(image, gray)) {
		return 0.0;
	}

	cv::Scalar mean, stddev;
	cv::meanStdDev(gray, mean, stddev);
	if (mean[0] == 0.0) {
		return 0.0;
	}
	return stddev[0] / mean[0] * 100.0;
}

ExposureReport measureExposure(const cv::Mat& image, const QualityConfig& config) {
	cv::Mat gray;
	if (!toGray8U(image, gray)) {
		return {};
	}

	const double total = static_cast<double>(gray.total());
	const double mean  = cv::mean(gray)[0];

	ExposureReport report{};
	report.meanBrightness  = mean;
	report.score           = std::clamp(100.0 - std::abs(mean - config.idealBrightness) / config.idealBrightness * 100.0, 0.0, 100.0);
	report.overexposedPct  = static_cast<double>(cv::countNonZero(gray > config.overexposedLevel)) / total * 100.0;
	report.underexposedPct = static_cast<double>(cv::countNonZero(gray < config.underexposedLevel)) / total * 100.0;
	report.deviation       = mean - config.idealBrightness;
	return report;
}

double noiseEstimate(const cv::Mat& image, const QualityConfig& config) {
	cv::Mat gray;
	if (!toGray8U(image, gray)) {
		return 0.0;
	}

	const int k = config.noiseBlurKernel;
	cv::Mat blurred;
	cv::GaussianBlur(gray, blurred, cv::Size(k, k), 0.0);

	cv::Mat gray32, blurred32;
	gray.convertTo(gray32, CV_32F);
	blurred.convertTo(blurred32, CV_32F);

	return std::sqrt(variance(gray32 - blurred32));
}

double backgroundBokeh(const cv::Mat& image, const cv::Rect& faceBox, const QualityConfig& config) {
	cv::Mat gray;
	if (!toGray8U(image, gray)) {
		return config.bokehFallback;
	}

	const cv::Rect face = faceBox & cv::Rect(0, 0, gray.cols, gray.rows);
	// Copy so the filter borders stay inside the face.
	const double faceSharpness = face.area() > 0 ? sharpnessLaplacian(gray(face).clone()) : 0.0;

	// Background pixels in row-major order, laid out as a single column.
	std::vector<uchar> background;
	background.reserve(gray.total() - static_cast<std::size_t>(face.area()));
	for (int r = 0; r < gray.rows; ++r) {
		const uchar* row = gray.ptr<uchar>(r);
		for (int c = 0; c < gray.cols; ++c) {
			if (!face.contains(cv::Point(c, r))) {
				background.push_back(row[c]);
			}
		}
	}

	if (background.empty() || faceSharpness <= 0.0) {
		return config.bokehFallback;
	}

	const cv::Mat column(static_cast<int>(background.size()), 1, CV_8U, background.data());
	const double bgSharpness = sharpnessLaplacian(column);
	return std::min(100.0, std::max(0.0, (1.0 - bgSharpness / faceSharpness) * 100.0));
}

cv::Mat localSharpnessMap(const cv::Mat& image, const QualityConfig& config) {
	cv::Mat gray;
	if (!toGray8U(image, gray)) {
		return {};
	}

	cv::Mat laplacian;
	cv::Laplacian(gray, laplacian, CV_64F, config.sharpnessMapKernel);
	return cv::abs(laplacian);
}

QualityReport measureQuality(const cv::Mat& faceRegion, const cv::Rect& faceBox, DebugVisualizer* debugger, const QualityConfig& config) {
	QualityReport report{};
	report.sharpnessLaplacian = sharpnessLaplacian(faceRegion);
	report.sharpnessTenengrad = sharpnessTenengrad(faceRegion);
	report.sharpnessFrequency = sharpnessFrequency(faceRegion, config);
	report.contrastRms        = contrastRms(faceRegion);
	report.exposure           = measureExposure(faceRegion, config);
	report.noise              = noiseEstimate(faceRegion, config);
	report.bokeh              = backgroundBokeh(faceRegion, faceBox, config);
	report.sharpnessMap       = localSharpnessMap(faceRegion, config);

	if (debugger) {
		cv::Mat gray;
		debugger->beginStage("Quality");
		if (toGray8U(faceRegion, gray)) {
			debugger->add("Luminance", gray);
		}
		if (!report.sharpnessMap.empty()) {
			debugger->add("Sharpness Map", report.sharpnessMap);
		}
		debugger->endStage();
	}

	return report;
}

} // namespace facesharp::analysis::core
