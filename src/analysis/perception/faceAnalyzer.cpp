#include "analysis/faceAnalyzer.hpp"

#include "analysis/core/axisScores.hpp"
#include "analysis/core/qualityMetrics.hpp"

#include <cmath>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string_view>

#include <opencv2/imgcodecs.hpp>

namespace facesharp::analysis {

namespace {

//! Enable per-stage pipeline diagnostics via environment variable.
static bool analyzerDebugEnabled() {
	const char* env = std::getenv("FACESHARP_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

static void logAxes(const core::AxisScores& axes, const double composite) {
	std::cerr << std::format("[FaceAnalyzer] axes sharpness={:.1f} lighting={:.1f} pose={:.1f} jawline={:.1f} contrast={:.1f} composite={:.1f}\n",
	                         axes.sharpness, axes.lighting, axes.pose, axes.jawline, axes.contrast, composite);
}

} // namespace

bool shouldAbstain(const double detectionConfidence, const std::optional<core::Pose>& pose, const core::AxisScores& axes,
                   const AbstentionConfig& config) {
	if (detectionConfidence < config.minDetectionConfidence) {
		return true;
	}
	if (pose && (std::abs(pose->yaw) > config.maxAbsYaw || std::abs(pose->pitch) > config.maxAbsPitch)) {
		return true;
	}
	return axes.mean() < config.minMeanAxis;
}

std::vector<std::string> additionalReasons(const std::optional<core::Pose>& pose, const core::ExposureReport& exposure,
                                           const std::optional<core::Proportions>& proportions, const ReasonConfig& config) {
	std::vector<std::string> reasons;
	if (pose) {
		if (std::abs(pose->yaw) > config.poseNoteDegrees) {
			reasons.push_back(std::format("head turned sideways (yaw≈{:.1f}°)", pose->yaw));
		}
		if (std::abs(pose->pitch) > config.poseNoteDegrees) {
			reasons.push_back(std::format("head tilted (pitch≈{:.1f}°)", pose->pitch));
		}
	}
	if (std::abs(exposure.deviation) > config.exposureNoteDeviation) {
		reasons.push_back(std::format("exposure {:+.0f}", exposure.deviation));
	}
	if (proportions && proportions->symmetry < config.symmetryNoteBelow) {
		reasons.emplace_back("low facial symmetry");
	}
	return reasons;
}

FaceAnalyzer::FaceAnalyzer(std::unique_ptr<FaceDetector> detector, AnalyzerConfig config, std::unique_ptr<core::StyleClassifier> classifier)
        : m_config(std::move(config)), m_detector(std::move(detector)), m_classifier(std::move(classifier)) {
	if (!m_classifier) {
		m_classifier = std::make_unique<core::RuleBasedClassifier>(m_config.classifier);
	}
}

FaceAnalyzer::~FaceAnalyzer() {
	release();
}

bool FaceAnalyzer::initialize() {
	if (m_initialized) {
		return true;
	}
	if (!m_detector) {
		std::cerr << "[FaceAnalyzer] No face detector set.\n";
		return false;
	}

	m_initialized = m_detector->initialize();
	if (!m_initialized) {
		std::cerr << "[FaceAnalyzer] Face detector initialisation failed.\n";
	}
	return m_initialized;
}

void FaceAnalyzer::release() {
	if (m_initialized && m_detector) {
		m_detector->release();
	}
	m_initialized = false;
}

bool FaceAnalyzer::isInitialized() const {
	return m_initialized;
}

const AnalyzerConfig& FaceAnalyzer::config() const {
	return m_config;
}

AnalysisResult FaceAnalyzer::failure(const std::string& reason) const {
	AnalysisResult result{};
	result.ok           = false;
	result.abstain      = true;
	result.label        = core::StyleLabel::Meh;
	result.confidence   = 0.0;
	result.reasons      = {reason};
	result.modelVersion = m_config.modelVersion;
	return result;
}

AnalysisResult FaceAnalyzer::analyzeFile(const std::string& path, core::DebugVisualizer* debugger) const {
	const cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
	if (image.empty()) {
		std::cerr << "[FaceAnalyzer] Could not decode '" << path << "'\n";
		return failure("could not load image");
	}
	return analyze(image, debugger);
}

AnalysisResult FaceAnalyzer::analyze(const cv::Mat& image, core::DebugVisualizer* debugger) const {
	const bool verbose = analyzerDebugEnabled();

	if (image.empty()) {
		return failure("could not load image");
	}

	// 1) Detection. An uninitialised detector never reports a face.
	std::optional<core::FaceLandmarks> landmarks;
	if (m_initialized) {
		landmarks = m_detector->detect(image);
	}
	if (!landmarks) {
		if (verbose) {
			std::cerr << "[FaceAnalyzer] No face detected.\n";
		}
		return failure("no face detected");
	}

	// 2) Crop. The box may reach outside the image.
	const cv::Rect& bbox  = landmarks->bbox;
	const cv::Rect region = bbox & cv::Rect(0, 0, image.cols, image.rows);
	if (region.area() <= 0) {
		if (verbose) {
			std::cerr << std::format("[FaceAnalyzer] Face box ({}, {}, {}x{}) outside image.\n", bbox.x, bbox.y, bbox.width, bbox.height);
		}
		return failure("could not extract face region");
	}
	const cv::Mat faceRegion = image(region).clone(); // Filters must not read pixels around the crop.

	if (debugger) {
		debugger->beginStage("Detection");
		debugger->add("Face", drawFaceOverlay(image, *landmarks));
		debugger->add("Crop", faceRegion);
		debugger->endStage();
	}

	// 3) Quality metrics. The whole crop counts as face.
	const core::QualityReport quality = core::measureQuality(faceRegion, cv::Rect(0, 0, bbox.width, bbox.height), debugger, m_config.quality);

	// 4) Geometry. Only with a mesh, whatever its point count.
	std::optional<core::Pose> pose;
	std::optional<core::Proportions> proportions;
	if (landmarks->mesh) {
		pose        = core::estimatePose(*landmarks->mesh);
		proportions = core::measureProportions(*landmarks->mesh);
	}

	// 5) Axes, abstention and classification.
	const core::AxisScores axes                 = core::aggregateAxes(quality, pose, proportions, m_config.axes);
	const bool abstain                          = shouldAbstain(landmarks->confidence, pose, axes, m_config.abstention);
	const core::ClassificationResult classified = m_classifier->classify(axes);

	AnalysisResult result{};
	result.ok           = true;
	result.axes         = axes;
	result.label        = classified.label;
	result.confidence   = classified.confidence;
	result.abstain      = abstain;
	result.modelVersion = m_config.modelVersion;
	result.pose         = pose;
	result.proportions  = proportions;
	result.quality      = quality;
	result.composite    = classified.composite;
	result.tags         = classified.tags;

	result.reasons = classified.reasons;
	for (auto& reason: additionalReasons(pose, quality.exposure, proportions, m_config.reasons)) {
		result.reasons.push_back(std::move(reason));
	}

	if (verbose) {
		logAxes(axes, classified.composite);
		std::cerr << std::format("[FaceAnalyzer] label={} confidence={:.2f} abstain={} classifier={}\n", core::toString(result.label), result.confidence,
		                         result.abstain, m_classifier->name());
	}

	if (debugger) {
		std::vector<std::string> lines{
		        std::format("label: {} ({:.2f}){}", core::toString(result.label), result.confidence, result.abstain ? " abstain" : ""),
		        std::format("composite: {:.1f}", result.composite),
		};
		for (const core::Axis axis: core::ALL_AXES) {
			lines.push_back(std::format("{}: {:.1f}", core::toString(axis), axes[axis]));
		}
		debugger->beginStage("Result");
		debugger->add("Summary", core::renderTextCard(lines));
		debugger->endStage();
	}

	return result;
}

} // namespace facesharp::analysis
