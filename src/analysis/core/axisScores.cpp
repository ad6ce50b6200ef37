#include "analysis/core/axisScores.hpp"

#include "statistics.hpp"

#include <algorithm>

namespace facesharp::analysis::core {

std::string_view toString(const Axis axis) {
	switch (axis) {
	case Axis::Sharpness:
		return "sharpness";
	case Axis::Lighting:
		return "lighting";
	case Axis::Pose:
		return "pose";
	case Axis::Jawline:
		return "jawline";
	case Axis::Contrast:
		return "contrast";
	}
	return "unknown";
}

double AxisScores::operator[](const Axis axis) const {
	switch (axis) {
	case Axis::Sharpness:
		return sharpness;
	case Axis::Lighting:
		return lighting;
	case Axis::Pose:
		return pose;
	case Axis::Jawline:
		return jawline;
	case Axis::Contrast:
		return contrast;
	}
	return 0.0;
}

double AxisScores::mean() const {
	return core::mean({sharpness, lighting, pose, jawline, contrast});
}

double AxisScores::min() const {
	return std::min({sharpness, lighting, pose, jawline, contrast});
}

AxisScores aggregateAxes(const QualityReport& quality, const std::optional<Pose>& pose, const std::optional<Proportions>& proportions,
                         const AxisConfig& config) {
	AxisScores axes{};

	axes.sharpness = std::min(100.0, quality.sharpnessLaplacian / config.laplacianScale * config.laplacianWeight +
	                                         quality.sharpnessTenengrad / config.tenengradScale * config.tenengradWeight +
	                                         quality.sharpnessFrequency * config.frequencyWeight);

	const ExposureReport& exposure = quality.exposure;
	axes.lighting = exposure.score * config.exposureWeight + (100.0 - exposure.overexposedPct - exposure.underexposedPct) * config.clippingWeight;

	axes.pose     = pose ? poseScore(*pose, config.geometry) : config.missingMeshScore;
	axes.jawline  = proportions ? jawlineScore(*proportions, config.geometry) : config.missingMeshScore;
	axes.contrast = std::min(100.0, quality.contrastRms * config.contrastGain);

	return axes;
}

} // namespace facesharp::analysis::core
