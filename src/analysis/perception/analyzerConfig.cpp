#include "analysis/analyzerConfig.hpp"

#include <algorithm>
#include <iostream>

#include <yaml-cpp/yaml.h>

namespace facesharp::analysis {

namespace {

//! Overwrite value if the key exists. Throws YAML::BadConversion on a type mismatch.
template <typename T>
static void read(const YAML::Node& node, const char* key, T& value) {
	if (const YAML::Node child = node[key]) {
		value = child.as<T>();
	}
}

static void readAxisScores(const YAML::Node& node, core::AxisScores& axes) {
	if (!node) {
		return;
	}
	read(node, "sharpness", axes.sharpness);
	read(node, "lighting", axes.lighting);
	read(node, "pose", axes.pose);
	read(node, "jawline", axes.jawline);
	read(node, "contrast", axes.contrast);
}

static void readDetector(const YAML::Node& node, DetectorConfig& cfg) {
	if (!node) {
		return;
	}
	read(node, "faceModel", cfg.faceModelPath);
	read(node, "meshModel", cfg.meshModelPath);
	read(node, "scoreThreshold", cfg.scoreThreshold);
	read(node, "nmsThreshold", cfg.nmsThreshold);
	read(node, "topK", cfg.topK);
	read(node, "meshMargin", cfg.meshMargin);
	read(node, "meshInputSize", cfg.meshInputSize);
}

static void readQuality(const YAML::Node& node, core::QualityConfig& cfg) {
	if (!node) {
		return;
	}
	read(node, "overexposedLevel", cfg.overexposedLevel);
	read(node, "underexposedLevel", cfg.underexposedLevel);
	read(node, "idealBrightness", cfg.idealBrightness);
	read(node, "noiseBlurKernel", cfg.noiseBlurKernel);
	read(node, "sharpnessMapKernel", cfg.sharpnessMapKernel);
	read(node, "frequencyRadiusDivisor", cfg.frequencyRadiusDivisor);
	read(node, "bokehFallback", cfg.bokehFallback);
}

static void readAxes(const YAML::Node& node, core::AxisConfig& cfg) {
	if (!node) {
		return;
	}
	read(node, "laplacianScale", cfg.laplacianScale);
	read(node, "laplacianWeight", cfg.laplacianWeight);
	read(node, "tenengradScale", cfg.tenengradScale);
	read(node, "tenengradWeight", cfg.tenengradWeight);
	read(node, "frequencyWeight", cfg.frequencyWeight);
	read(node, "contrastGain", cfg.contrastGain);
	read(node, "exposureWeight", cfg.exposureWeight);
	read(node, "clippingWeight", cfg.clippingWeight);
	read(node, "missingMeshScore", cfg.missingMeshScore);

	if (const YAML::Node geometry = node["geometry"]) {
		core::GeometryConfig& g = cfg.geometry;
		read(geometry, "anglePenaltyPerDegree", g.anglePenaltyPerDegree);
		read(geometry, "yawWeight", g.yawWeight);
		read(geometry, "pitchWeight", g.pitchWeight);
		read(geometry, "rollWeight", g.rollWeight);
		read(geometry, "idealJawAngle", g.idealJawAngle);
		read(geometry, "jawAngleWeight", g.jawAngleWeight);
		read(geometry, "symmetryWeight", g.symmetryWeight);
	}
}

//! Only the composite floor and the confidence band of a tier are configurable. Axis floors are fixed.
static bool readTiers(const YAML::Node& node, std::vector<core::TierRule>& tiers) {
	if (!node) {
		return true;
	}
	for (const auto& entry: node) {
		const std::string name                = entry.first.as<std::string>();
		const std::optional<core::StyleLabel> label = core::parseStyleLabel(name);
		const auto tier = std::find_if(tiers.begin(), tiers.end(), [&](const core::TierRule& t) { return label && t.label == *label; });
		if (tier == tiers.end()) {
			std::cerr << "[Config] Unknown tier '" << name << "'.\n";
			return false;
		}
		read(entry.second, "minComposite", tier->minComposite);
		read(entry.second, "minAxis", tier->minAxis);
		read(entry.second, "confidenceBase", tier->confidenceBase);
		read(entry.second, "confidenceCap", tier->confidenceCap);
	}
	return true;
}

static bool readClassifier(const YAML::Node& node, core::ClassifierConfig& cfg) {
	if (!node) {
		return true;
	}
	if (const YAML::Node weights = node["weights"]) {
		read(weights, "sharpness", cfg.weights.sharpness);
		read(weights, "lighting", cfg.weights.lighting);
		read(weights, "pose", cfg.weights.pose);
		read(weights, "jawline", cfg.weights.jawline);
		read(weights, "contrast", cfg.weights.contrast);
	}
	if (const YAML::Node penalty = node["penalty"]) {
		read(penalty, "mildBelow", cfg.penalty.mildBelow);
		read(penalty, "severeBelow", cfg.penalty.severeBelow);
		read(penalty, "capBase", cfg.penalty.capBase);
		read(penalty, "capPerExtraAxis", cfg.penalty.capPerExtraAxis);
	}
	if (const YAML::Node tags = node["tags"]) {
		read(tags, "veryBlurry", cfg.tags.veryBlurry);
		read(tags, "blurry", cfg.tags.blurry);
		read(tags, "dark", cfg.tags.dark);
		read(tags, "overexposed", cfg.tags.overexposed);
		read(tags, "badPose", cfg.tags.badPose);
		read(tags, "weakJaw", cfg.tags.weakJaw);
		read(tags, "lowContrast", cfg.tags.lowContrast);
	}
	if (const YAML::Node reasons = node["reasons"]) {
		readAxisScores(reasons["goodFrom"], cfg.reasons.goodFrom);
		readAxisScores(reasons["poorBelow"], cfg.reasons.poorBelow);
	}
	if (const YAML::Node hero = node["hero"]) {
		read(hero, "minSharpness", cfg.hero.minSharpness);
		read(hero, "minJawline", cfg.hero.minJawline);
		read(hero, "minPose", cfg.hero.minPose);
		read(hero, "moggedComposite", cfg.hero.moggedComposite);
	}
	if (const YAML::Node trash = node["trash"]) {
		read(trash, "veryBadBelow", cfg.trash.veryBadBelow);
		read(trash, "minVeryBadAxes", cfg.trash.minVeryBadAxes);
		read(trash, "maxComposite", cfg.trash.maxComposite);
	}
	read(node, "tierMarginStep", cfg.tierMarginStep);
	return readTiers(node["tiers"], cfg.tiers);
}

static void readAbstention(const YAML::Node& node, AbstentionConfig& cfg) {
	if (!node) {
		return;
	}
	read(node, "minDetectionConfidence", cfg.minDetectionConfidence);
	read(node, "maxAbsYaw", cfg.maxAbsYaw);
	read(node, "maxAbsPitch", cfg.maxAbsPitch);
	read(node, "minMeanAxis", cfg.minMeanAxis);
}

static void readReasons(const YAML::Node& node, ReasonConfig& cfg) {
	if (!node) {
		return;
	}
	read(node, "poseNoteDegrees", cfg.poseNoteDegrees);
	read(node, "exposureNoteDeviation", cfg.exposureNoteDeviation);
	read(node, "symmetryNoteBelow", cfg.symmetryNoteBelow);
}

//! Values the pipeline divides by or hands to OpenCV as kernel sizes.
static bool isValidConfig(const AnalyzerConfig& cfg) {
	const auto isOddKernel = [](int k) { return k > 0 && k % 2 == 1; };

	if (!isOddKernel(cfg.quality.noiseBlurKernel) || !isOddKernel(cfg.quality.sharpnessMapKernel) || cfg.quality.sharpnessMapKernel > 31) {
		std::cerr << "[Config] Kernel sizes must be odd and positive (sharpness map at most 31).\n";
		return false;
	}
	if (cfg.quality.frequencyRadiusDivisor <= 0) {
		std::cerr << "[Config] quality.frequencyRadiusDivisor must be positive.\n";
		return false;
	}
	if (cfg.quality.idealBrightness <= 0.0) {
		std::cerr << "[Config] quality.idealBrightness must be positive.\n";
		return false;
	}
	if (cfg.axes.laplacianScale <= 0.0 || cfg.axes.tenengradScale <= 0.0) {
		std::cerr << "[Config] Sharpness scales must be positive.\n";
		return false;
	}
	if (cfg.classifier.tierMarginStep <= 0.0) {
		std::cerr << "[Config] classifier.tierMarginStep must be positive.\n";
		return false;
	}
	if (cfg.detector.meshInputSize <= 0 || cfg.detector.meshMargin < 0.0) {
		std::cerr << "[Config] Invalid mesh input size or margin.\n";
		return false;
	}
	return true;
}

} // namespace

std::optional<AnalyzerConfig> loadAnalyzerConfig(const std::string& path) {
	AnalyzerConfig config{};

	try {
		const YAML::Node root = YAML::LoadFile(path);
		if (!root.IsMap()) {
			if (root.IsNull()) {
				return config; // Empty file: all defaults.
			}
			std::cerr << "[Config] '" << path << "' must hold a mapping.\n";
			return std::nullopt;
		}

		read(root, "modelVersion", config.modelVersion);
		readDetector(root["detector"], config.detector);
		readQuality(root["quality"], config.quality);
		readAxes(root["axes"], config.axes);
		if (!readClassifier(root["classifier"], config.classifier)) {
			return std::nullopt;
		}
		readAbstention(root["abstention"], config.abstention);
		readReasons(root["reasons"], config.reasons);
	} catch (const YAML::Exception& e) {
		std::cerr << "[Config] Failed to load '" << path << "': " << e.what() << "\n";
		return std::nullopt;
	}

	if (!isValidConfig(config)) {
		return std::nullopt;
	}
	return config;
}

} // namespace facesharp::analysis
