#include "analysis/core/styleClassifier.hpp"

#include <algorithm>
#include <array>

namespace facesharp::analysis::core {

namespace {

static bool isLightAxis(const Axis axis) {
	return axis == Axis::Lighting || axis == Axis::Contrast;
}

static double weightOf(const AxisWeights& weights, const Axis axis) {
	switch (axis) {
	case Axis::Sharpness:
		return weights.sharpness;
	case Axis::Lighting:
		return weights.lighting;
	case Axis::Pose:
		return weights.pose;
	case Axis::Jawline:
		return weights.jawline;
	case Axis::Contrast:
		return weights.contrast;
	}
	return 0.0;
}

static bool hasTag(const std::vector<Tag>& tags, const Tag tag) {
	return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

static bool meetsTier(const TierRule& tier, const AxisScores& axes, const double composite) {
	if (composite < tier.minComposite || axes.min() < tier.minAxis) {
		return false;
	}
	return std::all_of(tier.floors.begin(), tier.floors.end(), [&](const auto& floor) { return axes[floor.first] >= floor.second; });
}

} // namespace

std::string_view toString(const StyleLabel label) {
	switch (label) {
	case StyleLabel::God:
		return "god";
	case StyleLabel::Mogged:
		return "mogged";
	case StyleLabel::Sigma:
		return "sigma";
	case StyleLabel::Average:
		return "average";
	case StyleLabel::Meh:
		return "meh";
	case StyleLabel::Trash:
		return "trash";
	}
	return "meh";
}

std::optional<StyleLabel> parseStyleLabel(const std::string_view text) {
	static constexpr std::array<StyleLabel, 6> LABELS = {
	        StyleLabel::God, StyleLabel::Mogged, StyleLabel::Sigma, StyleLabel::Average, StyleLabel::Meh, StyleLabel::Trash,
	};

	const auto it = std::find_if(LABELS.begin(), LABELS.end(), [&](StyleLabel label) { return toString(label) == text; });
	if (it == LABELS.end()) {
		return std::nullopt;
	}
	return *it;
}

std::string_view toString(const Tag tag) {
	switch (tag) {
	case Tag::VeryBlurry:
		return "very_blurry";
	case Tag::Blurry:
		return "blurry";
	case Tag::Dark:
		return "dark";
	case Tag::Overexposed:
		return "overexposed";
	case Tag::BadPose:
		return "bad_pose";
	case Tag::WeakJaw:
		return "weak_jaw";
	case Tag::LowContrast:
		return "low_contrast";
	}
	return "unknown";
}

double compositeScore(const AxisScores& axes, const ClassifierConfig& config) {
	double score = 0.0;
	for (const Axis axis: ALL_AXES) {
		score += weightOf(config.weights, axis) * std::clamp(axes[axis], 0.0, 100.0);
	}

	const PenaltyConfig& p = config.penalty;
	double penalty         = 0.0;
	int penalisedAxes      = 0;
	for (const Axis axis: ALL_AXES) {
		const double v     = axes[axis];
		const bool light   = isLightAxis(axis);

		if (v < p.mildBelow) {
			++penalisedAxes;
			penalty += (p.mildBelow - v) * (light ? p.mildFactorLight : p.mildFactor);
		}
		if (v < p.severeBelow) {
			penalty += (p.severeBelow - v) * (light ? p.severeFactorLight : p.severeFactor);
		}
		// Cap grows with the penalised count seen so far. Applied per axis, not once at the end.
		if (penalisedAxes > 0) {
			penalty = std::min(penalty, p.capBase + p.capPerExtraAxis * static_cast<double>(penalisedAxes - 1));
		}
	}

	return std::clamp(score - penalty, 0.0, 100.0);
}

std::vector<Tag> classificationTags(const AxisScores& axes, const TagThresholds& thresholds) {
	std::vector<Tag> tags;
	if (axes.sharpness < thresholds.veryBlurry) {
		tags.push_back(Tag::VeryBlurry);
	} else if (axes.sharpness < thresholds.blurry) {
		tags.push_back(Tag::Blurry);
	}
	if (axes.lighting < thresholds.dark) {
		tags.push_back(Tag::Dark);
	}
	if (axes.lighting > thresholds.overexposed) {
		tags.push_back(Tag::Overexposed);
	}
	if (axes.pose < thresholds.badPose) {
		tags.push_back(Tag::BadPose);
	}
	if (axes.jawline < thresholds.weakJaw) {
		tags.push_back(Tag::WeakJaw);
	}
	if (axes.contrast < thresholds.lowContrast) {
		tags.push_back(Tag::LowContrast);
	}
	return tags;
}

std::vector<std::string> classificationReasons(const AxisScores& axes, const ReasonThresholds& thresholds) {
	struct ReasonText {
		Axis axis;
		const char* good;
		const char* poor;
	};
	static constexpr std::array<ReasonText, 5> TEXTS = {{
	        {Axis::Sharpness, "very high sharpness", "low sharpness"},
	        {Axis::Lighting, "good lighting", "insufficient lighting"},
	        {Axis::Pose, "good angle/pose", "suboptimal pose/angle"},
	        {Axis::Jawline, "strong jawline", "weak jawline"},
	        {Axis::Contrast, "sufficient contrast", "low contrast"},
	}};

	std::vector<std::string> reasons;
	for (const ReasonText& text: TEXTS) {
		if (axes[text.axis] >= thresholds.goodFrom[text.axis]) {
			reasons.emplace_back(text.good);
		}
	}
	for (const ReasonText& text: TEXTS) {
		if (axes[text.axis] < thresholds.poorBelow[text.axis]) {
			reasons.emplace_back(text.poor);
		}
	}
	return reasons;
}

RuleBasedClassifier::RuleBasedClassifier(ClassifierConfig config) : m_config(std::move(config)) {
}

std::string_view RuleBasedClassifier::name() const {
	return "rule_based";
}

const ClassifierConfig& RuleBasedClassifier::config() const {
	return m_config;
}

ClassificationResult RuleBasedClassifier::classify(const AxisScores& axes) const {
	ClassificationResult result{};
	result.tags      = classificationTags(axes, m_config.tags);
	result.reasons   = classificationReasons(axes, m_config.reasons);
	result.composite = compositeScore(axes, m_config);

	const double composite = result.composite;
	const double minAxis   = axes.min();

	const auto decide = [&](StyleLabel label, double confidence) {
		result.label      = label;
		result.confidence = confidence;
		return result;
	};

	// 1) Hero override. The confidence is not lifted to its base when the composite sits below the reference.
	const HeroConfig& hero = m_config.hero;
	if (axes.sharpness >= hero.minSharpness && axes.jawline >= hero.minJawline && axes.pose >= hero.minPose) {
		if (composite >= hero.moggedComposite || (axes.sharpness >= hero.moggedSharpness && axes.jawline >= hero.moggedJawline)) {
			const double gain = std::min(hero.confidenceGainCap, (composite - hero.moggedReference) / hero.confidenceStep);
			return decide(StyleLabel::Mogged, std::clamp(hero.moggedBase + gain, 0.0, hero.moggedMaxConfidence));
		}
		const double gain = std::min(hero.confidenceGainCap, std::max(0.0, composite - hero.sigmaReference) / hero.confidenceStep);
		return decide(StyleLabel::Sigma, std::min(hero.sigmaBase + gain, hero.sigmaMaxConfidence));
	}

	// 2) Trash override.
	const TrashConfig& trash = m_config.trash;
	const auto veryBadAxes   = std::count_if(ALL_AXES.begin(), ALL_AXES.end(), [&](Axis axis) { return axes[axis] < trash.veryBadBelow; });
	const bool obviousDefect = composite < trash.maxComposite && (hasTag(result.tags, Tag::VeryBlurry) || hasTag(result.tags, Tag::Dark));
	if (veryBadAxes >= trash.minVeryBadAxes || obviousDefect) {
		const double confidence = trash.confidenceBase + std::max(0.0, trash.confidencePivot - composite) / trash.confidencePivot * trash.confidenceGain;
		return decide(StyleLabel::Trash, std::min(confidence, trash.maxConfidence));
	}

	// 3) + 4) Composite ladder.
	const LadderConfig& ladder = m_config.ladder;
	if (composite < ladder.mehBelow) {
		return decide(StyleLabel::Meh, ladder.mehConfidence);
	}
	if (composite < ladder.averageBelow || minAxis < ladder.averageMinAxis) {
		return decide(StyleLabel::Average, ladder.averageConfidence);
	}

	// 5) Tiers.
	for (const TierRule& tier: m_config.tiers) {
		if (meetsTier(tier, axes, composite)) {
			const double margin = std::max(0.0, composite - tier.minComposite);
			const double gain   = std::min(tier.confidenceCap, margin / m_config.tierMarginStep);
			return decide(tier.label, std::min(tier.confidenceBase + gain, m_config.tierMaxConfidence));
		}
	}

	// 6) Fallback.
	if (composite >= ladder.fallbackAverageComposite && minAxis >= ladder.fallbackAverageMinAxis) {
		return decide(StyleLabel::Average, ladder.fallbackAverageConfidence);
	}
	return decide(StyleLabel::Meh, ladder.fallbackMehConfidence);
}

} // namespace facesharp::analysis::core
