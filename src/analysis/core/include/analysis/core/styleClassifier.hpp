#pragma once

#include "analysis/core/axisScores.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace facesharp::analysis::core {

//! Categorical style label, best to worst.
enum class StyleLabel { God, Mogged, Sigma, Average, Meh, Trash };

std::string_view toString(StyleLabel label);
std::optional<StyleLabel> parseStyleLabel(std::string_view text);

//! Cheap technical flag derived from a single axis.
enum class Tag { VeryBlurry, Blurry, Dark, Overexposed, BadPose, WeakJaw, LowContrast };

std::string_view toString(Tag tag);

//! Outcome of classifying one set of axes.
struct ClassificationResult {
	StyleLabel label{StyleLabel::Meh};
	double confidence{0.0};           //!< 0..1.
	double composite{0.0};            //!< Weighted and penalised aggregate, 0..100.
	std::vector<Tag> tags{};
	std::vector<std::string> reasons{}; //!< Positive reasons first, then negative ones. At most one per axis.
};

//! Composite weights per axis.
struct AxisWeights {
	double sharpness{0.30};
	double lighting{0.18};
	double pose{0.20};
	double jawline{0.22};
	double contrast{0.10};
};

//! Penalty for weak axes. Lighting and contrast use the "light" factors.
struct PenaltyConfig {
	double mildBelow{45.0};
	double severeBelow{30.0};
	double mildFactor{0.09};
	double mildFactorLight{0.06};
	double severeFactor{0.18};
	double severeFactorLight{0.12};
	double capBase{8.0};         //!< Running penalty cap with one penalised axis ...
	double capPerExtraAxis{3.0}; //!< ... plus this for every further penalised axis.
};

struct TagThresholds {
	double veryBlurry{30.0};  //!< sharpness <
	double blurry{45.0};      //!< sharpness <
	double dark{42.0};        //!< lighting <
	double overexposed{88.0}; //!< lighting >
	double badPose{55.0};     //!< pose <
	double weakJaw{52.0};     //!< jawline <
	double lowContrast{45.0}; //!< contrast <
};

struct ReasonThresholds {
	AxisScores goodFrom{80.0, 72.0, 80.0, 76.0, 70.0}; //!< axis >= value -> positive reason.
	AxisScores poorBelow{45.0, 45.0, 55.0, 52.0, 45.0}; //!< axis < value -> negative reason.
};

//! Strong sharpness, jawline and pose decide between mogged and sigma before anything else.
struct HeroConfig {
	double minSharpness{78.0};
	double minJawline{54.0};
	double minPose{60.0};

	double moggedComposite{75.0}; //!< composite >= this, or both of the following, -> mogged.
	double moggedSharpness{75.0};
	double moggedJawline{72.0};

	double moggedBase{0.80};
	double moggedReference{80.0};
	double moggedMaxConfidence{0.96};
	double sigmaBase{0.70};
	double sigmaReference{70.0};
	double sigmaMaxConfidence{0.90};
	double confidenceStep{20.0}; //!< Composite points per 1.0 confidence.
	double confidenceGainCap{0.20};
};

struct TrashConfig {
	double veryBadBelow{30.0};
	int minVeryBadAxes{2};
	double maxComposite{45.0}; //!< Below this, a very_blurry or dark tag is enough.
	double confidenceBase{0.68};
	double confidencePivot{55.0};
	double confidenceGain{0.25};
	double maxConfidence{0.96};
};

//! Plain composite ladder between the overrides and the tiers, and the final fallback.
struct LadderConfig {
	double mehBelow{50.0};
	double mehConfidence{0.60};
	double averageBelow{62.0};
	double averageMinAxis{48.0};
	double averageConfidence{0.55};
	double fallbackAverageComposite{62.0};
	double fallbackAverageMinAxis{55.0};
	double fallbackAverageConfidence{0.54};
	double fallbackMehConfidence{0.56};
};

//! Named confidence band with a composite floor and per-axis floors.
struct TierRule {
	StyleLabel label;
	double minComposite;
	std::vector<std::pair<Axis, double>> floors;
	double minAxis;
	double confidenceBase;
	double confidenceCap;
};

struct ClassifierConfig {
	AxisWeights weights{};
	PenaltyConfig penalty{};
	TagThresholds tags{};
	ReasonThresholds reasons{};
	HeroConfig hero{};
	TrashConfig trash{};
	LadderConfig ladder{};
	//! Checked in order, the first satisfied tier wins.
	std::vector<TierRule> tiers{
	        {StyleLabel::God, 87.0, {{Axis::Sharpness, 80.0}, {Axis::Jawline, 75.0}, {Axis::Pose, 75.0}}, 0.0, 0.75, 0.22},
	        {StyleLabel::Mogged, 78.0, {{Axis::Sharpness, 72.0}, {Axis::Jawline, 70.0}, {Axis::Pose, 68.0}}, 0.0, 0.67, 0.25},
	        {StyleLabel::Sigma, 65.0, {{Axis::Sharpness, 60.0}, {Axis::Jawline, 58.0}}, 50.0, 0.60, 0.27},
	};
	double tierMarginStep{15.0}; //!< Composite points above the tier floor per 1.0 confidence.
	double tierMaxConfidence{0.98};
};

/*! Weighted sum over clamped axes minus the weak-axis penalty.
 *  The penalty cap depends on the number of penalised axes so far and is re-applied after every axis,
 *  walking the axes in ALL_AXES order.
 * \return Composite in 0..100.
 */
double compositeScore(const AxisScores& axes, const ClassifierConfig& config = ClassifierConfig{});

//! very_blurry and blurry are mutually exclusive. Other tags are independent.
std::vector<Tag> classificationTags(const AxisScores& axes, const TagThresholds& thresholds = TagThresholds{});

std::vector<std::string> classificationReasons(const AxisScores& axes, const ReasonThresholds& thresholds = ReasonThresholds{});

//! Maps the five axes onto a style label.
class StyleClassifier {
public:
	virtual ~StyleClassifier() = default;

	//! Deterministic: identical axes give identical results.
	virtual ClassificationResult classify(const AxisScores& axes) const = 0;
	virtual std::string_view name() const = 0;
};

//! Fixed priority ladder: hero override, trash override, composite ladder, tiers, fallback.
class RuleBasedClassifier final : public StyleClassifier {
public:
	explicit RuleBasedClassifier(ClassifierConfig config = ClassifierConfig{});

	ClassificationResult classify(const AxisScores& axes) const override;
	std::string_view name() const override;

	const ClassifierConfig& config() const;

private:
	ClassifierConfig m_config;
};

} // namespace facesharp::analysis::core
