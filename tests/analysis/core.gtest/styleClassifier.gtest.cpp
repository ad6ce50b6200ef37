#include "analysis/core/styleClassifier.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <set>
#include <string>

namespace facesharp::analysis::core {
namespace gtest {

static bool hasTag(const ClassificationResult& result, Tag tag) {
	return std::find(result.tags.begin(), result.tags.end(), tag) != result.tags.end();
}

//! Composite with a single cap applied after all axes. Differs from compositeScore when the running cap bites early.
static double compositeWithFinalCap(const AxisScores& axes) {
	const ClassifierConfig config{};
	double score = 0.0;
	score += config.weights.sharpness * std::clamp(axes.sharpness, 0.0, 100.0);
	score += config.weights.lighting * std::clamp(axes.lighting, 0.0, 100.0);
	score += config.weights.pose * std::clamp(axes.pose, 0.0, 100.0);
	score += config.weights.jawline * std::clamp(axes.jawline, 0.0, 100.0);
	score += config.weights.contrast * std::clamp(axes.contrast, 0.0, 100.0);

	double penalty = 0.0;
	int count      = 0;
	for (const Axis axis: ALL_AXES) {
		const bool light = axis == Axis::Lighting || axis == Axis::Contrast;
		const double v   = axes[axis];
		if (v < 45.0) {
			++count;
			penalty += (45.0 - v) * (light ? 0.06 : 0.09);
		}
		if (v < 30.0) {
			penalty += (30.0 - v) * (light ? 0.12 : 0.18);
		}
	}
	if (count > 0) {
		penalty = std::min(penalty, 8.0 + 3.0 * (count - 1));
	}
	return std::clamp(score - penalty, 0.0, 100.0);
}

TEST(StyleClassifier, StrongFace_HeroMoggedBelowReference) {
	const RuleBasedClassifier classifier;
	const ClassificationResult r = classifier.classify({90.0, 70.0, 70.0, 80.0, 70.0});

	EXPECT_NEAR(r.composite, 78.2, 1e-9);
	EXPECT_EQ(r.label, StyleLabel::Mogged);
	// Composite below 80 lowers the confidence under the 0.80 base.
	EXPECT_NEAR(r.confidence, 0.80 + (78.2 - 80.0) / 20.0, 1e-9);
	EXPECT_NEAR(r.confidence, 0.71, 1e-9);
	EXPECT_TRUE(r.tags.empty());
	EXPECT_EQ(r.reasons, (std::vector<std::string>{"very high sharpness", "strong jawline", "sufficient contrast"}));
}

TEST(StyleClassifier, HeroMoggedLowComposite_ConfidenceFlooredAtZero) {
	const RuleBasedClassifier classifier;

	// Sharp face with a strong jaw takes the mogged branch even though lighting and contrast drag the composite far below the reference.
	const ClassificationResult dark = classifier.classify({80.0, 0.0, 60.0, 80.0, 0.0});
	EXPECT_EQ(dark.label, StyleLabel::Mogged);
	EXPECT_LT(dark.composite, 50.0);
	EXPECT_DOUBLE_EQ(dark.confidence, 0.0);

	const ClassificationResult dim = classifier.classify({78.0, 30.0, 60.0, 72.0, 30.0});
	EXPECT_EQ(dim.label, StyleLabel::Mogged);
	EXPECT_LT(dim.composite, 60.0);
	EXPECT_DOUBLE_EQ(dim.confidence, 0.0);
}

TEST(StyleClassifier, AllAxesLow_Trash) {
	const RuleBasedClassifier classifier;
	const ClassificationResult r = classifier.classify({20.0, 20.0, 20.0, 20.0, 20.0});

	EXPECT_NEAR(r.composite, 2.45, 1e-9);
	EXPECT_EQ(r.label, StyleLabel::Trash);
	EXPECT_NEAR(r.confidence, 0.68 + (55.0 - 2.45) / 55.0 * 0.25, 1e-9);

	EXPECT_TRUE(hasTag(r, Tag::VeryBlurry));
	EXPECT_FALSE(hasTag(r, Tag::Blurry));
	EXPECT_TRUE(hasTag(r, Tag::Dark));
	EXPECT_TRUE(hasTag(r, Tag::BadPose));
	EXPECT_TRUE(hasTag(r, Tag::WeakJaw));
	EXPECT_TRUE(hasTag(r, Tag::LowContrast));
	EXPECT_EQ(r.reasons.size(), 5u);
}

TEST(StyleClassifier, AllAxesFifty_Average) {
	const RuleBasedClassifier classifier;
	const ClassificationResult r = classifier.classify({50.0, 50.0, 50.0, 50.0, 50.0});

	EXPECT_NEAR(r.composite, 50.0, 1e-9);
	EXPECT_EQ(r.label, StyleLabel::Average);
	EXPECT_DOUBLE_EQ(r.confidence, 0.55);
	EXPECT_EQ(r.tags, (std::vector<Tag>{Tag::BadPose, Tag::WeakJaw}));
	EXPECT_EQ(r.reasons, (std::vector<std::string>{"suboptimal pose/angle", "weak jawline"}));
}

TEST(StyleClassifier, PenaltyCap_ReappliedPerAxis) {
	const AxisScores axes{0.0, 40.0, 100.0, 100.0, 100.0};

	// Sharpness alone exceeds the first cap (9.45 -> 8.0); lighting then adds 0.3 under the raised cap.
	EXPECT_NEAR(compositeScore(axes), 59.2 - 8.3, 1e-9);
	EXPECT_NEAR(compositeWithFinalCap(axes), 59.2 - 9.75, 1e-9);
	EXPECT_GT(compositeScore(axes), compositeWithFinalCap(axes));

	const ClassificationResult r = RuleBasedClassifier{}.classify(axes);
	EXPECT_EQ(r.label, StyleLabel::Average); // min axis 0 < 48
	EXPECT_DOUBLE_EQ(r.confidence, 0.55);
}

TEST(StyleClassifier, CompositeClampedToRange) {
	EXPECT_DOUBLE_EQ(compositeScore({150.0, 150.0, 150.0, 150.0, 150.0}), 100.0);
	EXPECT_DOUBLE_EQ(compositeScore({0.0, 0.0, 0.0, 0.0, 0.0}), 0.0);
	EXPECT_DOUBLE_EQ(compositeScore({-50.0, -50.0, -50.0, -50.0, -50.0}), 0.0);
}

TEST(StyleClassifier, HeroSigma_WhenCompositeBelowMoggedBar) {
	const ClassificationResult r = RuleBasedClassifier{}.classify({80.0, 50.0, 60.0, 60.0, 50.0});

	EXPECT_NEAR(r.composite, 63.2, 1e-9);
	EXPECT_EQ(r.label, StyleLabel::Sigma);
	EXPECT_NEAR(r.confidence, 0.70, 1e-9);
}

TEST(StyleClassifier, HeroMogged_ConfidenceCapped) {
	const ClassificationResult r = RuleBasedClassifier{}.classify({100.0, 100.0, 100.0, 100.0, 100.0});

	EXPECT_EQ(r.label, StyleLabel::Mogged);
	EXPECT_DOUBLE_EQ(r.confidence, 0.96);
	EXPECT_EQ(r.reasons.size(), 5u);
}

TEST(StyleClassifier, VeryBlurryWithLowComposite_Trash) {
	const ClassificationResult r = RuleBasedClassifier{}.classify({20.0, 50.0, 50.0, 50.0, 50.0});

	EXPECT_NEAR(r.composite, 41.0 - 4.05, 1e-9);
	EXPECT_EQ(r.label, StyleLabel::Trash);
	EXPECT_NEAR(r.confidence, 0.68 + (55.0 - r.composite) / 55.0 * 0.25, 1e-12);
}

TEST(StyleClassifier, LowComposite_Meh) {
	const ClassificationResult r = RuleBasedClassifier{}.classify({40.0, 40.0, 60.0, 60.0, 60.0});

	EXPECT_NEAR(r.composite, 50.4 - 0.75, 1e-9);
	EXPECT_EQ(r.label, StyleLabel::Meh);
	EXPECT_DOUBLE_EQ(r.confidence, 0.60);
	EXPECT_TRUE(hasTag(r, Tag::Blurry));
	EXPECT_TRUE(hasTag(r, Tag::Dark));
}

TEST(StyleClassifier, Tier_Mogged) {
	// Sharpness below the hero threshold, tier floors met.
	const ClassificationResult r = RuleBasedClassifier{}.classify({77.0, 90.0, 90.0, 90.0, 90.0});

	EXPECT_NEAR(r.composite, 86.1, 1e-9);
	EXPECT_EQ(r.label, StyleLabel::Mogged);
	EXPECT_NEAR(r.confidence, 0.92, 1e-9);
}

TEST(StyleClassifier, Tier_Sigma) {
	const ClassificationResult r = RuleBasedClassifier{}.classify({75.0, 80.0, 70.0, 72.0, 80.0});

	EXPECT_NEAR(r.composite, 74.74, 1e-9);
	EXPECT_EQ(r.label, StyleLabel::Sigma);
	EXPECT_NEAR(r.confidence, 0.87, 1e-9);
}

TEST(StyleClassifier, Tier_GodOnceHeroIsOutOfReach) {
	ClassifierConfig config{};
	config.hero.minSharpness = 101.0;
	const RuleBasedClassifier classifier(config);

	const ClassificationResult r = classifier.classify({95.0, 90.0, 95.0, 95.0, 90.0});
	EXPECT_NEAR(r.composite, 93.6, 1e-9);
	EXPECT_EQ(r.label, StyleLabel::God);
	EXPECT_NEAR(r.confidence, 0.97, 1e-9);
}

TEST(StyleClassifier, TierBoundary_ConfidenceEqualsBase) {
	const AxisScores godAxes{95.0, 90.0, 95.0, 95.0, 90.0};
	const AxisScores sigmaAxes{75.0, 80.0, 70.0, 72.0, 80.0};
	const AxisScores moggedAxes{77.0, 90.0, 90.0, 90.0, 90.0};

	ClassifierConfig config{};
	config.hero.minSharpness = 101.0;
	config.tiers[0].minComposite = compositeScore(godAxes, config);
	config.tiers[1].minComposite = compositeScore(moggedAxes, config);
	config.tiers[2].minComposite = compositeScore(sigmaAxes, config);
	const RuleBasedClassifier classifier(config);

	const ClassificationResult god = classifier.classify(godAxes);
	EXPECT_EQ(god.label, StyleLabel::God);
	EXPECT_DOUBLE_EQ(god.confidence, 0.75);

	const ClassificationResult mogged = classifier.classify(moggedAxes);
	EXPECT_EQ(mogged.label, StyleLabel::Mogged);
	EXPECT_DOUBLE_EQ(mogged.confidence, 0.67);

	const ClassificationResult sigma = classifier.classify(sigmaAxes);
	EXPECT_EQ(sigma.label, StyleLabel::Sigma);
	EXPECT_DOUBLE_EQ(sigma.confidence, 0.60);
}

TEST(StyleClassifier, Fallback_AverageOrMeh) {
	const ClassificationResult average = RuleBasedClassifier{}.classify({55.0, 90.0, 90.0, 90.0, 90.0});
	EXPECT_NEAR(average.composite, 79.5, 1e-9);
	EXPECT_EQ(average.label, StyleLabel::Average);
	EXPECT_DOUBLE_EQ(average.confidence, 0.54);

	const ClassificationResult meh = RuleBasedClassifier{}.classify({50.0, 90.0, 90.0, 90.0, 90.0});
	EXPECT_NEAR(meh.composite, 78.0, 1e-9);
	EXPECT_EQ(meh.label, StyleLabel::Meh);
	EXPECT_DOUBLE_EQ(meh.confidence, 0.56);
}

TEST(StyleClassifier, IdenticalAxes_IdenticalResult) {
	const RuleBasedClassifier classifier;
	const AxisScores axes{63.0, 41.0, 77.0, 58.0, 49.0};

	const ClassificationResult a = classifier.classify(axes);
	const ClassificationResult b = classifier.classify(axes);
	EXPECT_EQ(a.label, b.label);
	EXPECT_EQ(a.confidence, b.confidence);
	EXPECT_EQ(a.composite, b.composite);
	EXPECT_EQ(a.tags, b.tags);
	EXPECT_EQ(a.reasons, b.reasons);
}

TEST(StyleClassifier, AxisGrid_ResultsStayWellFormed) {
	static const std::set<std::string> POSITIVE = {"very high sharpness", "good lighting", "good angle/pose", "strong jawline", "sufficient contrast"};
	static constexpr std::array<double, 6> VALUES = {0.0, 20.0, 40.0, 60.0, 80.0, 100.0};

	const RuleBasedClassifier classifier;
	for (const double s: VALUES) {
		for (const double l: VALUES) {
			for (const double p: VALUES) {
				for (const double j: VALUES) {
					for (const double c: VALUES) {
						const ClassificationResult r = classifier.classify({s, l, p, j, c});
						ASSERT_GE(r.confidence, 0.0);
						ASSERT_LE(r.confidence, 1.0);
						ASSERT_GE(r.composite, 0.0);
						ASSERT_LE(r.composite, 100.0);
						ASSERT_FALSE(hasTag(r, Tag::VeryBlurry) && hasTag(r, Tag::Blurry));
						ASSERT_LE(r.reasons.size(), 5u);

						const auto firstNegative = std::find_if(r.reasons.begin(), r.reasons.end(), [](const std::string& x) { return !POSITIVE.contains(x); });
						ASSERT_TRUE(std::none_of(firstNegative, r.reasons.end(), [](const std::string& x) { return POSITIVE.contains(x); }));
					}
				}
			}
		}
	}
}

TEST(StyleClassifier, Labels_RoundTripThroughText) {
	for (const StyleLabel label: {StyleLabel::God, StyleLabel::Mogged, StyleLabel::Sigma, StyleLabel::Average, StyleLabel::Meh, StyleLabel::Trash}) {
		const std::optional<StyleLabel> parsed = parseStyleLabel(toString(label));
		ASSERT_TRUE(parsed.has_value());
		EXPECT_EQ(*parsed, label);
	}
	EXPECT_FALSE(parseStyleLabel("chad").has_value());
	EXPECT_EQ(toString(Tag::VeryBlurry), "very_blurry");
	EXPECT_EQ(toString(Tag::LowContrast), "low_contrast");
	EXPECT_EQ(RuleBasedClassifier{}.name(), "rule_based");
}

} // namespace gtest
} // namespace facesharp::analysis::core
