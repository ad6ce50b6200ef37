#pragma once

#include "analysis/analyzerConfig.hpp"
#include "analysis/core/debugVisualizer.hpp"
#include "analysis/core/geometryAnalyzer.hpp"
#include "analysis/faceDetector.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace facesharp::analysis {

//! Everything the caller gets back for one image.
struct AnalysisResult {
	bool ok{false};     //!< False if no face could be analysed. Then abstain is set and reasons holds the cause.
	core::AxisScores axes{};
	core::StyleLabel label{core::StyleLabel::Meh};
	double confidence{0.0};
	std::vector<std::string> reasons{};
	bool abstain{true};
	std::string modelVersion{};

	std::optional<core::Pose> pose{};               //!< Only with a mesh.
	std::optional<core::Proportions> proportions{}; //!< Only with a mesh.
	std::optional<core::QualityReport> quality{};

	double composite{0.0};
	std::vector<core::Tag> tags{};
};

//! Abstain on weak detections, strongly turned heads and overall poor axes.
bool shouldAbstain(double detectionConfidence, const std::optional<core::Pose>& pose, const core::AxisScores& axes,
                   const AbstentionConfig& config = AbstentionConfig{});

//! Notes about pose, exposure and symmetry appended after the classifier reasons.
std::vector<std::string> additionalReasons(const std::optional<core::Pose>& pose, const core::ExposureReport& exposure,
                                           const std::optional<core::Proportions>& proportions, const ReasonConfig& config = ReasonConfig{});

/*! Runs the full scoring pipeline on single images:
 *  detect -> crop -> quality metrics -> geometry -> axes -> abstention -> classification -> reasons.
 *
 *  Owns its detector. Call initialize() before analysing, release() (or destroy) when done.
 *  Not thread safe: use one analyzer per worker.
 */
class FaceAnalyzer {
public:
	//! \param [in] classifier Style classifier. nullptr -> rule based classifier with config.classifier.
	FaceAnalyzer(std::unique_ptr<FaceDetector> detector, AnalyzerConfig config = AnalyzerConfig{},
	             std::unique_ptr<core::StyleClassifier> classifier = nullptr);
	~FaceAnalyzer();

	FaceAnalyzer(const FaceAnalyzer&)            = delete;
	FaceAnalyzer& operator=(const FaceAnalyzer&) = delete;

	bool initialize(); //!< Initialise the detector. Returns false if it cannot be used.
	void release();    //!< Release the detector. initialize() may be called again.
	bool isInitialized() const;

	/*! Analyse the primary face of a decoded image.
	 * \param [in]     image    BGR, BGRA or grayscale image.
	 * \param [in,out] debugger Optional debug visualizer collecting the intermediate images.
	 */
	AnalysisResult analyze(const cv::Mat& image, core::DebugVisualizer* debugger = nullptr) const;

	//! Decode an image file and analyse it. Undecodable files give an abstained result.
	AnalysisResult analyzeFile(const std::string& path, core::DebugVisualizer* debugger = nullptr) const;

	const AnalyzerConfig& config() const;

private:
	AnalysisResult failure(const std::string& reason) const;

private:
	AnalyzerConfig m_config;
	std::unique_ptr<FaceDetector> m_detector;
	std::unique_ptr<core::StyleClassifier> m_classifier;
	bool m_initialized{false};
};

} // namespace facesharp::analysis
