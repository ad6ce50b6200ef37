#pragma once

#include "pipelineStep.hpp"

#include "analysis/faceAnalyzer.hpp"

#include <opencv2/core/mat.hpp>

#include <string>

namespace facesharp::analysis {

//! Image to display and the textual result of one analysed frame.
struct AnalysedFrame {
	cv::Mat image;
	std::string summary;
};

//! Runs the face analyzer with the DebugVisualizer attached and keeps the images of the desired PipelineStep.
class Analyser {
public:
	explicit Analyser(FaceAnalyzer& analyzer);

	AnalysedFrame analyse(const cv::Mat& frame, PipelineStep step) const;

private:
	FaceAnalyzer& m_analyzer;
};

//! Multi-line text of a result for the side panel.
std::string describeResult(const AnalysisResult& result);

} // namespace facesharp::analysis
