#pragma once

#include "analysis/core/landmarks.hpp"

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

namespace facesharp::analysis::core {

//! Each step in the pipeline.
struct DebugStep {
	std::string name; //!< Some name.
	cv::Mat image;    //!< Image produced by the step.
};

//! The analysis pipeline has multiple stages. We collect the images per stage.
struct DebugStage {
	std::string name;                //!< Name of the stage.
	std::vector<DebugStep> images{}; //!< Image name pair for every step that was added.
};

//! Can be passed to the pipeline functions to get intermediate images for debugging purposes.
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< New stage in the pipeline starts.
	void add(std::string name, const cv::Mat& img); //!< Add an image given some step name.
	void endStage();

	cv::Mat buildMosaic(); //!< Returns mosaic of all debug images. Ends currently active stage.

	const std::vector<DebugStage>& stages() const; //!< Finished stages in the order they were started.

	void clear();

private:
	static cv::Mat toBgr8U(const cv::Mat& in);

private:
	DebugStage m_currentStage{};        //!< Currently active stage.
	bool m_hasActiveStage{false};       //!< A stage is active.
	std::vector<DebugStage> m_stages{}; //!< Collection of debug info for all stages.
};

//! Copy of the image with the face box and the named mesh points drawn on top.
cv::Mat drawFaceOverlay(const cv::Mat& image, const FaceLandmarks& landmarks);

//! Dark card with one text line per entry. Used to show the final result next to the images.
cv::Mat renderTextCard(const std::vector<std::string>& lines, int width = 480);

} // namespace facesharp::analysis::core
