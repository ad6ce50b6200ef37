#pragma once

#include "analysis/analyzerConfig.hpp"
#include "analysis/faceDetector.hpp"

#include <opencv2/dnn.hpp>
#include <opencv2/objdetect/face.hpp>

namespace facesharp::analysis {

/*! YuNet face detection with an optional Face Mesh network on top.
 *  The mesh network expects a 192x192 RGB crop in [0,1] and returns 468 (x,y,z) points in crop pixels.
 */
class YuNetFaceDetector final : public FaceDetector {
public:
	explicit YuNetFaceDetector(DetectorConfig config);
	~YuNetFaceDetector() override;

	YuNetFaceDetector(const YuNetFaceDetector&)            = delete;
	YuNetFaceDetector& operator=(const YuNetFaceDetector&) = delete;

	bool initialize() override;
	void release() override;
	std::optional<core::FaceLandmarks> detect(const cv::Mat& image) override;

private:
	std::optional<core::FaceMesh> detectMesh(const cv::Mat& bgr, const cv::Rect& faceBox);

private:
	DetectorConfig m_config;

	cv::Ptr<cv::FaceDetectorYN> m_yunet;
	cv::Size m_inputSize{};     //!< Last size passed to YuNet. Updated when the frame size changes.
	cv::dnn::Net m_meshNet;
	bool m_hasMesh{false};
	bool m_ready{false};
};

} // namespace facesharp::analysis
