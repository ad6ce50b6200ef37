#include "analysis/yunetFaceDetector.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace facesharp::analysis {

namespace {

// YuNet row layout: x, y, w, h, 5 landmarks (x, y) in columns 4..13, score in column 14.
static constexpr int YUNET_COLUMNS   = 15;
static constexpr int YUNET_SCORE_COL = 14;

static cv::Mat toBgr(const cv::Mat& image) {
	cv::Mat bgr;
	switch (image.channels()) {
	case 1:
		cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
		break;
	case 4:
		cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
		break;
	default:
		bgr = image;
		break;
	}
	if (bgr.depth() != CV_8U) {
		bgr.convertTo(bgr, CV_8U);
	}
	return bgr;
}

} // namespace

YuNetFaceDetector::YuNetFaceDetector(DetectorConfig config) : m_config(std::move(config)) {
}

YuNetFaceDetector::~YuNetFaceDetector() {
	release();
}

bool YuNetFaceDetector::initialize() {
	if (m_ready) {
		return true;
	}

	if (!std::filesystem::exists(m_config.faceModelPath)) {
		std::cerr << "[YuNetFaceDetector] Face model not found: '" << m_config.faceModelPath << "'\n";
		return false;
	}

	try {
		m_yunet = cv::FaceDetectorYN::create(m_config.faceModelPath, "", cv::Size(320, 320), m_config.scoreThreshold, m_config.nmsThreshold,
		                                     m_config.topK);
	} catch (const cv::Exception& e) {
		std::cerr << "[YuNetFaceDetector] YuNet create failed: " << e.what() << "\n";
		m_yunet.reset();
		return false;
	}
	if (!m_yunet) {
		std::cerr << "[YuNetFaceDetector] YuNet not ready.\n";
		return false;
	}
	m_inputSize = cv::Size{};

	m_hasMesh = false;
	if (!m_config.meshModelPath.empty()) {
		try {
			m_meshNet = cv::dnn::readNetFromONNX(m_config.meshModelPath);
			m_meshNet.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
			m_meshNet.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
			m_hasMesh = !m_meshNet.empty();
		} catch (const cv::Exception& e) {
			// Detection still works without a mesh. Pose and jawline then use their defaults.
			std::cerr << "[YuNetFaceDetector] Mesh model load failed: " << e.what() << "\n";
		}
	}

	m_ready = true;
	return true;
}

void YuNetFaceDetector::release() {
	m_yunet.reset();
	m_meshNet   = cv::dnn::Net{};
	m_hasMesh   = false;
	m_ready     = false;
	m_inputSize = cv::Size{};
}

std::optional<core::FaceLandmarks> YuNetFaceDetector::detect(const cv::Mat& image) {
	if (!m_ready || image.empty()) {
		return std::nullopt;
	}

	const cv::Mat bgr = toBgr(image);

	cv::Mat detections;
	try {
		if (bgr.size() != m_inputSize) {
			m_yunet->setInputSize(bgr.size());
			m_inputSize = bgr.size();
		}
		m_yunet->detect(bgr, detections);
	} catch (const cv::Exception& e) {
		std::cerr << "[YuNetFaceDetector] Detection failed: " << e.what() << "\n";
		return std::nullopt;
	}

	if (detections.empty() || detections.cols < YUNET_COLUMNS) {
		return std::nullopt;
	}

	// Single primary face: the highest score wins.
	int best = 0;
	for (int i = 1; i < detections.rows; ++i) {
		if (detections.at<float>(i, YUNET_SCORE_COL) > detections.at<float>(best, YUNET_SCORE_COL)) {
			best = i;
		}
	}

	core::FaceLandmarks landmarks{};
	landmarks.bbox       = cv::Rect(cv::Point2f(detections.at<float>(best, 0), detections.at<float>(best, 1)),
	                                cv::Size2f(detections.at<float>(best, 2), detections.at<float>(best, 3)));
	landmarks.confidence = std::clamp(detections.at<float>(best, YUNET_SCORE_COL), 0.0f, 1.0f);

	if (m_hasMesh) {
		landmarks.mesh = detectMesh(bgr, landmarks.bbox);
	}
	return landmarks;
}

std::optional<core::FaceMesh> YuNetFaceDetector::detectMesh(const cv::Mat& bgr, const cv::Rect& faceBox) {
	const int marginX = static_cast<int>(faceBox.width * m_config.meshMargin);
	const int marginY = static_cast<int>(faceBox.height * m_config.meshMargin);
	const cv::Rect crop =
	        cv::Rect(faceBox.x - marginX, faceBox.y - marginY, faceBox.width + 2 * marginX, faceBox.height + 2 * marginY) & cv::Rect(0, 0, bgr.cols, bgr.rows);
	if (crop.area() <= 0) {
		return std::nullopt;
	}

	const int size = m_config.meshInputSize;
	cv::Mat output;
	try {
		const cv::Mat blob = cv::dnn::blobFromImage(bgr(crop), 1.0 / 255.0, cv::Size(size, size), cv::Scalar(), true, false, CV_32F);
		m_meshNet.setInput(blob);
		output = m_meshNet.forward();
	} catch (const cv::Exception& e) {
		std::cerr << "[YuNetFaceDetector] Mesh inference failed: " << e.what() << "\n";
		return std::nullopt;
	}

	const std::size_t values = output.total();
	if (output.depth() != CV_32F || values < core::mesh::POINT_COUNT * 3u) {
		std::cerr << "[YuNetFaceDetector] Unexpected mesh output with " << values << " values.\n";
		return std::nullopt;
	}

	// Network output is in input pixels. Map back to the image.
	const float scaleX = static_cast<float>(crop.width) / static_cast<float>(size);
	const float scaleY = static_cast<float>(crop.height) / static_cast<float>(size);
	const float* data  = output.ptr<float>();

	const std::size_t count = std::min<std::size_t>(values / 3u, 478u);
	core::FaceMesh mesh;
	mesh.reserve(count);
	for (std::size_t i = 0u; i < count; ++i) {
		mesh.emplace_back(static_cast<float>(crop.x) + data[3 * i] * scaleX, static_cast<float>(crop.y) + data[3 * i + 1] * scaleY,
		                  data[3 * i + 2] * scaleX);
	}
	return mesh;
}

} // namespace facesharp::analysis
