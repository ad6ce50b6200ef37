#pragma once

#include "analysis/core/axisScores.hpp"
#include "analysis/core/qualityMetrics.hpp"
#include "analysis/core/styleClassifier.hpp"

#include <optional>
#include <string>

namespace facesharp::analysis {

//! Model files and thresholds of the YuNet face detector and the optional dense mesh network.
struct DetectorConfig {
	std::string faceModelPath{};  //!< YuNet .onnx model.
	std::string meshModelPath{};  //!< Face Mesh .onnx model. Empty -> no mesh.
	float scoreThreshold{0.5f};
	float nmsThreshold{0.3f};
	int topK{5000};
	double meshMargin{0.1};       //!< The mesh crop extends the face box by this fraction per side.
	int meshInputSize{192};       //!< Square network input in pixels.
};

//! Any satisfied condition marks the result as abstained.
struct AbstentionConfig {
	double minDetectionConfidence{0.3};
	double maxAbsYaw{45.0};
	double maxAbsPitch{45.0};
	double minMeanAxis{20.0};
};

//! Thresholds for the notes appended after the classifier reasons.
struct ReasonConfig {
	double poseNoteDegrees{15.0};    //!< |yaw| or |pitch| above this adds a pose note.
	double exposureNoteDeviation{10.0};
	double symmetryNoteBelow{70.0};
};

struct AnalyzerConfig {
	std::string modelVersion{"1.0.0"};
	DetectorConfig detector{};
	core::QualityConfig quality{};
	core::AxisConfig axes{};
	core::ClassifierConfig classifier{};
	AbstentionConfig abstention{};
	ReasonConfig reasons{};
};

/*! Read an analyzer configuration from a YAML file. Keys that are not present keep their defaults.
 * \param [in] path YAML file.
 * \returns    The configuration or nullopt if the file cannot be read or holds invalid values. The cause is written to stderr.
 */
std::optional<AnalyzerConfig> loadAnalyzerConfig(const std::string& path);

} // namespace facesharp::analysis
