#include "analysis/core/geometryAnalyzer.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>
#include <vector>

namespace facesharp::analysis::core {

namespace {

static constexpr double RAD_TO_DEG = 180.0 / std::numbers::pi;

//! Image-plane position of a mesh point.
static cv::Point2d at(const FaceMesh& mesh, std::size_t index) {
	return {mesh[index].x, mesh[index].y};
}

static double length(const cv::Point2d& v) {
	return std::hypot(v.x, v.y);
}

//! Score in 0..100 that drops linearly with the absolute angle.
static double angleScore(double degrees, double penaltyPerDegree) {
	return std::max(0.0, 100.0 - std::abs(degrees) * penaltyPerDegree);
}

} // namespace

bool hasFullTopology(const FaceMesh& mesh) {
	return mesh.size() >= mesh::POINT_COUNT;
}

Pose estimatePose(const FaceMesh& mesh) {
	if (!hasFullTopology(mesh)) {
		return {};
	}

	const cv::Point2d leftEye  = at(mesh, mesh::LEFT_EYE_OUTER);
	const cv::Point2d rightEye = at(mesh, mesh::RIGHT_EYE_OUTER);
	const cv::Point2d noseTip  = at(mesh, mesh::NOSE_TIP);
	const cv::Point2d chin     = at(mesh, mesh::CHIN);

	// Roll: tilt of the eye line.
	const cv::Point2d eyeVec = rightEye - leftEye;
	const double roll        = std::atan2(eyeVec.y, eyeVec.x) * RAD_TO_DEG;

	// Pitch: vertical share of the nose->chin vector.
	const cv::Point2d vertical = chin - noseTip;
	const double pitch         = std::atan2(vertical.y, length(vertical)) * RAD_TO_DEG;

	// Yaw: horizontal nose offset from the eye centre relative to half the eye span.
	const cv::Point2d eyeCenter = (leftEye + rightEye) * 0.5;
	const cv::Point2d noseToEye = noseTip - eyeCenter;
	const double yaw            = std::atan2(noseToEye.x, length(eyeVec) / 2.0) * RAD_TO_DEG;

	return {yaw, pitch, roll};
}

double jawAngle(const FaceMesh& mesh) {
	static constexpr double DEFAULT_ANGLE = 90.0;
	if (!hasFullTopology(mesh)) {
		return DEFAULT_ANGLE;
	}

	const cv::Point2d chin = at(mesh, mesh::CHIN);
	const cv::Point2d v1   = at(mesh, mesh::LEFT_JAW) - chin;
	const cv::Point2d v2   = at(mesh, mesh::RIGHT_JAW) - chin;

	const double norms = length(v1) * length(v2);
	if (norms <= 0.0) {
		return DEFAULT_ANGLE;
	}

	const double cosAngle = std::clamp(v1.dot(v2) / norms, -1.0, 1.0);
	return std::acos(cosAngle) * RAD_TO_DEG;
}

Proportions measureProportions(const FaceMesh& mesh) {
	if (!hasFullTopology(mesh)) {
		return {};
	}

	const cv::Point2d leftJaw  = at(mesh, mesh::LEFT_JAW);
	const cv::Point2d rightJaw = at(mesh, mesh::RIGHT_JAW);

	Proportions p{};
	p.jawAngle    = jawAngle(mesh);
	p.eyeDistance = length(at(mesh, mesh::RIGHT_EYE_OUTER) - at(mesh, mesh::LEFT_EYE_OUTER));
	p.faceWidth   = length(rightJaw - leftJaw);
	p.faceHeight  = length(at(mesh, mesh::CHIN) - at(mesh, mesh::FOREHEAD));

	// Symmetry: mirror the right-side points across the vertical face midline and compare with the left side.
	static constexpr std::array<std::size_t, 4> LEFT_POINTS  = {mesh::LEFT_EYE_OUTER, mesh::LEFT_JAW, mesh::LEFT_MOUTH, mesh::LEFT_CHEEKBONE};
	static constexpr std::array<std::size_t, 4> RIGHT_POINTS = {mesh::RIGHT_EYE_OUTER, mesh::RIGHT_JAW, mesh::RIGHT_MOUTH, mesh::RIGHT_CHEEKBONE};

	const double centerX = (leftJaw.x + rightJaw.x) / 2.0;
	std::vector<double> distances;
	distances.reserve(LEFT_POINTS.size());
	for (std::size_t i = 0u; i < LEFT_POINTS.size(); ++i) {
		const cv::Point2d left  = at(mesh, LEFT_POINTS[i]);
		cv::Point2d mirrored    = at(mesh, RIGHT_POINTS[i]);
		mirrored.x              = 2.0 * centerX - mirrored.x;
		distances.push_back(length(left - mirrored));
	}

	if (p.faceWidth > 0.0) {
		p.symmetry            = std::max(0.0, 100.0 - mean(distances) / p.faceWidth * 100.0);
		p.cheekboneProminence = length(at(mesh, mesh::RIGHT_CHEEKBONE) - at(mesh, mesh::LEFT_CHEEKBONE)) / p.faceWidth * 100.0;
	}

	return p;
}

double poseScore(const Pose& pose, const GeometryConfig& config) {
	const double k = config.anglePenaltyPerDegree;
	return angleScore(pose.yaw, k) * config.yawWeight + angleScore(pose.pitch, k) * config.pitchWeight + angleScore(pose.roll, k) * config.rollWeight;
}

double jawlineScore(const Proportions& proportions, const GeometryConfig& config) {
	const double angle = angleScore(proportions.jawAngle - config.idealJawAngle, config.anglePenaltyPerDegree);
	return angle * config.jawAngleWeight + proportions.symmetry * config.symmetryWeight;
}

} // namespace facesharp::analysis::core
