#pragma once

#include "analysis/core/landmarks.hpp"

namespace facesharp::analysis::core {

//! Head orientation in degrees. Not clamped.
struct Pose {
	double yaw{0.0};   //!< Left-right rotation.
	double pitch{0.0}; //!< Up-down rotation.
	double roll{0.0};  //!< In-plane tilt.
};

//! Facial measurements in image pixels unless stated otherwise.
struct Proportions {
	double jawAngle{90.0};           //!< Angle at the chin between both jaw corners, degrees.
	double eyeDistance{0.0};         //!< Outer eye corner to outer eye corner.
	double faceWidth{0.0};           //!< Jaw corner to jaw corner.
	double faceHeight{0.0};          //!< Forehead to chin.
	double symmetry{0.0};            //!< 0..100, 100 = perfectly mirrored.
	double cheekboneProminence{0.0}; //!< Cheekbone distance in percent of the face width.
};

//! Constants of the pose and jawline scores.
struct GeometryConfig {
	double anglePenaltyPerDegree{2.0}; //!< Score loss per degree of deviation.
	double yawWeight{0.4};
	double pitchWeight{0.4};
	double rollWeight{0.2};
	double idealJawAngle{70.0};
	double jawAngleWeight{0.6};
	double symmetryWeight{0.4};
};

// Meshes without the full topology (see hasFullTopology) give the default-constructed results.

//! Estimate yaw/pitch/roll from eye corners, nose tip and chin.
Pose estimatePose(const FaceMesh& mesh);

//! Angle at the chin between the chin->jaw corner vectors. 90 for a degenerate jaw.
double jawAngle(const FaceMesh& mesh);

Proportions measureProportions(const FaceMesh& mesh);

//! Weighted frontal-ness, 100 for a perfectly frontal face.
double poseScore(const Pose& pose, const GeometryConfig& config = GeometryConfig{});

//! Jaw angle closeness to the ideal angle combined with facial symmetry.
double jawlineScore(const Proportions& proportions, const GeometryConfig& config = GeometryConfig{});

} // namespace facesharp::analysis::core
