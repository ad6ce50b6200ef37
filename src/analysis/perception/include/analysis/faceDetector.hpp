#pragma once

#include "analysis/core/landmarks.hpp"

#include <opencv2/core/mat.hpp>

#include <optional>

namespace facesharp::analysis {

/*! Supplies the primary face of an image.
 *  The handle is not reentrant: one instance per worker, never used from two threads at once.
 *  Lifecycle: initialize() once, detect() any number of times, release() on shutdown.
 */
class FaceDetector {
public:
	virtual ~FaceDetector() = default;

	//! Load models. Returns false if the detector cannot be used.
	virtual bool initialize() = 0;
	virtual void release()    = 0;

	//! Highest scoring face, or nullopt if there is none (or the detector is not initialised).
	virtual std::optional<core::FaceLandmarks> detect(const cv::Mat& image) = 0;
};

} // namespace facesharp::analysis
