#pragma once

#include "analysis/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>

namespace facesharp::analysis::core {

//! Constants of the image quality metrics.
struct QualityConfig {
	int overexposedLevel{240};         //!< Luminance above this counts as overexposed.
	int underexposedLevel{15};         //!< Luminance below this counts as underexposed.
	double idealBrightness{128.0};     //!< Mid gray. Exposure score and deviation are measured against it.
	int noiseBlurKernel{5};            //!< Gaussian kernel used to separate noise from content.
	int sharpnessMapKernel{9};         //!< Laplacian aperture of the diagnostic sharpness map.
	int frequencyRadiusDivisor{4};     //!< Low-frequency disc radius = min(h, w) / divisor.
	double bokehFallback{50.0};        //!< Bokeh value when the face is flat or there is no background.
};

//! Brightness statistics of a region.
struct ExposureReport {
	double score{0.0};           //!< 0..100, 100 at ideal brightness.
	double meanBrightness{0.0};  //!< Mean luminance (0..255).
	double overexposedPct{0.0};  //!< Percentage of pixels above QualityConfig::overexposedLevel.
	double underexposedPct{0.0}; //!< Percentage of pixels below QualityConfig::underexposedLevel.
	double deviation{0.0};       //!< Signed meanBrightness - idealBrightness.
};

//! All quality statistics of a face region.
struct QualityReport {
	double sharpnessLaplacian{0.0}; //!< Variance of the Laplacian response.
	double sharpnessTenengrad{0.0}; //!< Sum of squared Sobel gradient magnitudes.
	double sharpnessFrequency{0.0}; //!< High-frequency share of the spectrum energy (0..1).
	double contrastRms{0.0};        //!< RMS contrast in percent of the mean luminance.
	ExposureReport exposure{};
	double noise{0.0};   //!< Standard deviation of the image minus its blurred version.
	double bokeh{50.0};  //!< Background blur relative to the face (0..100).
	cv::Mat sharpnessMap; //!< Per-pixel |Laplacian| (CV_64F). Diagnostic only, never used for scoring.
};

// All metrics accept 1, 3 (BGR) or 4 (BGRA) channel images and never throw on degenerate input.
// An empty image yields 0 (bokeh: QualityConfig::bokehFallback).

double sharpnessLaplacian(const cv::Mat& image);
double sharpnessTenengrad(const cv::Mat& image);

//! Fraction of spectrum magnitude outside a centred disc of radius min(h, w) / frequencyRadiusDivisor.
double sharpnessFrequency(const cv::Mat& image, const QualityConfig& config = QualityConfig{});

//! RMS deviation from the mean luminance, in percent of the mean. 0 for a black image.
double contrastRms(const cv::Mat& image);

ExposureReport measureExposure(const cv::Mat& image, const QualityConfig& config = QualityConfig{});

double noiseEstimate(const cv::Mat& image, const QualityConfig& config = QualityConfig{});

/*! Estimate how much blurrier the background is than the face.
 * \param [in] image   Image containing the face.
 * \param [in] faceBox Face box in image coordinates. Clipped to the image.
 * \return     min(100, max(0, (1 - bgSharpness / faceSharpness) * 100)), or bokehFallback if the face has
 *             zero Laplacian variance or no pixel lies outside the face box.
 */
double backgroundBokeh(const cv::Mat& image, const cv::Rect& faceBox, const QualityConfig& config = QualityConfig{});

cv::Mat localSharpnessMap(const cv::Mat& image, const QualityConfig& config = QualityConfig{});

/*! Run every metric on a face region.
 * \param [in]     faceRegion Cropped face pixels.
 * \param [in]     faceBox    Face box relative to faceRegion (used for the bokeh estimate).
 * \param [in,out] debugger   Optional debug visualizer. Receives the luminance and sharpness map.
 */
QualityReport measureQuality(const cv::Mat& faceRegion, const cv::Rect& faceBox, DebugVisualizer* debugger = nullptr,
                             const QualityConfig& config = QualityConfig{});

} // namespace facesharp::analysis::core
