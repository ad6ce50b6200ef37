#pragma once

#include "analysis/core/geometryAnalyzer.hpp"
#include "analysis/core/qualityMetrics.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace facesharp::analysis::core {

//! The five scoring dimensions, in the order the classifier walks them.
enum class Axis { Sharpness, Lighting, Pose, Jawline, Contrast };

inline constexpr std::array<Axis, 5> ALL_AXES = {Axis::Sharpness, Axis::Lighting, Axis::Pose, Axis::Jawline, Axis::Contrast};

std::string_view toString(Axis axis);

//! Nominally 0..100 per axis. Only sharpness and contrast are clamped by construction.
struct AxisScores {
	double sharpness{0.0};
	double lighting{0.0};
	double pose{0.0};
	double jawline{0.0};
	double contrast{0.0};

	double operator[](Axis axis) const;

	double mean() const;
	double min() const;

	bool operator==(const AxisScores&) const = default;
};

//! Normalisation constants that map raw metrics onto axes.
struct AxisConfig {
	double laplacianScale{1000.0};     //!< Laplacian variance worth laplacianWeight sharpness points.
	double laplacianWeight{50.0};
	double tenengradScale{100000.0};   //!< Tenengrad sum worth tenengradWeight sharpness points.
	double tenengradWeight{30.0};
	double frequencyWeight{20.0};      //!< Points for a fully high-frequency spectrum.
	double contrastGain{2.0};          //!< Sharpness/contrast are capped at 100 after scaling.
	double exposureWeight{0.7};
	double clippingWeight{0.3};        //!< Weight of (100 - over% - under%).
	double missingMeshScore{50.0};     //!< Pose/jawline when there is no mesh.
	GeometryConfig geometry{};
};

/*! Combine quality and geometry into the five axes.
 * \param [in] quality     Metrics of the face region.
 * \param [in] pose        Head pose. Absent without a mesh.
 * \param [in] proportions Facial proportions. Absent without a mesh.
 */
AxisScores aggregateAxes(const QualityReport& quality, const std::optional<Pose>& pose, const std::optional<Proportions>& proportions,
                         const AxisConfig& config = AxisConfig{});

} // namespace facesharp::analysis::core
