#pragma once

#include <opencv2/core/types.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace facesharp::analysis::core {

//! Named points of the dense face mesh (MediaPipe Face Mesh topology).
//! Left/right are the subject's sides as they appear in the image (left = smaller x for a frontal face).
namespace mesh {

inline constexpr std::size_t POINT_COUNT = 468u; //!< Minimum point count. Iris-refined meshes carry 478.

inline constexpr std::size_t LEFT_EYE_OUTER  = 33u;
inline constexpr std::size_t LEFT_EYE_INNER  = 133u;
inline constexpr std::size_t RIGHT_EYE_OUTER = 263u;
inline constexpr std::size_t RIGHT_EYE_INNER = 362u;
inline constexpr std::size_t NOSE_TIP        = 4u;
inline constexpr std::size_t LEFT_MOUTH      = 61u;
inline constexpr std::size_t RIGHT_MOUTH     = 291u;
inline constexpr std::size_t CHIN            = 152u;
inline constexpr std::size_t LEFT_JAW        = 172u;
inline constexpr std::size_t RIGHT_JAW       = 397u;
inline constexpr std::size_t LEFT_CHEEKBONE  = 116u;
inline constexpr std::size_t RIGHT_CHEEKBONE = 345u;
inline constexpr std::size_t FOREHEAD        = 10u;

} // namespace mesh

//! Dense mesh points. x/y in image pixels, z in the same scale as x.
using FaceMesh = std::vector<cv::Point3f>;

//! What the face detection collaborator hands over for the primary face.
struct FaceLandmarks {
	cv::Rect bbox;                 //!< Face bounding box in image pixels. May reach outside the image.
	std::optional<FaceMesh> mesh;  //!< Dense mesh. Absent if no mesh model ran or it found nothing.
	float confidence{0.0f};        //!< Detection confidence in [0,1].
};

//! True if the mesh carries at least the full Face Mesh topology.
bool hasFullTopology(const FaceMesh& mesh);

} // namespace facesharp::analysis::core
