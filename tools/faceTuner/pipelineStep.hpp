#pragma once

#include <array>
#include <string_view>

namespace facesharp {

//! Pipeline stage shown in the tuner. Matches the debug stage names of the analyzer.
enum class PipelineStep { All, Detection, Quality, Result };

inline constexpr std::array<PipelineStep, 4> PIPELINE_STEPS = {PipelineStep::All, PipelineStep::Detection, PipelineStep::Quality, PipelineStep::Result};

inline std::string_view toString(PipelineStep step) {
	switch (step) {
	case PipelineStep::All:
		return "All";
	case PipelineStep::Detection:
		return "Detection";
	case PipelineStep::Quality:
		return "Quality";
	case PipelineStep::Result:
		return "Result";
	}
	return "All";
}

} // namespace facesharp
