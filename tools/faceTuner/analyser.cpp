#include "analyser.hpp"

#include <format>

#include <opencv2/imgproc.hpp>

namespace facesharp::analysis {

static cv::Mat buildInfoTile(const std::string& title, const std::string& message) {
	cv::Mat tile(540, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	cv::putText(tile, title, cv::Point(40, 120), cv::FONT_HERSHEY_SIMPLEX, 1.1, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);
	cv::putText(tile, message, cv::Point(40, 200), cv::FONT_HERSHEY_SIMPLEX, 0.85, cv::Scalar(200, 200, 200), 2, cv::LINE_AA);
	return tile;
}

std::string describeResult(const AnalysisResult& result) {
	std::string text = std::format("Label: {}\nConfidence: {:.2f}\nComposite: {:.1f}\nAbstain: {}\nModel: {}\n\n", core::toString(result.label),
	                               result.confidence, result.composite, result.abstain ? "yes" : "no", result.modelVersion);

	if (result.ok) {
		for (const core::Axis axis: core::ALL_AXES) {
			text += std::format("{}: {:.1f}\n", core::toString(axis), result.axes[axis]);
		}
	}
	if (result.pose) {
		text += std::format("\nyaw {:.1f}  pitch {:.1f}  roll {:.1f}\n", result.pose->yaw, result.pose->pitch, result.pose->roll);
	}
	if (!result.tags.empty()) {
		text += "\nTags:";
		for (const core::Tag tag: result.tags) {
			text += std::format(" {}", core::toString(tag));
		}
		text += '\n';
	}
	if (!result.reasons.empty()) {
		text += "\nReasons:\n";
		for (const auto& reason: result.reasons) {
			text += " - " + reason + '\n';
		}
	}
	return text;
}

Analyser::Analyser(FaceAnalyzer& analyzer) : m_analyzer(analyzer) {
}

AnalysedFrame Analyser::analyse(const cv::Mat& frame, const PipelineStep step) const {
	if (frame.empty()) {
		return {buildInfoTile("Input Error", "Could not load image."), {}};
	}

	core::DebugVisualizer debugger;
	const AnalysisResult result = m_analyzer.analyze(frame, &debugger);
	debugger.endStage();

	AnalysedFrame out{};
	out.summary = describeResult(result);

	if (step == PipelineStep::All) {
		out.image = debugger.buildMosaic();
	} else {
		core::DebugVisualizer selected;
		for (const core::DebugStage& stage: debugger.stages()) {
			if (stage.name != toString(step)) {
				continue;
			}
			selected.beginStage(stage.name);
			for (const core::DebugStep& image: stage.images) {
				selected.add(image.name, image.image);
			}
		}
		out.image = selected.buildMosaic();
	}

	if (out.image.empty()) {
		out.image = result.ok ? buildInfoTile("No Debug Output", "Selected stage produced no visuals.")
		                      : buildInfoTile("No Analysis", result.reasons.empty() ? "" : result.reasons.front());
	}
	return out;
}

} // namespace facesharp::analysis
