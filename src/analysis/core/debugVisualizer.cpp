#include "analysis/core/debugVisualizer.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>

#include <opencv2/opencv.hpp>

namespace facesharp::analysis::core {

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}

	m_stages.emplace_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		std::cerr << "[DebugVisualizer] Dropping image '" << name << "': no active stage.\n";
		return;
	}

	m_currentStage.images.push_back(DebugStep{std::move(name), img.clone()});
}

const std::vector<DebugStage>& DebugVisualizer::stages() const {
	return m_stages;
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::buildMosaic() {
	static constexpr int DEFAULT_TILE_W = 320;
	static constexpr int STAGE_HEADER_H = 34;
	static constexpr int TILE_LABEL_H   = 28;
	static constexpr int TILE_PAD       = 4;
	static constexpr int MAX_MOSAIC_W   = 2000;
	static constexpr int MAX_MOSAIC_H   = 3000;

	static const cv::Scalar BG(20, 20, 20);
	static const cv::Scalar HEADER_BG(0, 0, 0);
	static const cv::Scalar HEADER_FG(255, 255, 255);

	if (m_hasActiveStage) {
		endStage();
	}

	size_t maxSteps = 0;
	for (const auto& stage: m_stages) {
		maxSteps = std::max(maxSteps, stage.images.size());
	}
	if (maxSteps == 0) {
		return {};
	}

	const int cols = static_cast<int>(m_stages.size());
	int tileW      = DEFAULT_TILE_W;
	tileW          = std::min(tileW, std::max(1, MAX_MOSAIC_W / std::max(1, cols)));
	tileW          = std::min(tileW, std::max(1, (MAX_MOSAIC_H - STAGE_HEADER_H) / static_cast<int>(maxSteps)));

	const int tileH = tileW;
	cv::Mat mosaic(STAGE_HEADER_H + static_cast<int>(maxSteps) * tileH, tileW * cols, CV_8UC3, BG);

	// Headers: one stage per column.
	for (int c = 0; c < cols; ++c) {
		const auto& stage = m_stages[static_cast<size_t>(c)];

		cv::Mat header = mosaic(cv::Rect(c * tileW, 0, tileW, STAGE_HEADER_H));
		cv::rectangle(header, cv::Rect(0, 0, header.cols, header.rows), HEADER_BG, cv::FILLED);
		const std::string stageName = stage.name.empty() ? "Stage " + std::to_string(c + 1) : stage.name;
		cv::putText(header, stageName, cv::Point(8, STAGE_HEADER_H - 10), cv::FONT_HERSHEY_SIMPLEX, 0.7, HEADER_FG, 1, cv::LINE_AA);
	}

	// Tiles: one row per step index, blank if a stage has fewer steps.
	for (size_t r = 0; r < maxSteps; ++r) {
		const int y = STAGE_HEADER_H + static_cast<int>(r) * tileH;
		for (int c = 0; c < cols; ++c) {
			const auto& stage = m_stages[static_cast<size_t>(c)];
			if (r >= stage.images.size()) {
				continue;
			}

			const auto& step = stage.images[r];
			cv::Mat cell     = mosaic(cv::Rect(c * tileW, y, tileW, tileH));

			cv::rectangle(cell, cv::Rect(0, 0, cell.cols, TILE_LABEL_H), HEADER_BG, cv::FILLED);
			cv::putText(cell, step.name, cv::Point(TILE_PAD, 20), cv::FONT_HERSHEY_SIMPLEX, 0.55, HEADER_FG, 1, cv::LINE_AA);

			if (step.image.empty()) {
				continue;
			}

			const int availW = std::max(1, tileW - 2 * TILE_PAD);
			const int availH = std::max(1, tileH - TILE_LABEL_H - 2 * TILE_PAD);

			cv::Mat vis = toBgr8U(step.image);
			const double scale =
			        std::min(static_cast<double>(availW) / static_cast<double>(vis.cols), static_cast<double>(availH) / static_cast<double>(vis.rows));
			const int w             = std::max(1, std::min(availW, static_cast<int>(std::lround(vis.cols * scale))));
			const int h             = std::max(1, std::min(availH, static_cast<int>(std::lround(vis.rows * scale))));
			const int interpolation = (scale < 1.0) ? cv::INTER_AREA : cv::INTER_LINEAR;

			cv::Mat resized;
			cv::resize(vis, resized, cv::Size(w, h), 0.0, 0.0, interpolation);

			const int x0 = TILE_PAD + (availW - w) / 2;
			const int y0 = TILE_LABEL_H + TILE_PAD + (availH - h) / 2;
			resized.copyTo(cell(cv::Rect(x0, y0, w, h)));
		}
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	cv::Mat out;

	// normalize depth to 8U for visualization
	if (in.depth() != CV_8U) {
		double minV = 0.0, maxV = 0.0;
		cv::minMaxLoc(in.reshape(1), &minV, &maxV);
		if (maxV - minV < 1e-9) {
			in.convertTo(out, CV_8U);
		} else {
			in.convertTo(out, CV_8U, 255.0 / (maxV - minV), -minV * 255.0 / (maxV - minV));
		}
	} else {
		out = in;
	}

	if (out.channels() == 1) {
		cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
	} else if (out.channels() == 4) {
		cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
	}
	return out;
}

cv::Mat drawFaceOverlay(const cv::Mat& image, const FaceLandmarks& landmarks) {
	static const cv::Scalar BOX_COLOR(0, 255, 0);
	static const cv::Scalar MESH_COLOR(255, 200, 0);
	static const cv::Scalar NAMED_COLOR(0, 0, 255);

	static constexpr std::array<std::size_t, 13> NAMED_POINTS = {
	        mesh::LEFT_EYE_OUTER, mesh::LEFT_EYE_INNER, mesh::RIGHT_EYE_OUTER, mesh::RIGHT_EYE_INNER, mesh::NOSE_TIP,
	        mesh::LEFT_MOUTH,     mesh::RIGHT_MOUTH,    mesh::CHIN,            mesh::LEFT_JAW,        mesh::RIGHT_JAW,
	        mesh::LEFT_CHEEKBONE, mesh::RIGHT_CHEEKBONE, mesh::FOREHEAD,
	};

	cv::Mat out;
	if (image.channels() == 1) {
		cv::cvtColor(image, out, cv::COLOR_GRAY2BGR);
	} else if (image.channels() == 4) {
		cv::cvtColor(image, out, cv::COLOR_BGRA2BGR);
	} else {
		out = image.clone();
	}
	if (out.empty()) {
		return out;
	}

	const int thickness = std::max(1, std::min(out.cols, out.rows) / 300);
	cv::rectangle(out, landmarks.bbox, BOX_COLOR, thickness);

	if (landmarks.mesh) {
		const FaceMesh& points = *landmarks.mesh;
		for (const auto& p: points) {
			cv::circle(out, cv::Point(static_cast<int>(p.x), static_cast<int>(p.y)), 1, MESH_COLOR, -1);
		}
		if (hasFullTopology(points)) {
			for (const std::size_t index: NAMED_POINTS) {
				const auto& p = points[index];
				cv::circle(out, cv::Point(static_cast<int>(p.x), static_cast<int>(p.y)), 2 * thickness + 1, NAMED_COLOR, -1);
			}
		}
	}

	return out;
}

cv::Mat renderTextCard(const std::vector<std::string>& lines, int width) {
	static constexpr int LINE_H = 26;
	static constexpr int PAD    = 10;

	const int height = std::max(1, static_cast<int>(lines.size())) * LINE_H + 2 * PAD;
	cv::Mat card(height, std::max(1, width), CV_8UC3, cv::Scalar(30, 30, 30));

	int y = PAD + LINE_H - 8;
	for (const auto& line: lines) {
		cv::putText(card, line, cv::Point(PAD, y), cv::FONT_HERSHEY_SIMPLEX, 0.55, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
		y += LINE_H;
	}
	return card;
}

} // namespace facesharp::analysis::core
