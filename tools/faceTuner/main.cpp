#include "analyser.hpp"
#include "mainWindow.hpp"
#include "webcamAnalysisLoop.hpp"

#include "analysis/analyzerConfig.hpp"
#include "analysis/faceAnalyzer.hpp"
#include "analysis/yunetFaceDetector.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

#include <QApplication>

#include <opencv2/imgcodecs.hpp>

// Usage: faceTuner <config.yaml> [image]
// Without an image the tuner starts on the webcam. The config names the YuNet (and optional mesh) model.
int main(int argc, char** argv) {
	QApplication application(argc, argv);

	if (argc < 2) {
		std::cerr << "Usage: " << argv[0] << " <config.yaml> [image]\n";
		return 1;
	}

	const std::optional<facesharp::analysis::AnalyzerConfig> config = facesharp::analysis::loadAnalyzerConfig(argv[1]);
	if (!config) {
		return 1;
	}

	facesharp::analysis::FaceAnalyzer analyzer(std::make_unique<facesharp::analysis::YuNetFaceDetector>(config->detector), *config);
	if (!analyzer.initialize()) {
		std::cerr << "[Error] Could not initialise the face detector.\n";
		return 1;
	}

	facesharp::analysis::Analyser analyser(analyzer);

	facesharp::MainWindow window;
	window.resize(1400, 900);

	facesharp::WebcamAnalysisLoop webcam(window, analyser);

	cv::Mat image;
	if (argc > 2) {
		const std::filesystem::path inputPath = argv[2];
		image                                 = cv::imread(inputPath.string());
		if (image.empty()) {
			std::cerr << "Failed to load image: " << inputPath << "\n";
		}
	}

	const auto showImage = [&]() {
		const facesharp::analysis::AnalysedFrame analysed = analyser.analyse(image, window.selectedPipelineStep());
		window.setImage(analysed.image);
		window.setResultText(analysed.summary);
	};

	bool webcamMode = image.empty();
	window.setPipelineStepChangedCallback([&](facesharp::PipelineStep) {
		if (webcamMode) {
			webcam.refreshFromLastFrame();
		} else {
			showImage();
		}
	});
	window.setSourceChangedCallback([&](facesharp::Source source) {
		webcamMode = source == facesharp::Source::Webcam;
		if (webcamMode) {
			if (!webcam.start()) {
				window.setResultText("Could not open the webcam.");
			}
		} else {
			webcam.stop();
			showImage();
		}
	});

	if (webcamMode) {
		window.setSource(facesharp::Source::Webcam); // Starts the capture through the callback.
	} else {
		showImage();
	}

	window.show();
	return application.exec();
}
