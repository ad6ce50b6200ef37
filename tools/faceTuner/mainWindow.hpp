#pragma once

#include "pipelineStep.hpp"

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <functional>
#include <string>

class QComboBox;
class QLabel;

namespace facesharp {

class CvMatrixView : public QWidget {
public:
	explicit CvMatrixView(QWidget* parent = nullptr);
	void setMat(const cv::Mat& mat);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	static QImage matToQImage(const cv::Mat& mat);

	QImage m_image{};
};

//! Input of the tuner.
enum class Source { Image, Webcam };

class MainWindow : public QMainWindow {
public:
	explicit MainWindow(QWidget* parent = nullptr);
	~MainWindow() override;

	void setImage(const cv::Mat& image);
	void setResultText(const std::string& text);

	void setPipelineStepChangedCallback(std::function<void(PipelineStep)> callback);
	void setSourceChangedCallback(std::function<void(Source)> callback);
	PipelineStep selectedPipelineStep() const;
	void setSource(Source source);

private:
	void buildLayout();

private:
	CvMatrixView* m_matrixView{nullptr};
	QLabel* m_resultLabel{nullptr};
	QComboBox* m_sourceCombo{nullptr};
	QComboBox* m_stepCombo{nullptr};
	std::function<void(PipelineStep)> m_stepChangedCallback{};
	std::function<void(Source)> m_sourceChangedCallback{};
};

} // namespace facesharp
