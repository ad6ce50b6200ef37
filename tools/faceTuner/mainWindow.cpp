#include "mainWindow.hpp"

#include <QComboBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

namespace facesharp {

CvMatrixView::CvMatrixView(QWidget* parent) : QWidget(parent) {
}

void CvMatrixView::setMat(const cv::Mat& mat) {
	m_image = matToQImage(mat);
	update();
}

void CvMatrixView::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	painter.fillRect(rect(), Qt::black);

	if (m_image.isNull()) {
		return;
	}

	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::SmoothTransformation);
	const QPoint topLeft((width() - scaled.width()) / 2, (height() - scaled.height()) / 2);
	painter.drawImage(topLeft, scaled);
}

QImage CvMatrixView::matToQImage(const cv::Mat& mat) {
	if (mat.empty()) {
		return {};
	}

	// Debug images can be float (sharpness map). Stretch those to 8 bit.
	cv::Mat mat8;
	if (mat.depth() == CV_8U) {
		mat8 = mat;
	} else {
		cv::normalize(mat, mat8, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
	}

	cv::Mat rgb;
	switch (mat8.channels()) {
	case 1:
		return QImage(mat8.data, mat8.cols, mat8.rows, static_cast<int>(mat8.step), QImage::Format_Grayscale8).copy();
	case 3:
		cv::cvtColor(mat8, rgb, cv::COLOR_BGR2RGB);
		return QImage(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888).copy();
	case 4:
		cv::cvtColor(mat8, rgb, cv::COLOR_BGRA2RGBA);
		return QImage(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGBA8888).copy();
	default:
		return {};
	}
}

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Face Tuner");
	buildLayout();
}

MainWindow::~MainWindow() = default;

void MainWindow::setImage(const cv::Mat& image) {
	if (m_matrixView != nullptr) {
		m_matrixView->setMat(image);
	}
}

void MainWindow::setResultText(const std::string& text) {
	if (m_resultLabel != nullptr) {
		m_resultLabel->setText(QString::fromStdString(text));
	}
}

void MainWindow::setPipelineStepChangedCallback(std::function<void(PipelineStep)> callback) {
	m_stepChangedCallback = std::move(callback);
}

void MainWindow::setSourceChangedCallback(std::function<void(Source)> callback) {
	m_sourceChangedCallback = std::move(callback);
}

PipelineStep MainWindow::selectedPipelineStep() const {
	const int index = m_stepCombo != nullptr ? m_stepCombo->currentIndex() : 0;
	if (index < 0 || index >= static_cast<int>(PIPELINE_STEPS.size())) {
		return PipelineStep::All;
	}
	return PIPELINE_STEPS[static_cast<std::size_t>(index)];
}

void MainWindow::setSource(const Source source) {
	if (m_sourceCombo != nullptr) {
		m_sourceCombo->setCurrentIndex(source == Source::Image ? 0 : 1);
	}
}

void MainWindow::buildLayout() {
	auto* rootWidget  = new QWidget(this);
	auto* rootLayout  = new QVBoxLayout(rootWidget);
	auto* controlRow  = new QHBoxLayout();
	auto* contentRow  = new QHBoxLayout();
	auto* sourceLabel = new QLabel("Source:", rootWidget);
	auto* stepLabel   = new QLabel("Stage:", rootWidget);

	m_sourceCombo = new QComboBox(rootWidget);
	m_sourceCombo->addItem("Image");
	m_sourceCombo->addItem("Webcam");
	m_sourceCombo->setCurrentIndex(0);

	m_stepCombo = new QComboBox(rootWidget);
	for (const PipelineStep step: PIPELINE_STEPS) {
		const std::string_view name = toString(step);
		m_stepCombo->addItem(QString::fromUtf8(name.data(), static_cast<qsizetype>(name.size())));
	}

	controlRow->addWidget(sourceLabel);
	controlRow->addWidget(m_sourceCombo);
	controlRow->addSpacing(16);
	controlRow->addWidget(stepLabel);
	controlRow->addWidget(m_stepCombo);
	controlRow->addStretch(1);

	m_matrixView  = new CvMatrixView(rootWidget);
	m_resultLabel = new QLabel(rootWidget);
	m_resultLabel->setAlignment(Qt::AlignTop | Qt::AlignLeft);
	m_resultLabel->setMinimumWidth(320);
	m_resultLabel->setWordWrap(true);
	m_resultLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);

	contentRow->addWidget(m_matrixView, 1);
	contentRow->addWidget(m_resultLabel);

	rootLayout->addLayout(controlRow);
	rootLayout->addLayout(contentRow, 1);

	QObject::connect(m_stepCombo, &QComboBox::currentIndexChanged, this, [this](int) {
		if (m_stepChangedCallback) {
			m_stepChangedCallback(selectedPipelineStep());
		}
	});
	QObject::connect(m_sourceCombo, &QComboBox::currentIndexChanged, this, [this](int index) {
		if (m_sourceChangedCallback) {
			m_sourceChangedCallback(index == 0 ? Source::Image : Source::Webcam);
		}
	});

	setCentralWidget(rootWidget);
}

} // namespace facesharp
