#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QMutex>
#include <QMutexLocker>
#include <QDir>
#include <QDebug>
#include <exception>
#include <memory>

#include <opencv2/imgcodecs.hpp>

#include "config/AppConfig.hpp"
#include "capture/FrameCapture.hpp"
#include "compose/CompositionManager.hpp"
#include "detect/FaceDetector.hpp"
#include "detect/HumanDetector.hpp"
#include "detect/SubjectDetector.hpp"
#include "pipeline/CompositionPipeline.hpp"
#include "serialize/ResultJson.hpp"
#include "util/overlayDrawUtil.hpp"
#include "log/compose_logging.hpp"
#include "logger.hpp"

namespace {

// 명령행 값이 설정 파일보다 우선
void applyCommandLine(const QCommandLineParser& parser, AppConfig& cfg)
{
	if (parser.isSet("source"))		cfg.source = parser.value("source").toStdString();
	if (parser.isSet("camera"))		{ cfg.cameraIndex = parser.value("camera").toInt(); cfg.source.clear(); }
	if (parser.isSet("preview"))	cfg.previewDir = parser.value("preview").toStdString();
	if (parser.isSet("log"))		cfg.resultLogPath = parser.value("log").toStdString();
	if (parser.isSet("model"))		cfg.faceModelPath = parser.value("model").toStdString();
	if (parser.isSet("detailed"))	cfg.detailedJson = true;
	if (parser.isSet("disable"))	cfg.enabled = false;

	if (parser.isSet("composition")) {
		const std::string s = parser.value("composition").toStdString();
		if (auto t = result_json::compositionTypeFromString(s)) cfg.compositionType = *t;
		else qWarning() << "[main] unknown composition" << parser.value("composition") << "-> rule_of_thirds";
	}
}

std::unique_ptr<SubjectDetector> buildDetector(const AppConfig& cfg)
{
	auto face = std::make_unique<FaceDetector>();
	if (!face->init(cfg.faceModelPath, 320, 240, cfg.faceScoreThreshold, cfg.faceNmsThreshold)) {
		qWarning() << "[main] face tier unavailable:" << QString::fromStdString(cfg.faceModelPath);
	}

	std::unique_ptr<ICandidateDetector> human;
	if (cfg.humanFallback) human = std::make_unique<HumanDetector>();

	return std::make_unique<SubjectDetector>(std::move(face), std::move(human));
}

}	// namespace

int main(int argc, char *argv[]) 
{
		try {	
				QCoreApplication app(argc, argv);
				QCoreApplication::setApplicationName("framecoach");

				qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));
				QLoggingCategory::setFilterRules(
						"framecoach.detect.debug=false\n"
						"framecoach.compose.debug=false\n"
						"framecoach.pipeline.debug=false\n"
						"framecoach.capture.debug=false\n"
				);

				QCommandLineParser parser;
				parser.setApplicationDescription("Live composition feedback engine");
				parser.addHelpOption();
				parser.addOptions({
						{ {"c", "config"}, "JSON config file.", "path",
						  QStringLiteral(CONFIG_PATH) + QStringLiteral(CONFIG_FILE) },
						{ {"s", "source"}, "Video file instead of camera.", "path" },
						{ "camera", "Camera index.", "index" },
						{ "composition", "rule_of_thirds | center_framing | symmetry", "type" },
						{ "preview", "Write annotated preview frames to this directory.", "dir" },
						{ "log", "Result log file.", "path" },
						{ "model", "YuNet model file.", "path" },
						{ "detailed", "Detailed JSON results." },
						{ "disable", "Start with analysis disabled." },
				});
				parser.process(app);

				AppConfig cfg;
				AppConfig::load(parser.value("config").toStdString(), cfg);
				applyCommandLine(parser, cfg);

				Logger::setPath(cfg.resultLogPath);
				qInfo() << "[main] config" << QString::fromStdString(cfg.toJson().dump());

				auto detector = buildDetector(cfg);
				if (!detector->hasFaceTier() && !detector->hasHumanTier()) {
					qWarning() << "[main] no detector tier ready, every frame will report no subject";
				}

				CompositionManager manager(cfg.compositionType);
				manager.setEnabled(cfg.enabled);

				CompositionPipeline::Params pp;
				pp.throttle.everyNth = cfg.analyzeEveryNthFrame;
				pp.throttle.warmupMs = cfg.warmupMs;
				pp.budgetMs = cfg.budgetMs;
				pp.dropSupersededResults = cfg.dropSupersededResults;
				CompositionPipeline pipeline(*detector, manager, pp);

				FrameCapture capture;
				if (cfg.source.empty()) capture.setCameraIndex(cfg.cameraIndex);
				else					capture.setFile(QString::fromStdString(cfg.source));
				capture.setResolution(cfg.width, cfg.height);
				capture.setFps(cfg.fps);

				// 미리보기용 최신 프레임
				QMutex previewMu;
				cv::Mat previewFrame;
				const QString previewDir = QString::fromStdString(cfg.previewDir);
				if (!previewDir.isEmpty()) QDir().mkpath(previewDir);

				QObject::connect(&capture, &FrameCapture::started, &pipeline,
								 [&pipeline] { pipeline.restartThrottle(); }, Qt::DirectConnection);
				QObject::connect(&capture, &FrameCapture::frameReady, &pipeline,
								 [&](const cv::Mat& bgr) {
									 if (!previewDir.isEmpty()) { QMutexLocker lk(&previewMu); previewFrame = bgr; }
									 pipeline.submitFrame(bgr);
								 }, Qt::DirectConnection);
				QObject::connect(&capture, &FrameCapture::cameraError, &app,
								 [](const QString& msg) { qWarning() << msg; });
				QObject::connect(&capture, &FrameCapture::finished, &app, &QCoreApplication::quit,
								 Qt::QueuedConnection);

				QObject::connect(&pipeline, &CompositionPipeline::resultReady, &app,
								 [&](const CompositionResult& r, const OverlayList& overlays) {
									 const std::string line = result_json::toJsonString(r, cfg.detailedJson);
									 qInfo().noquote() << QString::fromStdString(line);
									 if (!Logger::write(line)) qWarning() << "[main] result log write failed";

									 if (previewDir.isEmpty()) return;
									 cv::Mat canvas;
									 { QMutexLocker lk(&previewMu); if (!previewFrame.empty()) canvas = previewFrame.clone(); }
									 if (canvas.empty()) return;

									 drawOverlays(canvas, overlays);
									 drawSuggestion(canvas, r.suggestion, Anchor::BottomCenter, 16);
									 const QString file = previewDir + QString("/frame_%1.jpg").arg(static_cast<qulonglong>(r.frameSeq), 6, 10, QChar('0'));
									 if (!cv::imwrite(file.toStdString(), canvas))
										 qWarning() << "[main] preview write failed" << file;
								 });
				QObject::connect(&manager, &CompositionManager::compositionTypeChanged, &app,
								 [](CompositionType t) { qInfo() << "[main] rule ->" << result_json::toString(t); });

				QObject::connect(&app, &QCoreApplication::aboutToQuit, [&] {
						capture.stop();
						pipeline.stop();
						qInfo() << "[main] aboutToQuit";
				});

				pipeline.start();
				capture.start();
				return app.exec();
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		}

		return -1;
}
