#include "config/AppConfig.hpp"
#include "serialize/ResultJson.hpp"

#include <stdexcept>

#include <QFile>
#include <QDebug>

namespace {

template <typename T>
void readIf(const nlohmann::json& obj, const char* key, T& dst)
{
	auto it = obj.find(key);
	if (it != obj.end() && !it->is_null()) dst = it->get<T>();
}

const nlohmann::json& section(const nlohmann::json& root, const char* key)
{
	static const nlohmann::json kEmpty = nlohmann::json::object();
	auto it = root.find(key);
	return (it != root.end() && it->is_object()) ? *it : kEmpty;
}

}	// namespace

void AppConfig::apply(const nlohmann::json& j)
{
	if (!j.is_object()) throw std::invalid_argument("config root is not an object");

	readIf(j, "enabled", enabled);

	if (auto it = j.find("compositionType"); it != j.end()) {
		const std::string s = it->get<std::string>();
		if (auto t = result_json::compositionTypeFromString(s)) {
			compositionType = *t;
		} else {
			qWarning() << "[AppConfig] unknown compositionType" << QString::fromStdString(s)
					   << "-> rule_of_thirds";
			compositionType = CompositionType::RuleOfThirds;
		}
	}

	const auto& pl = section(j, "pipeline");
	readIf(pl, "analyzeEveryNthFrame", analyzeEveryNthFrame);
	readIf(pl, "warmupMs", warmupMs);
	readIf(pl, "budgetMs", budgetMs);
	readIf(pl, "dropSupersededResults", dropSupersededResults);

	const auto& det = section(j, "detector");
	readIf(det, "faceModelPath", faceModelPath);
	readIf(det, "faceScoreThreshold", faceScoreThreshold);
	readIf(det, "faceNmsThreshold", faceNmsThreshold);
	readIf(det, "humanFallback", humanFallback);

	const auto& cap = section(j, "capture");
	readIf(cap, "source", source);
	readIf(cap, "cameraIndex", cameraIndex);
	readIf(cap, "width", width);
	readIf(cap, "height", height);
	readIf(cap, "fps", fps);

	const auto& out = section(j, "output");
	readIf(out, "resultLogPath", resultLogPath);
	readIf(out, "previewDir", previewDir);
	readIf(out, "detailedJson", detailedJson);

	if (analyzeEveryNthFrame < 1) {
		qWarning() << "[AppConfig] analyzeEveryNthFrame < 1, using 1";
		analyzeEveryNthFrame = 1;
	}
	if (warmupMs < 0) warmupMs = 0;
}

bool AppConfig::load(const std::string& path, AppConfig& out)
{
	const QString qpath = QString::fromStdString(path);
	QFile f(qpath);
	if (!f.exists()) {
		qWarning() << "[AppConfig] file not found ->" << qpath << "(defaults)";
		return false;
	}
	if (!f.open(QIODevice::ReadOnly)) {
		qWarning() << "[AppConfig] open failed ->" << qpath << f.errorString();
		return false;
	}
	const QByteArray raw = f.readAll();
	f.close();

	// 임시 사본에 적용 후 성공 시에만 반영
	AppConfig parsed;
	try {
		parsed.apply(nlohmann::json::parse(raw.constData(), raw.constData() + raw.size()));
	} catch (const std::exception& e) {
		qWarning() << "[AppConfig] invalid config" << qpath << ":" << e.what() << "(defaults)";
		return false;
	}

	out = std::move(parsed);
	qInfo() << "[AppConfig] loaded" << qpath;
	return true;
}

nlohmann::json AppConfig::toJson() const
{
	return {
		{ "enabled", enabled },
		{ "compositionType", result_json::toString(compositionType) },
		{ "pipeline", {
			{ "analyzeEveryNthFrame", analyzeEveryNthFrame },
			{ "warmupMs", warmupMs },
			{ "budgetMs", budgetMs },
			{ "dropSupersededResults", dropSupersededResults }
		}},
		{ "detector", {
			{ "faceModelPath", faceModelPath },
			{ "faceScoreThreshold", faceScoreThreshold },
			{ "faceNmsThreshold", faceNmsThreshold },
			{ "humanFallback", humanFallback }
		}},
		{ "capture", {
			{ "source", source },
			{ "cameraIndex", cameraIndex },
			{ "width", width },
			{ "height", height },
			{ "fps", fps }
		}},
		{ "output", {
			{ "resultLogPath", resultLogPath },
			{ "previewDir", previewDir },
			{ "detailedJson", detailedJson }
		}}
	};
}
