#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "include/states.hpp"
#include "include/common_path.hpp"
#include "include/compose_params.hpp"

// 실행 설정. 모든 항목 기본값 있음
struct AppConfig {
	// 분석
	bool			enabled = true;
	CompositionType compositionType = CompositionType::RuleOfThirds;

	// 파이프라인
	int		analyzeEveryNthFrame = compose::ANALYZE_EVERY_N;
	int		warmupMs = compose::WARMUP_MS;
	double	budgetMs = compose::BUDGET_MS;
	bool	dropSupersededResults = true;

	// 검출기
	std::string faceModelPath = std::string(YNMODEL_PATH) + YNMODEL;
	float		faceScoreThreshold = 0.6f;
	float		faceNmsThreshold = 0.3f;
	bool		humanFallback = true;

	// 입력 (source 가 비어 있으면 카메라)
	std::string source;
	int			cameraIndex = 0;
	int			width = 640;
	int			height = 480;
	double		fps = 30.0;

	// 출력
	std::string resultLogPath = FRAMECOACH_LOG_FILE;
	std::string previewDir;				// 비어 있으면 미리보기 저장 안 함
	bool		detailedJson = false;

	// 파일 로드. 실패 시 경고 로그 + out 은 기본값 유지, false 반환
	static bool load(const std::string& path, AppConfig& out);

	// JSON 객체 적용 (알 수 없는 키 무시, 타입 오류는 예외)
	void apply(const nlohmann::json& j);

	nlohmann::json toJson() const;
};
