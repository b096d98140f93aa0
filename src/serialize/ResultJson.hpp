#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "include/types.hpp"

// CompositionResult <-> JSON. 숫자는 소수 둘째 자리 반올림
namespace result_json {

nlohmann::json toJson(const CompositionResult& result, bool detailed = false);
std::string toJsonString(const CompositionResult& result, bool detailed = false, int indent = -1);

double round2(double v);

const char* toString(CompositionType type);
const char* toString(CompositionStatus status);
const char* toString(SizeClass size);
const char* toString(Balance balance);
const char* toString(FrameEdge edge);
const char* toString(SubjectKind kind);

// 알 수 없는 문자열이면 nullopt
std::optional<CompositionType> compositionTypeFromString(const std::string& s);

}	// namespace result_json
