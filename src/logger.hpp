// logger.hpp
#pragma once
#include <string>
#include "include/common_path.hpp"

// 결과 JSON 라인 등 파일 로그 (스레드 안전)
class Logger {
public:
	static void setPath(const std::string& filePath);
	static std::string path();

	static bool write(const std::string& message);

	static bool writef(const char* format, ...);
};
