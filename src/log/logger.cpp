#include "logger.hpp"
#include <fstream>
#include <iostream>
#include <filesystem>
#include <mutex>
#include <ctime>
#include <cstdarg>   // va_list
#include <cstdio>    // vsnprintf

namespace fs = std::filesystem;

namespace {
std::mutex g_logMu;
std::string g_logPath = FRAMECOACH_LOG_FILE;
}

void Logger::setPath(const std::string& filePath)
{
	std::lock_guard<std::mutex> lk(g_logMu);
	g_logPath = filePath;
}

std::string Logger::path()
{
	std::lock_guard<std::mutex> lk(g_logMu);
	return g_logPath;
}

bool Logger::write(const std::string& message) {
	std::lock_guard<std::mutex> lk(g_logMu);

	// 디렉토리가 없으면 생성
	const fs::path filePath(g_logPath);
	if (filePath.has_parent_path()) {
		std::error_code ec;
		fs::create_directories(filePath.parent_path(), ec);
		if (ec) {
			std::cerr << "[Logger] create dir failed: " << ec.message() << std::endl;
			return false;
		}
	}

	// 현재 시간
	time_t now = time(nullptr);
	tm ltm{};
	localtime_r(&now, &ltm);

	char timeStr[32];
	strftime(timeStr, sizeof(timeStr), "%Y-%m-%d %H:%M:%S", &ltm);

	std::ofstream logFile(filePath, std::ios::app);
	if (!logFile.is_open()) {
		std::cerr << "[Logger] open failed: " << g_logPath << std::endl;
		return false;
	}
	logFile << "[" << timeStr << "] " << message << std::endl;
	return true;
}

bool Logger::writef(const char* format, ...)
{
	char buffer[1024];

	va_list args;
	va_start(args, format);
	vsnprintf(buffer, sizeof(buffer), format, args);
	va_end(args);

	return write(std::string(buffer));
}
