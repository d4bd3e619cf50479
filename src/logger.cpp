#include "logger.hpp"

// Initialize static members
std::atomic<LogLevel> Logger::currentLevel{LogLevel::INFO};
std::atomic<bool> Logger::colorEnabled{true};  // --no-color or color = false for pipes/files
std::mutex Logger::outputMutex;
