#ifndef UTILS_HPP
#define UTILS_HPP

#include "game_defs.hpp" // For Move
#include <string>

// --- Move labels ---

// "up", "down", "left", "right", "undo" or "none"
std::string moveName(Move move);

// Inverse of moveName; throws std::invalid_argument on an unknown label
Move moveFromName(const std::string& name);

// Key the input-injection side presses for a move ("u" for undo, "" for none)
std::string keyForMove(Move move);

// --- Console logging ---

// Debug lines are only written while enabled (off by default)
void setDebugLogging(bool enabled);
bool debugLoggingEnabled();

// Writes "[tag] message" to std::cout when debug logging is enabled
void logDebug(const std::string& tag, const std::string& message);

// Writes "[tag] message" to std::cerr unconditionally
void logError(const std::string& tag, const std::string& message);

#endif // UTILS_HPP
