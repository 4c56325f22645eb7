#include "utils.hpp"
#include <iostream>
#include <stdexcept>

static bool g_debug_logging = false;

std::string moveName(Move move) {
    switch (move) {
    case MOVE_UP:    return "up";
    case MOVE_DOWN:  return "down";
    case MOVE_LEFT:  return "left";
    case MOVE_RIGHT: return "right";
    case MOVE_UNDO:  return "undo";
    default:         return "none";
    }
}

Move moveFromName(const std::string& name) {
    if (name == "up")    return MOVE_UP;
    if (name == "down")  return MOVE_DOWN;
    if (name == "left")  return MOVE_LEFT;
    if (name == "right") return MOVE_RIGHT;
    if (name == "undo")  return MOVE_UNDO;
    if (name == "none")  return MOVE_NONE;
    throw std::invalid_argument("Unknown move label '" + name + "'");
}

std::string keyForMove(Move move) {
    switch (move) {
    case MOVE_UP:    return "up";
    case MOVE_DOWN:  return "down";
    case MOVE_LEFT:  return "left";
    case MOVE_RIGHT: return "right";
    case MOVE_UNDO:  return "u";
    default:         return "";
    }
}

void setDebugLogging(bool enabled) {
    g_debug_logging = enabled;
}

bool debugLoggingEnabled() {
    return g_debug_logging;
}

void logDebug(const std::string& tag, const std::string& message) {
    if (!g_debug_logging) return;
    std::cout << "[" << tag << "] " << message << std::endl;
}

void logError(const std::string& tag, const std::string& message) {
    std::cerr << "[" << tag << "] " << message << std::endl;
}
