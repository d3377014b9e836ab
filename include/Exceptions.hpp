/**
 * @file Exceptions.hpp
 * @brief Exception types for the maze engine and game
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <opencv2/core.hpp>

/**
 * @brief Base exception class for the maze engine
 */
class MazeException : public std::runtime_error {
public:
    explicit MazeException(const std::string& m) : std::runtime_error(m) {}
};

/**
 * @brief Invalid configuration or arguments (bad dimensions, unknown difficulty, ...)
 */
class ValidationException : public MazeException {
public:
    explicit ValidationException(const std::string& m)
        : MazeException("Validation error: " + m) {}
};

/**
 * @brief Failure while processing an otherwise valid request
 *        (placement exhaustion, unreadable config file)
 */
class ProcessingException : public MazeException {
public:
    explicit ProcessingException(const std::string& m)
        : MazeException("Processing error: " + m) {}
};

/**
 * @brief Helper: throws ValidationException if condition fails
 * @param cond Condition to validate
 * @param msg Error message if condition is false
 */
inline void require(bool cond, const std::string& msg) {
    if (!cond) throw ValidationException(msg);
}

/**
 * @brief Helper: Convert cv::Exception to ProcessingException
 * @param e OpenCV exception
 * @param ctx Context description
 */
[[noreturn]] inline void rethrowCv(const cv::Exception& e, const std::string& ctx) {
    std::ostringstream oss;
    oss << ctx << " | cv::Exception: (" << e.code << ") " << e.what();
    throw ProcessingException(oss.str());
}
