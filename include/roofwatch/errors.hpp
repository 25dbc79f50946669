#pragma once

#include <stdexcept>
#include <string>

namespace roofwatch {

// Base for every failure the monitor loop knows how to recover from.
class RoofError : public std::runtime_error {
public:
    explicit RoofError(const std::string& what) : std::runtime_error(what) {}
};

// Monitor directory missing or unreadable. Retried on the next tick.
class SourceUnavailable : public RoofError {
public:
    explicit SourceUnavailable(const std::string& what) : RoofError(what) {}
};

// Image could not be decoded, usually because the camera is still writing it.
class FrameUnreadable : public RoofError {
public:
    explicit FrameUnreadable(const std::string& what) : RoofError(what) {}
};

// Classifier rejected the image shape. Handled like an unreadable frame.
class InvalidFrame : public FrameUnreadable {
public:
    explicit InvalidFrame(const std::string& what) : FrameUnreadable(what) {}
};

class ModelNotLoaded : public RoofError {
public:
    explicit ModelNotLoaded(const std::string& what) : RoofError(what) {}
};

}  // namespace roofwatch
