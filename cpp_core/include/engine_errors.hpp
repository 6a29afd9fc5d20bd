#pragma once
#include <stdexcept>
#include <string>

// Failure classes raised by the detection pipeline. All of them propagate to the
// driver; only "frame not ready" is handled where it happens (see CaptureStatus).

class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string& what) : std::runtime_error("Capture: " + what) {}
};

class LayoutError : public std::runtime_error {
public:
    explicit LayoutError(const std::string& what) : std::runtime_error("Layout: " + what) {}
};

class OcrError : public std::runtime_error {
public:
    explicit OcrError(const std::string& what) : std::runtime_error("OCR: " + what) {}
};

class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error("Persistence: " + what) {}
};
