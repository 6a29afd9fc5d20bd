#pragma once
#include <cstddef>
#include <cstdint>

/**
 * @struct RawFrame
 * @brief One captured frame as the provider hands it out.
 *
 * Pixels are 4 bytes each in B, G, R, X order. `stride` is the byte distance
 * between rows and may be larger than width * 4 when the provider pads rows.
 * `data` stays valid until the next Grab() on the same source.
 */
struct RawFrame {
    const uint8_t* data = nullptr;
    size_t size = 0;
    int width = 0;
    int height = 0;
    size_t stride = 0;
};

enum class CaptureStatus {
    kReady,
    kNotReady,  // no fresh frame yet; try again after a frame interval
};

/**
 * @class FrameSource
 * @brief Capture provider for the primary display.
 *
 * Grab() throws CaptureError for anything other than "not ready".
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual int Width() const = 0;
    virtual int Height() const = 0;
    virtual CaptureStatus Grab(RawFrame& frame) = 0;
};
