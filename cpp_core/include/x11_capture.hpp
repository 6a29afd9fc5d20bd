#pragma once
#include "frame_source.hpp"
#include <memory>
#include <string>

// True when an XImage with this layout stores pixels as B, G, R, X bytes.
bool IsBgrxLayout(int bits_per_pixel, bool lsb_first, unsigned long red_mask,
                  unsigned long green_mask, unsigned long blue_mask);

/**
 * @class X11Capture
 * @brief Captures the root window of the default X screen.
 *
 * Uses a shared-memory XImage when the server supports MIT-SHM, plain
 * XGetImage otherwise. The display connection is opened once and held for
 * the lifetime of the object.
 */
class X11Capture : public FrameSource {
public:
    // An empty name means $DISPLAY.
    explicit X11Capture(const std::string& display_name = "");
    ~X11Capture() override;

    X11Capture(const X11Capture&) = delete;
    X11Capture& operator=(const X11Capture&) = delete;

    int Width() const override;
    int Height() const override;
    CaptureStatus Grab(RawFrame& frame) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
