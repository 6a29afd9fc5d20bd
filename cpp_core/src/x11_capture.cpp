#include "x11_capture.hpp"
#include "engine_errors.hpp"
#include <iostream>
#include <sys/ipc.h>
#include <sys/shm.h>

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/XShm.h>

bool IsBgrxLayout(int bits_per_pixel, bool lsb_first, unsigned long red_mask,
                  unsigned long green_mask, unsigned long blue_mask) {
    return bits_per_pixel == 32 && lsb_first && red_mask == 0xff0000 && green_mask == 0x00ff00 &&
           blue_mask == 0x0000ff;
}

class X11Capture::Impl {
public:
    explicit Impl(const std::string& display_name) {
        display_ = XOpenDisplay(display_name.empty() ? nullptr : display_name.c_str());
        if (display_ == nullptr) {
            throw CaptureError("couldn't find primary display" +
                               (display_name.empty() ? std::string() : " '" + display_name + "'"));
        }

        root_ = DefaultRootWindow(display_);

        XWindowAttributes attributes;
        if (!XGetWindowAttributes(display_, root_, &attributes)) {
            Release();
            throw CaptureError("couldn't query root window attributes");
        }
        width_ = attributes.width;
        height_ = attributes.height;

        if (XShmQueryExtension(display_)) {
            try {
                InitSharedImage();
            } catch (const CaptureError& e) {
                std::cerr << "[Capture] " << e.what() << ", falling back to XGetImage" << std::endl;
                use_shm_ = false;
            }
        }

        std::cout << "[Capture] Capturing " << width_ << "x" << height_
                  << (use_shm_ ? " via MIT-SHM" : " via XGetImage") << std::endl;
    }

    ~Impl() { Release(); }

    CaptureStatus Grab(RawFrame& frame) {
        if (use_shm_) {
            if (!XShmGetImage(display_, root_, image_, 0, 0, AllPlanes)) {
                return CaptureStatus::kNotReady;
            }
        } else {
            if (image_ != nullptr) {
                XDestroyImage(image_);
                image_ = nullptr;
            }
            image_ = XGetImage(display_, root_, 0, 0, width_, height_, AllPlanes, ZPixmap);
            if (image_ == nullptr) {
                throw CaptureError("XGetImage failed");
            }
        }

        if (!IsBgrxLayout(image_->bits_per_pixel, image_->byte_order == LSBFirst, image_->red_mask,
                          image_->green_mask, image_->blue_mask)) {
            throw CaptureError("unsupported visual: " + std::to_string(image_->bits_per_pixel) +
                               " bits per pixel, " + (image_->byte_order == LSBFirst ? "LSB" : "MSB") +
                               " first, red mask " + std::to_string(image_->red_mask));
        }

        frame.data = reinterpret_cast<const uint8_t*>(image_->data);
        frame.width = image_->width;
        frame.height = image_->height;
        frame.stride = static_cast<size_t>(image_->bytes_per_line);
        frame.size = frame.stride * static_cast<size_t>(image_->height);
        return CaptureStatus::kReady;
    }

    int width_ = 0;
    int height_ = 0;

private:
    void InitSharedImage() {
        int screen = DefaultScreen(display_);
        image_ = XShmCreateImage(display_, DefaultVisual(display_, screen), DefaultDepth(display_, screen),
                                 ZPixmap, nullptr, &shm_info_, width_, height_);
        if (image_ == nullptr) {
            throw CaptureError("XShmCreateImage failed");
        }

        shm_info_.shmid = shmget(IPC_PRIVATE, static_cast<size_t>(image_->bytes_per_line) * image_->height,
                                 IPC_CREAT | 0600);
        if (shm_info_.shmid < 0) {
            XDestroyImage(image_);
            image_ = nullptr;
            throw CaptureError("shmget failed");
        }

        void* addr = shmat(shm_info_.shmid, nullptr, 0);
        // Marked for removal now; the segment lives until the last detach.
        shmctl(shm_info_.shmid, IPC_RMID, nullptr);
        if (addr == reinterpret_cast<void*>(-1)) {
            XDestroyImage(image_);
            image_ = nullptr;
            throw CaptureError("shmat failed");
        }

        shm_info_.shmaddr = image_->data = static_cast<char*>(addr);
        shm_info_.readOnly = False;
        if (!XShmAttach(display_, &shm_info_)) {
            shmdt(addr);
            image_->data = nullptr;
            XDestroyImage(image_);
            image_ = nullptr;
            throw CaptureError("XShmAttach failed");
        }
        XSync(display_, False);
        use_shm_ = true;
    }

    void Release() {
        if (image_ != nullptr) {
            if (use_shm_) {
                XShmDetach(display_, &shm_info_);
                XSync(display_, False);
                shmdt(shm_info_.shmaddr);
                image_->data = nullptr;
            }
            XDestroyImage(image_);
            image_ = nullptr;
        }
        if (display_ != nullptr) {
            XCloseDisplay(display_);
            display_ = nullptr;
        }
    }

    Display* display_ = nullptr;
    Window root_ = 0;
    bool use_shm_ = false;
    XShmSegmentInfo shm_info_{};
    XImage* image_ = nullptr;
};

X11Capture::X11Capture(const std::string& display_name)
    : impl_(std::make_unique<Impl>(display_name)) {}

X11Capture::~X11Capture() = default;

int X11Capture::Width() const { return impl_->width_; }

int X11Capture::Height() const { return impl_->height_; }

CaptureStatus X11Capture::Grab(RawFrame& frame) {
    return impl_->Grab(frame);
}
