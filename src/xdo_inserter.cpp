// xdo_inserter.cpp
#include "xdo_inserter.hpp"

#include "errors.hpp"

#include <cstdio>
#include <stdexcept>

extern "C" {
#include <xdo.h>
}

struct XdoInserter::Impl {
    xdo_t* xdo = nullptr;
    Params p{};
};

XdoInserter::XdoInserter(const Params& p)
    : impl_(new Impl) {
    impl_->p = p;
    impl_->xdo = xdo_new(p.display.empty() ? nullptr : p.display.c_str());
    if (!impl_->xdo) {
        delete impl_;
        impl_ = nullptr;
        throw std::runtime_error("xdo_new failed: cannot open X display" +
                                 (p.display.empty() ? std::string() : " " + p.display));
    }
}

XdoInserter::~XdoInserter() {
    if (!impl_) return;

    if (impl_->xdo) {
        xdo_free(impl_->xdo);
        impl_->xdo = nullptr;
    }

    delete impl_;
    impl_ = nullptr;
}

void XdoInserter::insert(const std::string& text) {
    Window focused = 0;
    if (xdo_get_focused_window_sane(impl_->xdo, &focused) != XDO_SUCCESS || focused == 0) {
        throw QuillError(ErrorKind::NoFocusTarget, "no window has keyboard focus");
    }

    const int rc = xdo_enter_text_window(impl_->xdo, CURRENTWINDOW, text.c_str(),
                                         (useconds_t)impl_->p.type_delay_us);
    if (rc != XDO_SUCCESS) {
        char msg[64];
        std::snprintf(msg, sizeof(msg), "xdo_enter_text_window failed (rc=%d)", rc);
        throw QuillError(ErrorKind::InsertionFailed, msg);
    }
}
