// alsa_capture.cpp
#include "alsa_capture.hpp"

#include "errors.hpp"

#include <alsa/asoundlib.h>

#include <cstdio>
#include <stdexcept>
#include <system_error>

struct AlsaCapture::Impl {
    snd_pcm_t* pcm = nullptr;
};

// Open + configure a capture handle: S16_LE, interleaved, mono.
static int open_capture(const AlsaCapture::Params& p, snd_pcm_t** out, std::string& err) {
    snd_pcm_t* pcm = nullptr;
    int rc = snd_pcm_open(&pcm, p.device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (rc < 0) {
        err = "snd_pcm_open(" + p.device + ") failed: " + snd_strerror(rc);
        return rc;
    }

    rc = snd_pcm_set_params(pcm,
                            SND_PCM_FORMAT_S16_LE,
                            SND_PCM_ACCESS_RW_INTERLEAVED,
                            1,
                            p.sample_rate,
                            1,
                            (unsigned)p.frame_ms * 1000);
    if (rc < 0) {
        err = std::string("snd_pcm_set_params failed: ") + snd_strerror(rc);
        snd_pcm_close(pcm);
        return rc;
    }

    *out = pcm;
    return 0;
}

AlsaCapture::AlsaCapture(const Params& p)
    : p_(p), impl_(new Impl) {}

AlsaCapture::~AlsaCapture() {
    if (running_.load()) {
        std::vector<int16_t> discarded = stop();
        (void)discarded;
    }
    delete impl_;
    impl_ = nullptr;
}

bool AlsaCapture::probe(const Params& p, std::string& err) {
    snd_pcm_t* pcm = nullptr;
    if (open_capture(p, &pcm, err) < 0) return false;
    snd_pcm_close(pcm);
    return true;
}

void AlsaCapture::start() {
    if (running_.load()) {
        throw std::logic_error("AlsaCapture::start() while already running");
    }

    std::string err;
    if (open_capture(p_, &impl_->pcm, err) < 0) {
        impl_->pcm = nullptr;
        throw QuillError(ErrorKind::DeviceUnavailable, err);
    }

    {
        std::lock_guard<std::mutex> lk(buf_m_);
        buf_.clear();
        buf_.reserve((size_t)p_.sample_rate * (size_t)p_.expected_secs);
    }

    reading_.store(true);
    running_.store(true);
    try {
        reader_ = std::thread([this]{ reader_loop(); });
    } catch (const std::system_error& e) {
        reading_.store(false);
        running_.store(false);
        snd_pcm_close(impl_->pcm);
        impl_->pcm = nullptr;
        throw QuillError(ErrorKind::DeviceUnavailable, std::string("capture thread: ") + e.what());
    }
}

std::vector<int16_t> AlsaCapture::stop() {
    if (!running_.exchange(false)) {
        throw std::logic_error("AlsaCapture::stop() without start()");
    }

    reading_.store(false);
    if (reader_.joinable()) reader_.join();

    if (impl_->pcm) {
        snd_pcm_drop(impl_->pcm);
        snd_pcm_close(impl_->pcm);
        impl_->pcm = nullptr;
    }

    std::vector<int16_t> out;
    {
        std::lock_guard<std::mutex> lk(buf_m_);
        out.swap(buf_);
    }
    return out;
}

void AlsaCapture::reader_loop() {
    const int frame_samples = (int)(p_.sample_rate * (unsigned)p_.frame_ms) / 1000;
    std::vector<int16_t> frame((size_t)frame_samples);

    while (reading_.load()) {
        snd_pcm_sframes_t got = snd_pcm_readi(impl_->pcm, frame.data(), (snd_pcm_uframes_t)frame_samples);
        if (got < 0) {
            got = snd_pcm_recover(impl_->pcm, (int)got, 1);
            if (got < 0) {
                // Keep what we have; stop() still returns it.
                std::fprintf(stderr, "[audio] snd_pcm_readi failed: %s\n", snd_strerror((int)got));
                break;
            }
            continue;
        }
        if (got == 0) continue;

        std::lock_guard<std::mutex> lk(buf_m_);
        buf_.insert(buf_.end(), frame.begin(), frame.begin() + got);
    }
}
