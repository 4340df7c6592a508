#include "asr_whisper.hpp"

#include "vad.hpp"

#include <dlfcn.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

extern "C" {
// Forward-declare opaque types so we don't need whisper.h at link time.
struct whisper_context;
}

// ------------------------------------------------------------

static std::string trim_ws(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace((unsigned char)s[a])) a++;
    while (b > a && std::isspace((unsigned char)s[b - 1])) b--;
    return s.substr(a, b - a);
}

// Markers whisper emits for non-speech input.
static bool is_blank_marker(const std::string& s) {
    return s.empty() ||
           s == "[BLANK_AUDIO]" ||
           s == "(silence)" ||
           s == "[silence]" ||
           s == ".";
}

// ------------------------------------------------------------
// Dynamically-loaded whisper API
// ------------------------------------------------------------

// whisper.h is included for type definitions (params structs) only; libwhisper
// is not linked. The header must match the shared library version.
#include "whisper.h"

struct WhisperApi {
    void* handle = nullptr;

    whisper_context_params (*context_default_params)();
    whisper_context* (*init_from_file_with_params)(const char*, whisper_context_params);
    void (*free_ctx)(whisper_context*);

    whisper_full_params (*full_default_params)(whisper_sampling_strategy);
    int (*full)(whisper_context*, whisper_full_params, const float*, int);
    int (*full_n_segments)(whisper_context*);
    const char* (*full_get_segment_text)(whisper_context*, int);
    int (*lang_id)(const char*);
};

static void* must_sym(void* h, const char* name) {
    void* p = dlsym(h, name);
    if (!p) {
        const char* why = dlerror();
        throw QuillError(ErrorKind::ModelUnavailable,
                         std::string("missing symbol ") + name + ": " + (why ? why : "?"));
    }
    return p;
}

static WhisperApi load_whisper_api(const std::string& soname) {
    WhisperApi api{};

    // RTLD_LOCAL keeps ggml symbols out of the global namespace.
    api.handle = dlopen(soname.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!api.handle) {
        const char* why = dlerror();
        throw QuillError(ErrorKind::ModelUnavailable,
                         "dlopen(" + soname + ") failed: " + (why ? why : "?"));
    }

    try {
        api.context_default_params =
            (whisper_context_params (*)()) must_sym(api.handle, "whisper_context_default_params");
        api.init_from_file_with_params =
            (whisper_context* (*)(const char*, whisper_context_params)) must_sym(api.handle, "whisper_init_from_file_with_params");
        api.free_ctx =
            (void (*)(whisper_context*)) must_sym(api.handle, "whisper_free");

        api.full_default_params =
            (whisper_full_params (*)(whisper_sampling_strategy)) must_sym(api.handle, "whisper_full_default_params");
        api.full =
            (int (*)(whisper_context*, whisper_full_params, const float*, int)) must_sym(api.handle, "whisper_full");
        api.full_n_segments =
            (int (*)(whisper_context*)) must_sym(api.handle, "whisper_full_n_segments");
        api.full_get_segment_text =
            (const char* (*)(whisper_context*, int)) must_sym(api.handle, "whisper_full_get_segment_text");
        api.lang_id =
            (int (*)(const char*)) must_sym(api.handle, "whisper_lang_id");
    } catch (const QuillError&) {
        dlclose(api.handle);
        throw;
    }

    return api;
}

// One whisper_full pass; the trimmed segment text lands in `out`.
static int run_full(const WhisperApi& api, whisper_context* ctx,
                    const WhisperASR::Params& p,
                    const std::vector<float>& pcmf,
                    const std::string& language,
                    std::string& out) {
    whisper_full_params fp = api.full_default_params(WHISPER_SAMPLING_GREEDY);

    fp.print_realtime   = false;
    fp.print_progress   = false;
    fp.print_timestamps = false;
    fp.print_special    = false;

    fp.translate      = false;
    fp.no_context     = p.no_context;
    fp.single_segment = p.single_segment;
    fp.n_threads      = p.n_threads;
    fp.suppress_blank = true;

    // whisper treats "auto" as detect-language.
    fp.language = language.empty() ? "auto" : language.c_str();

    const int rc = api.full(ctx, fp, pcmf.data(), (int)pcmf.size());
    if (rc != 0) return rc;

    out.clear();
    const int nseg = api.full_n_segments(ctx);
    for (int i = 0; i < nseg; i++) {
        const char* t = api.full_get_segment_text(ctx, i);
        if (t) out += t;
    }
    out = trim_ws(out);
    return 0;
}

// ------------------------------------------------------------

struct WhisperASR::Impl {
    WhisperApi api{};
    whisper_context* ctx = nullptr;
    Params p{};
    std::unique_ptr<SpeechDetector> gate;
    bool warmed_up = false;

    ~Impl() {
        if (ctx) api.free_ctx(ctx);
        if (api.handle) dlclose(api.handle);
    }
};

WhisperASR::WhisperASR(const std::string& model_path, const Params& p)
    : impl_(nullptr) {
    if (p.sample_rate != WHISPER_SAMPLE_RATE) {
        throw QuillError(ErrorKind::ModelUnavailable,
                         "whisper needs " + std::to_string(WHISPER_SAMPLE_RATE) +
                         " Hz input, configured " + std::to_string(p.sample_rate));
    }

    std::unique_ptr<Impl> impl(new Impl);
    impl->p = p;
    impl->api = load_whisper_api(p.library);

    whisper_context_params wp = impl->api.context_default_params();
    wp.use_gpu = p.use_gpu;

    impl->ctx = impl->api.init_from_file_with_params(model_path.c_str(), wp);
    if (!impl->ctx) {
        throw QuillError(ErrorKind::ModelUnavailable, "failed to init model: " + model_path);
    }

    if (p.vad_mode >= 0) {
        try {
            impl->gate.reset(new SpeechDetector(p.sample_rate, p.vad_mode));
        } catch (const std::runtime_error& e) {
            throw QuillError(ErrorKind::ModelUnavailable, std::string("speech gate: ") + e.what());
        }
    }

    // The first whisper_full pays for backend setup and buffer allocation.
    // Run it on a second of silence now rather than on the first dictation.
    if (p.warmup) {
        auto t0 = std::chrono::steady_clock::now();
        const std::vector<float> silence(p.sample_rate, 0.0f);
        std::string ignored;
        const int rc = run_full(impl->api, impl->ctx, p, silence, "en", ignored);
        if (rc != 0) {
            throw QuillError(ErrorKind::ModelUnavailable,
                             "warm-up inference failed (rc=" + std::to_string(rc) + ")");
        }
        auto t1 = std::chrono::steady_clock::now();
        std::fprintf(stderr, "[perf] warmup_ms=%lld\n",
                     (long long)std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count());
        impl->warmed_up = true;
    }

    impl_ = impl.release();
}

WhisperASR::~WhisperASR() {
    delete impl_;
    impl_ = nullptr;
}

bool WhisperASR::warmed_up() const {
    return impl_ && impl_->warmed_up;
}

bool WhisperASR::language_supported(const std::string& language) const {
    if (language.empty() || language == "auto") return true;
    if (!impl_) return false;
    return impl_->api.lang_id(language.c_str()) >= 0;
}

RecognitionResult WhisperASR::recognize(const std::vector<int16_t>& pcm16,
                                        const std::string& language) {
    if (!impl_ || !impl_->ctx) {
        return RecognitionResult::failure(ErrorKind::ModelUnavailable, "model not loaded");
    }

    if (pcm16.empty() || pcm16.size() < impl_->p.min_samples) {
        return RecognitionResult::failure(ErrorKind::EmptyAudio,
                                          "only " + std::to_string(pcm16.size()) + " samples");
    }

    if (impl_->gate) {
        std::size_t voiced = 0;
        try {
            voiced = impl_->gate->voiced_frames(pcm16);
        } catch (const std::runtime_error& e) {
            return RecognitionResult::failure(ErrorKind::InferenceError, e.what());
        }
        if (voiced == 0) {
            return RecognitionResult::failure(ErrorKind::EmptyAudio, "no speech detected");
        }
    }

    std::vector<float> pcmf;
    pcmf.reserve(pcm16.size());
    for (int16_t s : pcm16) {
        pcmf.push_back((float) s / 32768.0f);
    }

    std::string out;
    const int rc = run_full(impl_->api, impl_->ctx, impl_->p, pcmf, language, out);
    if (rc != 0) {
        return RecognitionResult::failure(ErrorKind::InferenceError,
                                          "whisper_full failed (rc=" + std::to_string(rc) + ")");
    }

    std::fprintf(stderr, "[asr] secs=%.2f text='%s'\n",
                 (double)pcm16.size() / (double)impl_->p.sample_rate, out.c_str());

    if (is_blank_marker(out)) {
        return RecognitionResult::failure(ErrorKind::EmptyAudio, "blank transcript");
    }
    return RecognitionResult::success(out);
}
