#include "whisper_recognizer.hpp"

#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>
#include <whisper.h>

namespace {

struct CallbackState {
    const SegmentSink* sink;
    std::stop_token stop;
};

void forward_whisper_log(ggml_log_level /*level*/, const char* text, void* /*user_data*/) {
    std::string_view msg(text ? text : "");
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.remove_suffix(1);
    if (!msg.empty()) logging::debug("whisper: {}", msg);
}

// whisper.cpp reports segment bounds in 10 ms ticks.
std::chrono::milliseconds ticks_to_ms(int64_t ticks) {
    return std::chrono::milliseconds(ticks * 10);
}

void on_new_segments(whisper_context* ctx, whisper_state* /*state*/, int n_new, void* user_data) {
    auto* cb = static_cast<CallbackState*>(user_data);
    if (cb->stop.stop_requested()) return;

    const int n_segments = whisper_full_n_segments(ctx);
    for (int i = std::max(0, n_segments - n_new); i < n_segments; ++i) {
        Segment seg;
        seg.start = ticks_to_ms(whisper_full_get_segment_t0(ctx, i));
        seg.end = std::max(seg.start, ticks_to_ms(whisper_full_get_segment_t1(ctx, i)));
        const char* text = whisper_full_get_segment_text(ctx, i);
        seg.text = text ? text : "";
        (*cb->sink)(std::move(seg));
    }
}

} // namespace

std::expected<std::unique_ptr<WhisperRecognizer>, std::string>
WhisperRecognizer::load(const std::filesystem::path& model_path, int threads) {
    whisper_log_set(forward_whisper_log, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    ContextPtr ctx(whisper_init_from_file_with_params(model_path.c_str(), cparams));
    if (!ctx) {
        return std::unexpected("whisper: failed to load model " + model_path.string());
    }

    if (threads <= 0) {
        threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    }
    return std::make_unique<WhisperRecognizer>(Key{}, std::move(ctx), threads);
}

void WhisperRecognizer::ContextDeleter::operator()(whisper_context* ctx) const {
    whisper_free(ctx);
}

WhisperRecognizer::WhisperRecognizer(Key, ContextPtr ctx, int threads)
    : ctx_(std::move(ctx)), threads_(threads) {}

std::expected<void, std::string>
WhisperRecognizer::transcribe(const AudioBuffer& audio, const std::string& language,
                              std::stop_token stop, const SegmentSink& on_segment) {
    if (audio.sample_rate != WHISPER_SAMPLE_RATE) {
        return std::unexpected(std::format("whisper: audio must be {} Hz, got {} Hz",
                                           WHISPER_SAMPLE_RATE, audio.sample_rate));
    }
    if (language != "auto" && whisper_lang_id(language.c_str()) < 0) {
        return std::unexpected("whisper: unknown language code " + language);
    }

    std::vector<float> pcm(audio.samples.size());
    std::transform(audio.samples.begin(), audio.samples.end(), pcm.begin(),
                   [](int16_t s) { return static_cast<float>(s) / 32768.0f; });

    CallbackState state{.sink = &on_segment, .stop = stop};

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.n_threads = threads_;
    wparams.language = language.c_str();
    wparams.detect_language = false;
    wparams.print_progress = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.print_special = false;

    wparams.new_segment_callback = on_new_segments;
    wparams.new_segment_callback_user_data = &state;

    // Checked before every encoder run; false aborts.
    wparams.encoder_begin_callback = [](whisper_context*, whisper_state*, void* user_data) {
        return !static_cast<CallbackState*>(user_data)->stop.stop_requested();
    };
    wparams.encoder_begin_callback_user_data = &state;

    // Checked inside ggml computations; true aborts.
    wparams.abort_callback = [](void* user_data) {
        return static_cast<CallbackState*>(user_data)->stop.stop_requested();
    };
    wparams.abort_callback_user_data = &state;

    int ret = whisper_full(ctx_.get(), wparams, pcm.data(), static_cast<int>(pcm.size()));
    if (stop.stop_requested()) {
        return std::unexpected("cancelled");
    }
    if (ret != 0) {
        return std::unexpected(std::format("whisper: transcription failed (code {})", ret));
    }

    if (language == "auto") {
        logging::debug("detected language: {}", whisper_lang_str(whisper_full_lang_id(ctx_.get())));
    }
    return {};
}
