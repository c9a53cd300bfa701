#include "whisper/whisper_model.hpp"

#include "audio/pcm_decoder.hpp"
#include "log.hpp"
#include "whisper/model_store.hpp"

#include <filesystem>
#include <mutex>
#include <string_view>
#include <whisper.h>

namespace fs = std::filesystem;

namespace {

struct ContextDeleter {
    void operator()(whisper_context* ctx) const {
        if (ctx) whisper_free(ctx);
    }
};

struct StateDeleter {
    void operator()(whisper_state* state) const {
        if (state) whisper_free_state(state);
    }
};

using ContextPtr = std::unique_ptr<whisper_context, ContextDeleter>;
using StatePtr = std::unique_ptr<whisper_state, StateDeleter>;

// ggml and whisper.cpp are chatty; only pass their output through when
// running verbose, except for errors.
void whisper_log(ggml_log_level level, const char* text, void* /*user_data*/) {
    if (level != GGML_LOG_LEVEL_ERROR && !logging::verbose()) return;
    std::string_view sv(text ? text : "");
    while (!sv.empty() && (sv.back() == '\n' || sv.back() == '\r')) sv.remove_suffix(1);
    if (sv.empty()) return;
    std::println(stderr, "[scribed] whisper: {}", sv);
}

class WhisperModel;

class WhisperSegmentStream : public SegmentStream {
public:
    WhisperSegmentStream(std::shared_ptr<const WhisperModel> owner, StatePtr state, DecodeInfo info)
        : owner_(std::move(owner)), state_(std::move(state)), info_(std::move(info)),
          count_(whisper_full_n_segments_from_state(state_.get())) {}

    std::optional<RawSegment> next() override {
        if (index_ >= count_) return std::nullopt;

        int i = index_++;
        const char* text = whisper_full_get_segment_text_from_state(state_.get(), i);
        return RawSegment{
            .id = i,
            .start = static_cast<double>(whisper_full_get_segment_t0_from_state(state_.get(), i)) * 0.01,
            .end = static_cast<double>(whisper_full_get_segment_t1_from_state(state_.get(), i)) * 0.01,
            .text = text ? text : "",
        };
    }

    const DecodeInfo& info() const override { return info_; }

private:
    std::shared_ptr<const WhisperModel> owner_; // keeps the context alive
    StatePtr state_;
    DecodeInfo info_;
    int count_;
    int index_ = 0;
};

class WhisperModel : public SpeechModel, public std::enable_shared_from_this<WhisperModel> {
public:
    WhisperModel(ContextPtr ctx, int threads, std::string vad_model, std::string ffmpeg_bin)
        : ctx_(std::move(ctx)), threads_(threads),
          vad_model_(std::move(vad_model)), ffmpeg_bin_(std::move(ffmpeg_bin)) {}

    std::expected<std::unique_ptr<SegmentStream>, std::string>
    decode(const std::string& audio_path, const TranscriptionOptions& options) override {
        if (options.language && whisper_lang_id(options.language->c_str()) < 0) {
            return std::unexpected("unsupported language: " + *options.language);
        }

        auto samples = pcm::decode_file(ffmpeg_bin_, audio_path);
        if (!samples) return std::unexpected(samples.error());

        StatePtr state(whisper_init_state(ctx_.get()));
        if (!state) {
            return std::unexpected("failed to allocate whisper state (out of memory?)");
        }

        whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);
        params.n_threads = threads_;
        params.beam_search.beam_size = options.beam_size;
        params.language = options.language ? options.language->c_str() : "auto";
        params.detect_language = false;
        params.print_progress = false;
        params.print_realtime = false;
        params.print_timestamps = false;
        params.print_special = false;

        if (options.vad_enabled) {
            if (!vad_model_.empty()) {
                params.vad = true;
                params.vad_model_path = vad_model_.c_str();
                params.vad_params = whisper_vad_default_params();
                params.vad_params.min_silence_duration_ms = options.min_silence_ms;
            } else {
                std::call_once(vad_warning_, [] {
                    logging::warn("no Silero VAD model found, transcribing without VAD");
                });
            }
        }

        int rc = whisper_full_with_state(ctx_.get(), state.get(), params,
                                         samples->data(), static_cast<int>(samples->size()));
        if (rc != 0) {
            return std::unexpected("whisper inference failed (code " + std::to_string(rc) + ")");
        }

        DecodeInfo info{
            .language = whisper_lang_str(whisper_full_lang_id_from_state(state.get())),
            .duration = static_cast<double>(samples->size()) / pcm::kSampleRate,
        };

        return std::make_unique<WhisperSegmentStream>(shared_from_this(), std::move(state),
                                                      std::move(info));
    }

private:
    ContextPtr ctx_;
    int threads_;
    std::string vad_model_;
    std::string ffmpeg_bin_;
    std::once_flag vad_warning_;
};

} // namespace

WhisperModelLoader::WhisperModelLoader(std::string ffmpeg_bin)
    : ffmpeg_bin_(std::move(ffmpeg_bin)) {
    whisper_log_set(whisper_log, nullptr);
}

std::expected<std::shared_ptr<SpeechModel>, std::string>
WhisperModelLoader::load(const LoadRequest& request) {
    auto path = model_store::resolve(request);
    if (!path) return std::unexpected(path.error());

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = request.device == Device::Gpu;

    logging::info("Initializing whisper context from {} (gpu: {})", *path, cparams.use_gpu);

    ContextPtr ctx(whisper_init_from_file_with_params_no_state(path->c_str(), cparams));
    if (!ctx) {
        return std::unexpected("failed to initialize whisper context from " + *path);
    }

    auto cache_dir = request.download_root.empty()
        ? fs::path(*path).parent_path().string()
        : request.download_root;
    auto vad_model = model_store::find_vad_model(request.vad_model_path, cache_dir);
    if (!vad_model.empty()) {
        logging::info("Using VAD model {}", vad_model);
    }

    return std::make_shared<WhisperModel>(std::move(ctx), request.thread_count,
                                          std::move(vad_model), ffmpeg_bin_);
}
