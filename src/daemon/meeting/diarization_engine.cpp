#include "diarization_engine.hpp"

#include <algorithm>
#include <limits>
#include <print>

DiarizationEngine::DiarizationEngine(ModelLoader loader, DiarizationParams params)
    : loader_(std::move(loader)), params_(params) {}

std::expected<std::vector<DiarizationSegment>, std::string>
DiarizationEngine::diarize(std::span<const int16_t> pcm, uint32_t sample_rate) {
    if (pcm.empty()) return std::vector<DiarizationSegment>{};

    auto model = ensure_loaded();
    if (!model) return std::unexpected(model.error());

    auto samples = normalize(pcm);
    return (*model)->generate(samples, sample_rate, params_);
}

std::expected<std::shared_ptr<DiarizationModel>, std::string> DiarizationEngine::ensure_loaded() {
    std::unique_lock lock(mutex_);

    if (state_ == ModelLoadState::Ready) return model_;

    if (state_ == ModelLoadState::Loading) {
        // Share the in-flight load and its outcome.
        uint64_t gen = load_generation_;
        cv_.wait(lock, [&] { return load_generation_ != gen; });
        if (state_ == ModelLoadState::Ready) return model_;
        return std::unexpected(last_load_error_);
    }

    state_ = ModelLoadState::Loading;
    lock.unlock();

    std::expected<std::shared_ptr<DiarizationModel>, std::string> result;
    try {
        result = loader_();
        if (result && !*result) result = std::unexpected("model loader returned no model");
    } catch (const std::exception& e) {
        result = std::unexpected(std::string("model load threw: ") + e.what());
    }

    lock.lock();
    if (result) {
        model_ = *result;
        state_ = ModelLoadState::Ready;
    } else {
        std::println(stderr, "diarize: model load failed: {}", result.error());
        last_load_error_ = result.error();
        state_ = ModelLoadState::NotLoaded;
    }
    ++load_generation_;
    lock.unlock();
    cv_.notify_all();

    return result;
}

ModelLoadState DiarizationEngine::load_state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::vector<float> DiarizationEngine::normalize(std::span<const int16_t> pcm) {
    constexpr float scale = std::numeric_limits<int16_t>::max();
    std::vector<float> out;
    out.reserve(pcm.size());
    for (int16_t v : pcm) {
        out.push_back(std::clamp(static_cast<float>(v) / scale, -1.0f, 1.0f));
    }
    return out;
}
