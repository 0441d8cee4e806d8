#pragma once

#include "../inference/diarization_model.hpp"

#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

enum class ModelLoadState { NotLoaded, Loading, Ready };

// Owns the single cached DiarizationModel. The first diarize() call loads it;
// calls that arrive while that load is in flight wait for it instead of starting
// another. A failed load goes back to NotLoaded so the next call retries.
//
// Errors and exceptions from the model are passed through to the caller.
class DiarizationEngine {
public:
    using ModelLoader =
        std::function<std::expected<std::shared_ptr<DiarizationModel>, std::string>()>;

    static constexpr uint32_t default_sample_rate = 16000;

    explicit DiarizationEngine(ModelLoader loader, DiarizationParams params = {});

    DiarizationEngine(const DiarizationEngine&) = delete;
    DiarizationEngine& operator=(const DiarizationEngine&) = delete;

    std::expected<std::vector<DiarizationSegment>, std::string>
        diarize(std::span<const int16_t> pcm, uint32_t sample_rate = default_sample_rate);

    std::expected<std::shared_ptr<DiarizationModel>, std::string> ensure_loaded();

    ModelLoadState load_state() const;
    const DiarizationParams& params() const { return params_; }

    // int16 -> float in [-1, 1], scaled by INT16_MAX and clamped.
    static std::vector<float> normalize(std::span<const int16_t> pcm);

private:
    ModelLoader loader_;
    DiarizationParams params_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ModelLoadState state_ = ModelLoadState::NotLoaded;
    std::shared_ptr<DiarizationModel> model_;
    std::string last_load_error_;
    uint64_t load_generation_ = 0;
};
