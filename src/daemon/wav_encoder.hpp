#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// In-memory mono WAV encoding for backend uploads.
namespace wav {

constexpr uint16_t format_pcm = 1;
constexpr uint16_t format_ieee_float = 3;
constexpr size_t header_size = 44;

namespace detail {

template <typename Sample>
std::vector<uint8_t> encode(std::span<const Sample> samples, uint32_t sample_rate,
                            uint16_t format) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = sizeof(Sample) * 8;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(Sample));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(header_size + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);
    w16(format);
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + header_size, samples.data(), data_size);
    }

    return out;
}

} // namespace detail

// 16-bit signed PCM.
inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    return detail::encode(samples, sample_rate, format_pcm);
}

// 32-bit IEEE float, samples expected in [-1, 1].
inline std::vector<uint8_t> encode_float(std::span<const float> samples, uint32_t sample_rate) {
    return detail::encode(samples, sample_rate, format_ieee_float);
}

} // namespace wav
