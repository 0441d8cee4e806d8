#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Lock-free single-producer single-consumer ring of int16 samples.
// Producer (PipeWire thread) calls write(). Consumer (drain thread) calls read().
// Samples that do not fit are dropped and counted, never overwritten.
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_samples)
        : buf_(capacity_samples), capacity_(capacity_samples) {}

    // Producer: returns samples actually written.
    size_t write(std::span<const int16_t> samples) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);

        size_t avail = capacity_ - (w - r);
        size_t to_write = std::min(samples.size(), avail);
        if (to_write < samples.size()) {
            dropped_.fetch_add(samples.size() - to_write, std::memory_order_relaxed);
        }
        if (to_write == 0) return 0;

        size_t offset = w % capacity_;
        size_t first = std::min(to_write, capacity_ - offset);
        std::copy_n(samples.begin(), first, buf_.begin() + offset);
        std::copy_n(samples.begin() + first, to_write - first, buf_.begin());

        write_pos_.store(w + to_write, std::memory_order_release);
        return to_write;
    }

    // Consumer: returns samples actually read.
    size_t read(std::span<int16_t> dest) {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);

        size_t to_read = std::min(dest.size(), w - r);
        if (to_read == 0) return 0;

        size_t offset = r % capacity_;
        size_t first = std::min(to_read, capacity_ - offset);
        std::copy_n(buf_.begin() + offset, first, dest.begin());
        std::copy_n(buf_.begin(), to_read - first, dest.begin() + first);

        read_pos_.store(r + to_read, std::memory_order_release);
        return to_read;
    }

    // Consumer: appends everything available to out. Returns samples moved.
    size_t drain_into(std::vector<int16_t>& out) {
        size_t avail = available();
        if (avail == 0) return 0;
        size_t old = out.size();
        out.resize(old + avail);
        size_t n = read(std::span(out).subspan(old));
        out.resize(old + n);
        return n;
    }

    size_t available() const {
        size_t w = write_pos_.load(std::memory_order_acquire);
        size_t r = read_pos_.load(std::memory_order_acquire);
        return w - r;
    }

    size_t capacity() const { return capacity_; }
    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

    // Only while neither side is running.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    std::vector<int16_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
