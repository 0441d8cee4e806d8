#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>

// Single background thread that applies file operations in submission order.
// Callers never wait for I/O; failures are logged and dropped.
class PersistenceWriter {
public:
    PersistenceWriter();
    ~PersistenceWriter();

    PersistenceWriter(const PersistenceWriter&) = delete;
    PersistenceWriter& operator=(const PersistenceWriter&) = delete;

    // Write to a temp file beside `path`, then rename over it.
    void write(std::filesystem::path path, std::string content);
    void remove(std::filesystem::path path);
    void remove_all(std::filesystem::path dir);

    // Blocks until every task submitted before the call has run.
    void flush();

    uint64_t failures() const;

private:
    enum class Op { Write, Remove, RemoveAll };

    struct Task {
        Op op;
        std::filesystem::path path;
        std::string content;
    };

    void submit(Task task);
    void run(std::stop_token st);
    bool execute(const Task& task);

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any done_cv_;
    std::deque<Task> queue_;
    uint64_t submitted_ = 0;
    uint64_t completed_ = 0;
    uint64_t failures_ = 0;
    std::jthread worker_;
};
