#include "persistence_writer.hpp"

#include <fstream>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;

PersistenceWriter::PersistenceWriter()
    : worker_([this](std::stop_token st) { run(st); }) {}

PersistenceWriter::~PersistenceWriter() {
    // Pending writes are applied before the worker exits.
    flush();
    worker_.request_stop();
    cv_.notify_all();
}

void PersistenceWriter::write(fs::path path, std::string content) {
    submit({Op::Write, std::move(path), std::move(content)});
}

void PersistenceWriter::remove(fs::path path) {
    submit({Op::Remove, std::move(path), {}});
}

void PersistenceWriter::remove_all(fs::path dir) {
    submit({Op::RemoveAll, std::move(dir), {}});
}

void PersistenceWriter::flush() {
    std::unique_lock lock(mutex_);
    uint64_t target = submitted_;
    done_cv_.wait(lock, [&] { return completed_ >= target; });
}

uint64_t PersistenceWriter::failures() const {
    std::lock_guard lock(mutex_);
    return failures_;
}

void PersistenceWriter::submit(Task task) {
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(std::move(task));
        ++submitted_;
    }
    cv_.notify_one();
}

void PersistenceWriter::run(std::stop_token st) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, st, [this] { return !queue_.empty(); });
            if (queue_.empty()) return; // stop requested and nothing left
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        bool ok = execute(task);

        {
            std::lock_guard lock(mutex_);
            ++completed_;
            if (!ok) ++failures_;
        }
        done_cv_.notify_all();
    }
}

bool PersistenceWriter::execute(const Task& task) {
    std::error_code ec;

    switch (task.op) {
        case Op::Remove:
            fs::remove(task.path, ec);
            if (ec) {
                std::println(stderr, "persist: remove {} failed: {}", task.path.string(), ec.message());
                return false;
            }
            return true;

        case Op::RemoveAll:
            fs::remove_all(task.path, ec);
            if (ec) {
                std::println(stderr, "persist: remove_all {} failed: {}", task.path.string(), ec.message());
                return false;
            }
            return true;

        case Op::Write:
            break;
    }

    if (task.path.has_parent_path()) {
        fs::create_directories(task.path.parent_path(), ec);
        if (ec) {
            std::println(stderr, "persist: mkdir {} failed: {}",
                         task.path.parent_path().string(), ec.message());
            return false;
        }
    }

    // Same directory as the target so the rename stays on one filesystem.
    auto tmp = task.path;
    tmp += ".tmp." + std::to_string(getpid());

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::println(stderr, "persist: cannot open {}", tmp.string());
            return false;
        }
        out << task.content;
        out.flush();
        if (!out) {
            std::println(stderr, "persist: write {} failed", tmp.string());
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, task.path, ec);
    if (ec) {
        std::println(stderr, "persist: rename to {} failed: {}", task.path.string(), ec.message());
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}
