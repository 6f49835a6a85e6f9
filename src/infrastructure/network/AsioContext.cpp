#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace beamstate::infra {

AsioContext::AsioContext(std::string name, size_t threadCount)
    : name_(std::move(name)), threadCount_(threadCount > 0 ? threadCount : 1) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));
    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() { runWorker(i); });
    }

    spdlog::info("{} pool started with {} worker threads", name_, threadCount_);
}

void AsioContext::runWorker(size_t index) {
    spdlog::debug("{} worker {} started", name_, index);
    for (;;) {
        try {
            ioContext_.run();
            break;
        } catch (const std::exception& e) {
            ++handlerFailures_;
            spdlog::error("{} worker {}: handler threw: {}", name_, index, e.what());
        }
    }
    spdlog::debug("{} worker {} stopped", name_, index);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    // A stopped io_context refuses to run until restarted
    ioContext_.restart();

    if (handlerFailures_ > 0) {
        spdlog::warn("{} pool stopped after {} failed handlers", name_, handlerFailures_.load());
    } else {
        spdlog::info("{} pool stopped", name_);
    }
}

} // namespace beamstate::infra
