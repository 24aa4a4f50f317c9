#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace lanwatch::infra {

AsioContext::AsioContext(size_t threadCount, std::string name)
    : threadCount_(threadCount > 0 ? threadCount : 1), name_(std::move(name)) {
    spdlog::debug("AsioContext '{}' created with {} threads", name_, threadCount_);
}

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
        threads_.emplace_back([this, i]() {
            spdlog::debug("{} worker {} started", name_, i);
            try {
                ioContext_.run();
            } catch (const std::exception& e) {
                spdlog::error("{} worker {} terminated by exception: {}", name_, i, e.what());
            }
            spdlog::debug("{} worker {} stopped", name_, i);
        });
    }

    spdlog::info("AsioContext '{}' started with {} worker threads", name_, threadCount_);
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

    ioContext_.restart();
    spdlog::info("AsioContext '{}' stopped", name_);
}

} // namespace lanwatch::infra
