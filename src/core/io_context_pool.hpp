#pragma once
#include "asio.hpp"
#include "core/logger.h"
#include <memory>
#include <system_error>
#include <thread>
#include <vector>

namespace pushhub::core {

    /**
     * @brief Fixed set of io_contexts, one thread each. Sessions are spread
     * over them round-robin; everything a session does stays on its context.
     */
    class AsioIOServicePool {
    public:
        using IOService = asio::io_context;
        using Work = asio::executor_work_guard<asio::io_context::executor_type>;
        using WorkPtr = std::unique_ptr<Work>;

        explicit AsioIOServicePool(std::size_t size = 2);
        ~AsioIOServicePool();
        AsioIOServicePool(const AsioIOServicePool &) = delete;
        AsioIOServicePool &operator=(const AsioIOServicePool &) = delete;

        // Next context in round-robin order. Not thread-safe; call from the acceptor only.
        asio::io_context &GetIOService();
        std::size_t size() const { return _ioServices.size(); }

        // Stops every context and joins the threads. Idempotent.
        void Stop();

    private:
        std::vector<IOService> _ioServices;
        std::vector<WorkPtr> _works;
        std::vector<std::thread> _threads;
        std::size_t _nextIOService;
        bool _stopped = false;
    };

    inline AsioIOServicePool::AsioIOServicePool(std::size_t size)
        : _ioServices(size == 0 ? 1 : size), _works(_ioServices.size()), _nextIOService(0) {
        for (std::size_t i = 0; i < _ioServices.size(); ++i) {
            _works[i] = std::make_unique<Work>(asio::make_work_guard(_ioServices[i]));
        }

        for (std::size_t i = 0; i < _ioServices.size(); ++i) {
            _threads.emplace_back([this, i]() {
                try {
                    _ioServices[i].run();
                } catch (const std::exception &e) {
                    PUSHHUB_ERROR("io_context {} stopped with exception: {}", i, e.what());
                }
            });
        }
    }

    inline AsioIOServicePool::~AsioIOServicePool() {
        Stop();
    }

    inline asio::io_context &AsioIOServicePool::GetIOService() {
        auto &service = _ioServices[_nextIOService++];
        if (_nextIOService == _ioServices.size()) {
            _nextIOService = 0;
        }
        return service;
    }

    inline void AsioIOServicePool::Stop() {
        if (_stopped) {
            return;
        }
        _stopped = true;
        for (auto &work: _works) {
            work.reset();
        }

        for (auto &io: _ioServices) {
            io.stop();
        }

        for (auto &t: _threads) {
            if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
                try {
                    t.join();
                } catch (const std::system_error &e) {
                    PUSHHUB_ERROR("Error joining io thread: {}", e.what());
                }
            }
        }
    }

}// namespace pushhub::core
