#ifndef UTILS_ASIO_CONTEXT_HPP
#define UTILS_ASIO_CONTEXT_HPP

#include <algorithm>
#include <atomic>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace net = boost::asio;
using boost::asio::ip::tcp;
using boost::system::error_code;

namespace beast = boost::beast;
namespace http = beast::http;

struct AsioContextConfig {
    [[nodiscard]] virtual int get_asio_pool_size() const = 0;
};

class AsioContext: public std::enable_shared_from_this<AsioContext> {
public:

    static std::shared_ptr<AsioContext> Create(const AsioContextConfig &config) {
        return std::make_shared<AsioContext>(config);
    }

    explicit AsioContext(const AsioContextConfig &config) :
            _pool_size(std::max(1, config.get_asio_pool_size())),
            _context(_pool_size)
    {}

    void Start() {
        if (_started) {
            return;
        }
        _started = true;
        _stop = false;
        if (_context.stopped()) {
            _context.restart();
        }
        _guard.emplace(net::make_work_guard(_context));
        _pool.resize(_pool_size);
        std::generate(
                _pool.begin(),
                _pool.end(),
                [&context = this->_context, &stop = this->_stop]() -> std::thread {
                    return std::thread([&context, &stop]() {
                        while (!stop) {
                            try {
                                context.run();
                                return;
                            } catch (std::exception const &e) {
                                // handlers report through their own callbacks; anything landing
                                // here escaped one of them
                                std::cerr << "AsioContext: handler threw " << e.what() << std::endl;
                            }
                        }
                    });
                }
        );
    }

    /*
     * From one of the pool's own threads this only stops the context; the threads are joined by
     * the next Stop from outside the pool, at the latest by the destructor.
     */
    void Stop() {
        if (!_started) {
            return;
        }
        _stop = true;
        _guard.reset();
        _context.stop();
        if (RunningInThisThread()) {
            return;
        }
        for (auto &thread : _pool) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        _pool.clear();
        _started = false;
    }

    // true inside a handler run by this context
    [[nodiscard]] bool RunningInThisThread() {
        return _context.get_executor().running_in_this_thread();
    }

    net::io_context &GetContext() {
        return _context;
    }

    // must not run on one of the pool's threads
    ~AsioContext() {
        Stop();
    }
private:
    const int _pool_size;
    net::io_context _context;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> _guard;
    std::vector<std::thread> _pool;
    std::atomic<bool> _stop = { false };
    std::atomic<bool> _started = { false };
};

#endif //UTILS_ASIO_CONTEXT_HPP
