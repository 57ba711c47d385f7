#ifndef COPYEM_THREAD_POOL_HPP
#define COPYEM_THREAD_POOL_HPP

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/thread.hpp>

#include <memory>
#include <optional>
#include <utility>

namespace copyem
{
    class thread_pool
    {
    public:
        explicit thread_pool(int _size)
            : io_context_{std::make_shared<boost::asio::io_context>()}
            , work_{boost::asio::make_work_guard(*io_context_)}
        {
            for (decltype(_size) i{}; i < _size; i++) {
                thread_group_.create_thread([this] {
                    io_context_->run();
                });
            }
        }

        thread_pool(const thread_pool&) = delete;
        auto operator=(const thread_pool&) -> thread_pool& = delete;

        ~thread_pool()
        {
            stop();
            join();
        }

        template <typename Function>
        static auto post(thread_pool& _pool, Function&& _func) -> void
        {
            _pool.post(std::forward<Function>(_func));
        }

        // Lets the workers exit once every queued task has run.
        auto finish() -> void
        {
            work_.reset();
        }

        auto join() -> void
        {
            thread_group_.join_all();
        }

        auto stop() -> void
        {
            if (io_context_) {
                io_context_->stop();
            }
        }

    private:
        using work_guard_type = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

        template <typename Function>
        auto post(Function&& _func) -> void
        {
            boost::asio::post(*io_context_, std::forward<Function>(_func));
        }

        boost::thread_group thread_group_;
        std::shared_ptr<boost::asio::io_context> io_context_;
        std::optional<work_guard_type> work_;
    }; // class thread_pool
} // namespace copyem

#endif // COPYEM_THREAD_POOL_HPP
