#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace haul::net {

/**
 * @brief An io_context, and the threads that run it.
 *
 * The context is kept alive by a work guard until `stop` is called, so `run` may be called
 * before there is any work.
 */
class AsioExecutionContext {
private:
  boost::asio::io_context io_context_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::size_t size_;
  std::vector<std::thread> pool_;

public:
  using ExecutorType = boost::asio::io_context::executor_type;
  using SteadyTimerType = boost::asio::steady_timer;

  explicit AsioExecutionContext(std::size_t thread_pool_size = 0)
      : work_{boost::asio::make_work_guard(io_context_)},
        size_{thread_pool_size == 0 ? std::thread::hardware_concurrency() : thread_pool_size} {
    pool_.reserve(size_);
  }

  AsioExecutionContext(const AsioExecutionContext&) = delete;
  AsioExecutionContext& operator=(const AsioExecutionContext&) = delete;

  ~AsioExecutionContext() { stop(); }

  /** @brief Run the pool */
  void run() {
    if (is_running())
      return;
    for (std::size_t i = 0; i < size_; ++i)
      pool_.emplace_back([this]() { io_context_.run(); });
  }

  /** @brief Stop the io_context, and join the pool */
  void stop() {
    work_.reset();
    io_context_.stop();
    for (auto& thread : pool_)
      if (thread.joinable())
        thread.join();
    pool_.clear();
  }

  /** @brief true iff the execution context is running */
  bool is_running() const noexcept { return pool_.size() > 0; }

  /** @brief Number of threads executing io requests in parallel */
  std::size_t size() const noexcept { return size_; }

  /** @brief Return the executor for running jobs on the server pool */
  ExecutorType get_executor() { return io_context_.get_executor(); }

  /** @brief Create a new steady timer bound to this execution context */
  SteadyTimerType make_steady_timer() { return SteadyTimerType{io_context_}; }

  /** @brief Direct access to the underlying io_context */
  boost::asio::io_context& io_context() { return io_context_; }
};

} // namespace haul::net
