
#include "daemon.hpp"

#include "core-operations.hpp"
#include "rpc-agent.hpp"

#include "haul/plugins/label-plugin.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

namespace haul {

namespace asio = boost::asio;

// ------------------------------------------------------------------------------------ Construction

Daemon::Daemon(DaemonConfig config, shared_ptr<const AuthTable> auth)
    : config_{std::move(config)},
      io_{make_unique<net::AsioExecutionContext>(config_.io_threads)},
      workers_{config_.worker_threads} {
  sessions_ = make_shared<SessionManager>(
      SessionManager::Config{config_.idle_timeout, config_.id_grace_period,
                             config_.queue_capacity, config_.max_login_attempts},
      events_, std::move(auth));
  jobs_ = make_shared<MemoryJobEngine>();
  plugins_ = make_shared<PluginManager>(dispatcher_, events_);

  processor_ = make_unique<RequestProcessor>(*sessions_, dispatcher_, workers_.get_executor(),
                                             RequestProcessor::Config{config_.call_timeout});

  update_timer_ = make_unique<asio::steady_timer>(asio::make_strand(io_->get_executor()));

  events_.set_handler_executor(
      [this](thunk_type&& thunk) { asio::post(workers_, std::move(thunk)); });
}

Daemon::~Daemon() {
  stop();

  // Pending handlers own the connections, whose agents close their sessions on release,
  // so the io context must go before the session manager.
  server_.reset();
  update_timer_.reset();
  io_.reset();
}

// ------------------------------------------------------------------------------------------- start

error_code Daemon::start() {
  if (is_started_)
    return make_error_code(ecode::logic_error);

  for (auto& component : {shared_ptr<Component>{sessions_}, shared_ptr<Component>{jobs_},
                          shared_ptr<Component>{plugins_}}) {
    if (auto ec = components_.add(component))
      return ec;
  }

  auto registered = register_core_operations(CoreServices{dispatcher_, *sessions_, events_,
                                                           *plugins_, *jobs_,
                                                           string{k_daemon_version},
                                                           [this]() { request_shutdown(); }});
  if (!registered) {
    LOG_ERR("failed to register the core operations: {}", registered.error().message());
    return make_error_code(ecode::logic_error);
  }
  connect_job_events(*jobs_, events_);

  plugins_->register_factory(string{plugins::LabelPlugin::k_name}, plugins::make_label_plugin);

  if (auto ec = components_.start())
    return ec;

  for (const auto& plugin : config_.plugins) {
    const auto is_path = plugin.find('/') != string::npos || plugin.ends_with(".so");
    const auto name = is_path ? plugin.substr(plugin.find_last_of('/') + 1) : plugin;
    auto info = plugins_->load(name, plugin);
    if (!info)
      LOG_ERR("failed to load plugin '{}': {} {}", plugin, info.error().message(),
              info.error().details());
  }

  net::WebsocketServer::Config server_config;
  server_config.address = config_.address;
  server_config.port = config_.port;
  server_config.dh_file = config_.dh_file;
  server_config.certificate_chain_file = config_.certificate_chain_file;
  server_config.private_key_file = config_.private_key_file;
  server_config.max_connections = config_.max_connections;
  server_config.options.enable_compression = config_.enable_compression;
  server_config.options.max_message_size = config_.max_message_size;
  server_config.session_factory = [this]() -> shared_ptr<net::WebsocketSession> {
    return RpcAgent::make(*sessions_, *processor_);
  };

  server_ = make_unique<net::WebsocketServer>(io_->io_context(), server_config);
  if (auto ec = server_->run()) {
    LOG_ERR("failed to listen on {}:{}: {}", config_.address, config_.port, ec.message());
    return ec;
  }

  io_->run();
  is_started_ = true;
  schedule_update_();

  INFO("hauld {} listening on {}:{}", k_daemon_version, config_.address, port());
  return {};
}

// ------------------------------------------------------------------------------------------ update

void Daemon::schedule_update_() {
  asio::post(update_timer_->get_executor(), [this]() {
    if (is_stopping_.load(std::memory_order_acquire))
      return;
    update_timer_->expires_after(config_.update_interval);
    update_timer_->async_wait([this](const boost::system::error_code& ec) {
      if (ec || is_stopping_.load(std::memory_order_acquire))
        return;
      components_.update();
      schedule_update_();
    });
  });
}

// ---------------------------------------------------------------------------------------- shutdown

void Daemon::request_shutdown() {
  {
    std::lock_guard lock{padlock_};
    shutdown_requested_ = true;
  }
  shutdown_cv_.notify_all();
}

void Daemon::wait() {
  std::unique_lock lock{padlock_};
  shutdown_cv_.wait(lock, [this]() { return shutdown_requested_; });
}

void Daemon::stop() {
  if (is_stopping_.exchange(true, std::memory_order_acq_rel))
    return;

  if (is_started_)
    INFO("hauld shutting down");

  if (update_timer_)
    asio::post(update_timer_->get_executor(), [this]() { update_timer_->cancel(); });
  if (server_)
    server_->shutdown();

  components_.shutdown();

  workers_.stop();
  workers_.join();

  if (io_)
    io_->stop();
}

uint16_t Daemon::port() const { return server_ ? server_->port() : 0; }

} // namespace haul
