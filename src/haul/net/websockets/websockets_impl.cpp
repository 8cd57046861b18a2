#include "websocket-server.hpp"
#include "websocket-session.hpp"

#include "haul/utils.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace haul::net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace detail {
class Stream;
class Acceptor;
} // namespace detail

// The stream is owned by the driver; the session only ever holds it weakly
struct WebsocketSession::Pimpl {
private:
  mutable std::mutex padlock_;
  std::weak_ptr<detail::Stream> stream_{};
  string remote_address_;

public:
  void attach(const shared_ptr<detail::Stream>& stream) {
    std::lock_guard lock{padlock_};
    stream_ = stream;
  }

  void set_remote_address(string remote_address) {
    std::lock_guard lock{padlock_};
    remote_address_ = std::move(remote_address);
  }

  shared_ptr<detail::Stream> stream() const {
    std::lock_guard lock{padlock_};
    return stream_.lock();
  }

  string remote_address() const {
    std::lock_guard lock{padlock_};
    return remote_address_;
  }
};

} // namespace haul::net

namespace haul::net::detail {

namespace {
  string to_string(const tcp::endpoint& endpoint) {
    return format("{}:{}", endpoint.address().to_string(), endpoint.port());
  }
} // namespace

// ------------------------------------------------------------------------------------------ Stream

/**
 * One TLS websocket, client or server side. Everything after construction runs on the
 * stream's strand.
 */
class Stream : public std::enable_shared_from_this<Stream> {
public:
  using FinishThunk = std::function<void(Stream*)>;

private:
  websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws_;
  shared_ptr<WebsocketSession> owner_;
  const WebsocketOptions options_;
  beast::flat_buffer read_buffer_;
  FinishThunk on_finish_;

  std::deque<BufferType> outbox_; //!< Strand only
  bool is_closing_{false};        //!< Strand only
  std::atomic<bool> is_connected_{false};

  tcp::resolver resolver_; //!< Client only
  string host_;            //!< Client only; becomes the Host header

public:
  Stream(tcp::socket&& socket, asio::ssl::context& tls, shared_ptr<WebsocketSession> owner,
         const WebsocketOptions& options)
      : ws_{std::move(socket), tls}, owner_{std::move(owner)}, options_{options},
        resolver_{ws_.get_executor()} {}

  Stream(asio::io_context& io_context, asio::ssl::context& tls,
         shared_ptr<WebsocketSession> owner, const WebsocketOptions& options)
      : ws_{asio::make_strand(io_context), tls}, owner_{std::move(owner)}, options_{options},
        resolver_{ws_.get_executor()} {}

  ~Stream() {
    if (on_finish_)
      on_finish_(this);
  }

  /// Let the owner reach this stream
  void bind_owner(string remote_address) {
    owner_->pimpl_->attach(shared_from_this());
    owner_->pimpl_->set_remote_address(std::move(remote_address));
  }

  bool is_connected() const { return is_connected_.load(std::memory_order_acquire); }

  // @{ Server side
  void accept(FinishThunk on_finish) {
    on_finish_ = std::move(on_finish);
    asio::dispatch(ws_.get_executor(), [self = shared_from_this()]() {
      beast::get_lowest_layer(self->ws_).expires_after(self->options_.handshake_timeout);
      self->ws_.next_layer().async_handshake(
          asio::ssl::stream_base::server,
          beast::bind_front_handler(&Stream::on_server_tls_, self));
    });
  }

private:
  void on_server_tls_(beast::error_code ec) {
    if (ec) {
      fail_(WebsocketOperation::HANDSHAKE, ec);
      return;
    }
    beast::get_lowest_layer(ws_).expires_never();
    configure_(beast::role_type::server);
    ws_.async_accept(beast::bind_front_handler(&Stream::on_open_, shared_from_this()));
  }
  // @}

public:
  // @{ Client side
  void connect(std::string_view host, uint16_t port) {
    host_ = string{host};
    resolver_.async_resolve(host_, std::to_string(port),
                            beast::bind_front_handler(&Stream::on_resolve_, shared_from_this()));
  }

private:
  void on_resolve_(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
      fail_(WebsocketOperation::CONNECT, ec);
      return;
    }
    beast::get_lowest_layer(ws_).expires_after(options_.handshake_timeout);
    beast::get_lowest_layer(ws_).async_connect(
        results, beast::bind_front_handler(&Stream::on_tcp_connect_, shared_from_this()));
  }

  void on_tcp_connect_(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
    if (ec) {
      fail_(WebsocketOperation::CONNECT, ec);
      return;
    }
    owner_->pimpl_->set_remote_address(to_string(endpoint));

    // SNI
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
    const bool has_sni = SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), host_.c_str());
#pragma GCC diagnostic pop
    if (!has_sni) {
      const auto ssl_error = static_cast<int>(::ERR_get_error());
      fail_(WebsocketOperation::CONNECT,
            beast::error_code{ssl_error, asio::error::get_ssl_category()});
      return;
    }

    // https://tools.ietf.org/html/rfc7230#section-5.4
    host_ += ':' + std::to_string(endpoint.port());

    ws_.next_layer().set_verify_mode(asio::ssl::verify_none);
    ws_.next_layer().async_handshake(
        asio::ssl::stream_base::client,
        beast::bind_front_handler(&Stream::on_client_tls_, shared_from_this()));
  }

  void on_client_tls_(beast::error_code ec) {
    if (ec) {
      fail_(WebsocketOperation::HANDSHAKE, ec);
      return;
    }
    beast::get_lowest_layer(ws_).expires_never();
    configure_(beast::role_type::client);
    ws_.async_handshake(host_, "/",
                        beast::bind_front_handler(&Stream::on_open_, shared_from_this()));
  }
  // @}

  void configure_(beast::role_type role) {
    auto timeouts = websocket::stream_base::timeout::suggested(role);
    timeouts.handshake_timeout = options_.handshake_timeout;
    ws_.set_option(timeouts);

    if (role == beast::role_type::server) {
      ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& response) {
        response.set(beast::http::field::server, string{BOOST_BEAST_VERSION_STRING} + " hauld");
      }));
    } else {
      ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& request) {
        request.set(beast::http::field::user_agent,
                    string{BOOST_BEAST_VERSION_STRING} + " haul-client");
      }));
    }

    ws_.binary(true);
    ws_.read_message_max(options_.max_message_size);
    if (options_.enable_compression) {
      websocket::permessage_deflate deflate;
      deflate.server_enable = true;
      deflate.client_enable = true;
      ws_.set_option(deflate);
    }
  }

  void on_open_(beast::error_code ec) {
    if (ec) {
      fail_(WebsocketOperation::ACCEPT, ec);
      return;
    }
    is_connected_.store(true, std::memory_order_release);
    owner_->on_connect();
    read_();
  }

  // --------------------------------------------------------------------------------------- reading

  void read_() {
    ws_.async_read(read_buffer_, beast::bind_front_handler(&Stream::on_read_, shared_from_this()));
  }

  void on_read_(beast::error_code ec, std::size_t) {
    if (ec == websocket::error::closed) {
      is_connected_.store(false, std::memory_order_release);
      const auto& reason = ws_.reason();
      owner_->on_close(reason.code, std::string_view{reason.reason.data(), reason.reason.size()});
      return;
    }
    if (ec) {
      fail_(WebsocketOperation::READ, ec);
      return;
    }

    const auto message = read_buffer_.data();
    const auto* data = static_cast<const std::byte*>(message.data());
    try {
      owner_->on_receive(std::span<const std::byte>{data, message.size()});
    } catch (std::exception& e) {
      FATAL("`on_receive` must not throw: {}", e.what());
    }
    read_buffer_.consume(read_buffer_.size());
    read_();
  }

  // --------------------------------------------------------------------------------------- writing

  void write_next_() {
    const auto& front = outbox_.front();
    ws_.async_write(asio::buffer(front.data(), front.size()),
                    beast::bind_front_handler(&Stream::on_written_, shared_from_this()));
  }

  void on_written_(beast::error_code ec, std::size_t) {
    owner_->on_return_buffer(std::move(outbox_.front()));
    outbox_.pop_front();

    if (ec) {
      for (; !outbox_.empty(); outbox_.pop_front())
        owner_->on_return_buffer(std::move(outbox_.front()));
      fail_(WebsocketOperation::WRITE, ec);
      return;
    }
    if (!outbox_.empty())
      write_next_();
  }

  void fail_(WebsocketOperation operation, std::error_code ec) {
    is_connected_.store(false, std::memory_order_release);
    owner_->on_error(operation, ec);
  }

public:
  void send(BufferType&& buffer) {
    auto enqueue = [self = shared_from_this(), buffer = std::move(buffer)]() mutable {
      self->outbox_.push_back(std::move(buffer));
      if (self->outbox_.size() == 1)
        self->write_next_();
    };
    asio::post(ws_.get_executor(), std::move(enqueue));
  }

  void close(uint16_t close_code, std::string_view reason) {
    asio::post(ws_.get_executor(),
               [self = shared_from_this(), close_code, reason = string{reason}]() {
                 if (std::exchange(self->is_closing_, true))
                   return;
                 if (!self->ws_.is_open()) { // still handshaking
                   beast::get_lowest_layer(self->ws_).cancel();
                   return;
                 }
                 const websocket::close_reason why{
                     websocket::close_code{close_code},
                     beast::string_view{reason.data(), reason.size()}};
                 self->ws_.async_close(why, [self](beast::error_code ec) {
                   // on success, the pending read finishes with `closed`
                   if (ec && ec != websocket::error::closed)
                     self->fail_(WebsocketOperation::CLOSE, ec);
                 });
               });
  }

  void cancel() {
    asio::post(ws_.get_executor(),
               [self = shared_from_this()]() { beast::get_lowest_layer(self->ws_).cancel(); });
  }
};

// ---------------------------------------------------------------------------------------- Acceptor

/**
 * Accepts connections, and keeps a weak reference to each open stream so that shutdown
 * can cancel them.
 */
class Acceptor : public std::enable_shared_from_this<Acceptor> {
private:
  asio::io_context& io_context_;
  asio::ssl::context& tls_;
  tcp::acceptor acceptor_;
  const WebsocketServer::Config config_;

  mutable std::mutex padlock_;
  std::unordered_map<Stream*, std::weak_ptr<Stream>> open_;
  bool is_shutdown_{false};

public:
  Acceptor(asio::io_context& io_context, asio::ssl::context& tls,
           const WebsocketServer::Config& config)
      : io_context_{io_context}, tls_{tls}, acceptor_{asio::make_strand(io_context)},
        config_{config} {}

  std::error_code listen() {
    beast::error_code ec;
    const auto address = asio::ip::make_address(config_.address, ec);
    if (ec)
      return ec;
    const tcp::endpoint endpoint{address, config_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec)
      acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec)
      acceptor_.bind(endpoint, ec);
    if (!ec)
      acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec)
      return ec;

    accept_();
    return {};
  }

  uint16_t port() const {
    beast::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

  std::size_t connection_count() const {
    std::lock_guard lock{padlock_};
    return open_.size();
  }

  void shutdown() {
    {
      std::lock_guard lock{padlock_};
      is_shutdown_ = true;
    }
    asio::post(acceptor_.get_executor(), [self = shared_from_this()]() { self->stop_(); });
  }

private:
  void accept_() {
    acceptor_.async_accept(asio::make_strand(io_context_),
                           beast::bind_front_handler(&Acceptor::on_accept_, shared_from_this()));
  }

  void on_accept_(beast::error_code ec, tcp::socket socket) {
    if (ec == asio::error::operation_aborted || !acceptor_.is_open())
      return;
    if (ec) {
      WARN("failed to accept a connection: {}", ec.message());
    } else {
      admit_(std::move(socket));
    }
    accept_();
  }

  void admit_(tcp::socket&& socket) {
    beast::error_code ec;
    const auto endpoint = socket.remote_endpoint(ec);
    const auto remote = ec ? string{"<unknown>"} : to_string(endpoint);

    {
      std::lock_guard lock{padlock_};
      if (is_shutdown_)
        return;
      if (config_.max_connections > 0 && open_.size() >= config_.max_connections) {
        WARN("refusing connection from {}: {} connections open", remote, open_.size());
        return;
      }
    }

    auto stream = make_shared<Stream>(std::move(socket), tls_, make_owner_(), config_.options);
    stream->bind_owner(remote);
    {
      std::lock_guard lock{padlock_};
      if (is_shutdown_)
        return;
      open_.insert({stream.get(), stream});
    }

    TRACE("accepted connection from {}", remote);
    stream->accept([weak = weak_from_this()](Stream* finished) {
      if (auto self = weak.lock())
        self->forget_(finished);
    });
  }

  shared_ptr<WebsocketSession> make_owner_() const {
    try {
      auto owner = config_.session_factory();
      if (owner == nullptr)
        FATAL("`session_factory` returned null");
      return owner;
    } catch (std::exception& e) {
      FATAL("`session_factory` must not throw: {}", e.what());
    }
    return nullptr;
  }

  void forget_(Stream* stream) {
    std::lock_guard lock{padlock_};
    open_.erase(stream);
  }

  void stop_() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec)
      WARN("error closing the acceptor: {}", ec.message());

    decltype(open_) open;
    {
      std::lock_guard lock{padlock_};
      open.swap(open_);
    }
    for (auto& [raw, weak] : open)
      if (auto stream = weak.lock())
        stream->cancel();
  }
};

} // namespace haul::net::detail

namespace haul::net {

// -------------------------------------------------------------------------------- WebsocketSession

WebsocketSession::WebsocketSession() : pimpl_{std::make_unique<Pimpl>()} {}

WebsocketSession::~WebsocketSession() = default;

void WebsocketSession::close(uint16_t close_code, std::string_view reason) {
  if (auto stream = pimpl_->stream())
    stream->close(close_code, reason);
}

bool WebsocketSession::send_message(BufferType&& buffer) {
  auto stream = pimpl_->stream();
  if (stream == nullptr)
    return false;
  stream->send(std::move(buffer));
  return true;
}

bool WebsocketSession::is_connected() const {
  auto stream = pimpl_->stream();
  return stream != nullptr && stream->is_connected();
}

string WebsocketSession::remote_address() const { return pimpl_->remote_address(); }

void connect(std::shared_ptr<WebsocketSession> session, asio::io_context& io_context,
             std::string_view host, uint16_t port, WebsocketOptions options) {
  static asio::ssl::context tls{asio::ssl::context::tlsv12_client};
  Expects(session != nullptr);

  auto stream = make_shared<detail::Stream>(io_context, tls, std::move(session), options);
  stream->bind_owner(format("{}:{}", host, port));
  stream->connect(host, port);
}

// --------------------------------------------------------------------------------- WebsocketServer

struct WebsocketServer::Pimpl {
  asio::ssl::context tls{asio::ssl::context::tls_server};
  shared_ptr<detail::Acceptor> acceptor;

  Pimpl(asio::io_context& io_context, const Config& config) {
    tls.set_options(asio::ssl::context::default_workarounds | asio::ssl::context::no_sslv2 |
                    asio::ssl::context::no_sslv3 | asio::ssl::context::no_tlsv1 |
                    asio::ssl::context::no_tlsv1_1 | asio::ssl::context::single_dh_use);
    tls.use_certificate_chain_file(config.certificate_chain_file);
    tls.use_private_key_file(config.private_key_file, asio::ssl::context::pem);
    if (!config.dh_file.empty())
      tls.use_tmp_dh_file(config.dh_file);
    acceptor = make_shared<detail::Acceptor>(io_context, tls, config);
  }
};

WebsocketServer::WebsocketServer(asio::io_context& io_context, const Config& config)
    : pimpl_{std::make_unique<Pimpl>(io_context, config)} {}

WebsocketServer::~WebsocketServer() = default;

std::error_code WebsocketServer::run() { return pimpl_->acceptor->listen(); }

uint16_t WebsocketServer::port() const { return pimpl_->acceptor->port(); }

std::size_t WebsocketServer::connection_count() const {
  return pimpl_->acceptor->connection_count();
}

void WebsocketServer::shutdown() {
  TRACE("websocket server shutting down");
  pimpl_->acceptor->shutdown();
}

} // namespace haul::net
