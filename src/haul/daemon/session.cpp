
#include "session.hpp"

namespace haul {

bool filter_matches(std::string_view filter, std::string_view event_name) {
  if (filter == "*")
    return true;
  if (filter.size() >= 2 && filter.ends_with(".*"))
    return event_name.size() > filter.size() - 1
           && event_name.starts_with(filter.substr(0, filter.size() - 1));
  return filter == event_name;
}

// ------------------------------------------------------------------------------------ Construction

Session::Session(SessionId id, std::weak_ptr<Connection> connection, std::size_t queue_capacity)
    : id_{id}, connection_{std::move(connection)}, queue_capacity_{queue_capacity},
      last_activity_{clock_type::now()} {}

// ----------------------------------------------------------------------------------------- Getters

SessionState Session::state() const {
  std::lock_guard lock{padlock_};
  return state_;
}

AuthLevel Session::level() const {
  std::lock_guard lock{padlock_};
  return level_;
}

string Session::username() const {
  std::lock_guard lock{padlock_};
  return username_;
}

bool Session::is_open() const {
  std::lock_guard lock{padlock_};
  return state_ < SessionState::CLOSING;
}

void Session::touch(clock_type::time_point now) {
  std::lock_guard lock{padlock_};
  last_activity_ = std::max(last_activity_, now);
}

Session::clock_type::time_point Session::last_activity() const {
  std::lock_guard lock{padlock_};
  return last_activity_;
}

// ----------------------------------------------------------------------------------------- Filters

bool Session::add_filter(string filter) {
  std::lock_guard lock{padlock_};
  return filters_.insert(std::move(filter)).second;
}

bool Session::remove_filter(std::string_view filter) {
  std::lock_guard lock{padlock_};
  auto ii = filters_.find(filter);
  if (ii == filters_.end())
    return false;
  filters_.erase(ii);
  return true;
}

void Session::clear_filters() {
  std::lock_guard lock{padlock_};
  filters_.clear();
}

bool Session::has_filters() const {
  std::lock_guard lock{padlock_};
  return !filters_.empty();
}

vector<string> Session::filters() const {
  std::lock_guard lock{padlock_};
  return {cbegin(filters_), cend(filters_)};
}

bool Session::is_interested(std::string_view event_name) const {
  std::lock_guard lock{padlock_};
  return std::any_of(cbegin(filters_), cend(filters_), [event_name](const auto& filter) {
    return filter_matches(filter, event_name);
  });
}

// ------------------------------------------------------------------------------------------- Queue

bool Session::enqueue_event(net::BufferType&& buffer) {
  std::lock_guard lock{padlock_};
  if (state_ >= SessionState::CLOSING || outbound_.size() >= queue_capacity_) {
    ++dropped_events_;
    return false;
  }
  outbound_.push_back(std::move(buffer));
  return true;
}

bool Session::enqueue_response(net::BufferType&& buffer) {
  std::lock_guard lock{padlock_};
  if (state_ >= SessionState::CLOSING)
    return false;
  outbound_.push_back(std::move(buffer));
  return true;
}

std::optional<net::BufferType> Session::pop_outbound() {
  std::lock_guard lock{padlock_};
  if (outbound_.empty())
    return std::nullopt;
  auto buffer = std::move(outbound_.front());
  outbound_.pop_front();
  return buffer;
}

std::size_t Session::outbound_size() const {
  std::lock_guard lock{padlock_};
  return outbound_.size();
}

uint64_t Session::dropped_events() const {
  std::lock_guard lock{padlock_};
  return dropped_events_;
}

// ---------------------------------------------------------------------------------- SessionManager

bool Session::set_state_(SessionState state) {
  std::lock_guard lock{padlock_};
  if (state_ == state)
    return false;
  state_ = state;
  return true;
}

bool Session::set_authenticated_(string username, AuthLevel level) {
  std::lock_guard lock{padlock_};
  if (state_ >= SessionState::CLOSING)
    return false;
  username_ = std::move(username);
  level_ = level;
  state_ = SessionState::AUTHENTICATED;
  return true;
}

bool Session::begin_closing_() {
  std::lock_guard lock{padlock_};
  if (state_ >= SessionState::CLOSING)
    return false;
  state_ = SessionState::CLOSING;
  return true;
}

uint32_t Session::record_auth_failure_() {
  std::lock_guard lock{padlock_};
  return ++auth_failures_;
}

void Session::discard_outbound_() {
  std::lock_guard lock{padlock_};
  outbound_.clear();
  filters_.clear();
}

} // namespace haul
