#include "push_client.hpp"

#include <algorithm>

#include <glog/logging.h>

#include "tcp_connector.hpp"

std::string bucky::to_string(client_state::Value state) {
  switch (state) {
    case client_state::DISCONNECTED: return "disconnected";
    case client_state::CONNECTED: return "connected";
    case client_state::FLUSHING: return "flushing";
    case client_state::SHUTDOWN: return "shutdown";
  }
  return "???";
}

bucky::PushClient::PushClient(
    const std::string& name,
    const config::ClientSettings& settings,
    std::shared_ptr<TCPConnector> connector)
  : Task(name),
    flush_interval_ms(settings.flush_interval_ms()),
    flush_threshold(settings.flush_threshold()),
    chunk_size(settings.chunk_size()),
    buffer_limit(settings.buffer_limit()),
    tcp_connector(connector),
    io_service(new boost::asio::io_service),
    work(new boost::asio::io_service::work(*io_service)),
    flush_timer(*io_service),
    current_state(client_state::DISCONNECTED),
    dropped_count(0),
    threshold_flush_pending(false),
    threshold_flush_suspended(false) {
  if (chunk_size == 0) {
    LOG(FATAL) << name << ": chunk_size must be non-zero";
  }
}

bucky::PushClient::~PushClient() {
  tcp_connector->close();
}

void bucky::PushClient::send(const Sample& sample) {
  io_service->post(std::bind(&PushClient::receive, this, sample));
}

void bucky::PushClient::send_shutdown() {
  io_service->post(std::bind(&PushClient::shutdown_cb, this));
}

void bucky::PushClient::receive(const Sample& sample) {
  process_values(sample.receive_timestamp, sample.bucket, sample.values,
      sample.timestamp, sample.metadata);

  // After a failed push, retries are left to the flush timer.
  if (flush_threshold == 0 || threshold_flush_pending || threshold_flush_suspended) {
    return;
  }
  size_t size;
  {
    std::unique_lock<std::mutex> lock(buffer_mutex);
    size = output_buffer.size();
  }
  if (size >= flush_threshold) {
    // Flush as a separate step, after any samples which are already queued.
    threshold_flush_pending = true;
    io_service->post(std::bind(&PushClient::threshold_flush_cb, this));
  }
}

void bucky::PushClient::flush() {
  for (;;) {
    std::vector<std::string> chunk;
    {
      std::unique_lock<std::mutex> lock(buffer_mutex);
      if (output_buffer.empty()) {
        break;
      }
      size_t count = std::min(chunk_size, output_buffer.size());
      chunk.assign(output_buffer.begin(), output_buffer.begin() + count);
    }

    set_state(client_state::FLUSHING);
    Try<Nothing> result = push_chunk(chunk);
    if (result.isError()) {
      LOG(WARNING) << name() << ": Failed to push " << chunk.size() << " fragment(s), "
                   << "retrying on next flush: " << result.error();
      tcp_connector->close();
      set_state(client_state::DISCONNECTED);
      threshold_flush_suspended = true;
      return;
    }

    std::unique_lock<std::mutex> lock(buffer_mutex);
    output_buffer.erase(output_buffer.begin(), output_buffer.begin() + chunk.size());
    DLOG(INFO) << name() << ": Pushed " << chunk.size() << " fragment(s), "
               << output_buffer.size() << " remaining";
  }
  threshold_flush_suspended = false;
  set_state(tcp_connector->is_connected()
      ? client_state::CONNECTED : client_state::DISCONNECTED);
}

std::vector<std::string> bucky::PushClient::buffer() const {
  std::unique_lock<std::mutex> lock(buffer_mutex);
  return std::vector<std::string>(output_buffer.begin(), output_buffer.end());
}

bucky::client_state::Value bucky::PushClient::state() const {
  std::unique_lock<std::mutex> lock(buffer_mutex);
  return current_state;
}

void bucky::PushClient::buffer_output(const std::string& fragment) {
  std::unique_lock<std::mutex> lock(buffer_mutex);
  output_buffer.push_back(fragment);
  if (buffer_limit != 0 && output_buffer.size() > buffer_limit) {
    output_buffer.pop_front();
    ++dropped_count;
  }
}

void bucky::PushClient::run() {
  LOG(INFO) << name() << ": Starting with flush_interval_ms=" << flush_interval_ms
            << " flush_threshold=" << flush_threshold << " chunk_size=" << chunk_size
            << " buffer_limit=" << buffer_limit;
  start_flush_timer();
  io_service->run();
  LOG(INFO) << name() << ": Exiting with " << buffer().size() << " unflushed fragment(s)";
}

void bucky::PushClient::interrupt() {
  LOG(WARNING) << name() << ": Interrupting client loop";
  io_service->stop();
}

void bucky::PushClient::start_flush_timer() {
  flush_timer.expires_from_now(boost::posix_time::milliseconds(flush_interval_ms));
  flush_timer.async_wait(std::bind(&PushClient::flush_timer_cb, this, std::placeholders::_1));
}

void bucky::PushClient::flush_timer_cb(const boost::system::error_code& ec) {
  if (ec == boost::asio::error::operation_aborted || state() == client_state::SHUTDOWN) {
    return;
  }
  if (ec) {
    LOG(ERROR) << name() << ": Flush timer returned error. "
               << "err='" << ec.message() << "'(" << ec << ")";
  }

  size_t dropped;
  {
    std::unique_lock<std::mutex> lock(buffer_mutex);
    dropped = dropped_count;
    dropped_count = 0;
  }
  if (dropped != 0) {
    LOG(WARNING) << name() << ": Dropped " << dropped << " fragment(s) from the buffer, "
                 << "buffer_limit=" << buffer_limit << " reached";
  }

  flush();
  start_flush_timer();
}

void bucky::PushClient::threshold_flush_cb() {
  threshold_flush_pending = false;
  if (state() == client_state::SHUTDOWN) {
    return;
  }
  flush();
}

void bucky::PushClient::shutdown_cb() {
  LOG(INFO) << name() << ": Received shutdown, flushing " << buffer().size() << " fragment(s)";
  boost::system::error_code ec;
  flush_timer.cancel(ec);
  if (ec) {
    LOG(ERROR) << name() << ": Flush timer cancellation returned error. "
               << "err='" << ec.message() << "'(" << ec << ")";
  }

  flush();
  tcp_connector->close();
  set_state(client_state::SHUTDOWN);

  // Let run() return once any remaining handlers are done.
  work.reset();
}

void bucky::PushClient::set_state(client_state::Value state) {
  std::unique_lock<std::mutex> lock(buffer_mutex);
  current_state = state;
}
