#include "supervisor.hpp"

#include <sstream>

#include <glog/logging.h>

#include "carbon_client.hpp"
#include "elasticsearch_client.hpp"
#include "params.hpp"
#include "proc_stats_collector.hpp"

Try<std::shared_ptr<bucky::Supervisor>> bucky::Supervisor::create(
    const config::AgentConfig& config) {
  std::shared_ptr<SampleQueue> queue(new SampleQueue);
  const metadata_t metadata = params::get_metadata(config);

  std::vector<collector_ptr_t> collectors;
  if (config.proc_stats().enabled()) {
    collectors.push_back(collector_ptr_t(
            new ProcStatsCollector(queue, config.proc_stats(), metadata)));
  }
  if (collectors.empty()) {
    LOG(WARNING) << "No collectors are enabled, nothing will be forwarded";
  }

  std::vector<push_client_ptr_t> clients;
  if (config.carbon().enabled()) {
    Try<push_client_ptr_t> client = CarbonClient::create(config.carbon());
    if (client.isError()) {
      return Try<std::shared_ptr<Supervisor>>(Error(client.error()));
    }
    clients.push_back(client.get());
  }
  if (config.elasticsearch().enabled()) {
    Try<push_client_ptr_t> client = ElasticsearchClient::create(config.elasticsearch());
    if (client.isError()) {
      return Try<std::shared_ptr<Supervisor>>(Error(client.error()));
    }
    clients.push_back(client.get());
  }
  if (clients.empty()) {
    return Try<std::shared_ptr<Supervisor>>(Error("No clients are enabled"));
  }

  return std::shared_ptr<Supervisor>(new Supervisor(queue, collectors, clients,
          config.poll_timeout_ms(), config.process_join_timeout_ms()));
}

bucky::Supervisor::Supervisor(
    std::shared_ptr<SampleQueue> queue,
    const std::vector<collector_ptr_t>& collectors,
    const std::vector<push_client_ptr_t>& clients,
    size_t poll_timeout_ms,
    size_t join_timeout_ms)
  : sample_queue(queue),
    collectors(collectors),
    clients(clients),
    poll_timeout_ms(poll_timeout_ms),
    join_timeout_ms(join_timeout_ms),
    started(false),
    shut_down(false) { }

bucky::Supervisor::~Supervisor() {
  if (started && !shut_down) {
    Try<Nothing> result = shutdown(Option<std::string>("Supervisor destroyed while running"));
    LOG(ERROR) << result.error();
  }
}

void bucky::Supervisor::start() {
  if (started) {
    LOG(FATAL) << "Supervisor::start() was called twice";
    return;
  }
  started = true;
  for (const push_client_ptr_t& client : clients) {
    LOG(INFO) << "Starting client " << client->name();
    client->start();
  }
  for (const collector_ptr_t& collector : collectors) {
    LOG(INFO) << "Starting collector " << collector->name();
    collector->start();
  }
}

Try<Nothing> bucky::Supervisor::run() {
  if (!started) {
    LOG(FATAL) << "Supervisor::start() wasn't called before run()";
    return Try<Nothing>(Error("Not started"));
  }

  Sample sample;
  for (;;) {
    Option<std::string> dead = find_dead_task();
    if (dead.isSome()) {
      LOG(ERROR) << dead.get() << ", shutting down";
      return shutdown(dead);
    }

    switch (sample_queue->pop(poll_timeout_ms, sample)) {
      case pop_result::TIMEOUT:
        break;
      case pop_result::SENTINEL:
        LOG(INFO) << "Received shutdown request";
        return shutdown();
      case pop_result::SAMPLE:
        for (const push_client_ptr_t& client : clients) {
          if (!client->is_alive()) {
            std::string err = "Client " + client->name() + " is no longer running";
            LOG(ERROR) << err << ", shutting down";
            return shutdown(Option<std::string>(err));
          }
          client->send(sample);
        }
        break;
    }
  }
}

Try<Nothing> bucky::Supervisor::shutdown(const Option<std::string>& err/*=None()*/) {
  if (shut_down) {
    LOG(WARNING) << "Supervisor::shutdown() was called twice";
    return Nothing();
  }
  shut_down = true;

  std::vector<std::string> errors;
  if (err.isSome()) {
    errors.push_back(err.get());
  }

  LOG(INFO) << "Stopping " << collectors.size() << " collector(s)";
  for (const collector_ptr_t& collector : collectors) {
    collector->close();
  }
  for (const collector_ptr_t& collector : collectors) {
    join_or_terminate(*collector, errors);
  }

  LOG(INFO) << "Stopping " << clients.size() << " client(s)";
  for (const push_client_ptr_t& client : clients) {
    client->send_shutdown();
  }
  for (const push_client_ptr_t& client : clients) {
    join_or_terminate(*client, errors);
  }

  if (errors.empty()) {
    LOG(INFO) << "Shutdown complete";
    return Nothing();
  }
  std::ostringstream oss;
  for (size_t i = 0; i < errors.size(); ++i) {
    if (i != 0) {
      oss << "; ";
    }
    oss << errors[i];
  }
  return Try<Nothing>(Error(oss.str()));
}

void bucky::Supervisor::stop() {
  sample_queue->push_sentinel();
}

Option<std::string> bucky::Supervisor::find_dead_task() const {
  for (const collector_ptr_t& collector : collectors) {
    if (!collector->is_alive()) {
      return "Collector " + collector->name() + " is no longer running";
    }
  }
  for (const push_client_ptr_t& client : clients) {
    if (!client->is_alive()) {
      return "Client " + client->name() + " is no longer running";
    }
  }
  return None();
}

bool bucky::Supervisor::join_or_terminate(Task& task, std::vector<std::string>& errors) {
  if (task.join(join_timeout_ms)) {
    LOG(INFO) << task.name() << " exited";
    return true;
  }
  LOG(ERROR) << task.name() << " didn't exit within " << join_timeout_ms
             << "ms, terminating it";
  errors.push_back(task.name() + " had to be terminated");
  return task.terminate();
}
