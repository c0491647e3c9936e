#include <stdio.h>

#include <glog/logging.h>

#include "params.hpp"
#include "signal_listener.hpp"
#include "supervisor.hpp"

/**
 * Runs the agent until SIGTERM/SIGINT, or until any of its collectors or clients fails.
 * Without a config file, the built-in defaults are used.
 */
int main(int argc, char* argv[]) {
  if (argc > 2 || (argc == 2 && argv[1][0] == '-')) {
    fprintf(stderr, "Usage: %s [CONFIG_FILE]\n", argv[0]);
    return 1;
  }

  ::google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = 1;

  bucky::config::AgentConfig config;
  if (argc == 2) {
    Try<bucky::config::AgentConfig> loaded = bucky::params::load(argv[1]);
    if (loaded.isError()) {
      LOG(ERROR) << loaded.error();
      return 1;
    }
    config = loaded.get();
  } else {
    Try<Nothing> valid = bucky::params::validate(config);
    if (valid.isError()) {
      LOG(ERROR) << "Invalid default config: " << valid.error();
      return 1;
    }
    LOG(INFO) << "No config file provided, using defaults";
  }

  FLAGS_minloglevel = bucky::params::to_min_log_level(config.log_level()).get();
  if (bucky::params::is_verbose_log_level(config.log_level())) {
    FLAGS_v = 1;
  }

  Try<std::shared_ptr<bucky::Supervisor>> supervisor = bucky::Supervisor::create(config);
  if (supervisor.isError()) {
    LOG(ERROR) << "Failed to set up: " << supervisor.error();
    return 1;
  }

  bucky::SignalListener signals(std::bind(&bucky::Supervisor::stop, supervisor.get().get()));
  signals.start();

  supervisor.get()->start();
  Try<Nothing> result = supervisor.get()->run();
  if (result.isError()) {
    LOG(ERROR) << "Exiting after failure: " << result.error();
    return 1;
  }
  LOG(INFO) << "Exiting";
  return 0;
}
