#include <lib/collectors/postgres/src/postgres_metrics.h>
#include <lib/collectors/postgres/src/psql_fetcher.h>
#include <lib/config/src/config.h>
#include <lib/logger/src/logger.h>
#include <lib/util/src/util.h>
#include <absl/strings/str_split.h>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fmt/chrono.h>
#include <getopt.h>
#include <random>
#include <spectator/registry.h>

using pgagent::AgentConfig;
using pgagent::Logger;
using pgagent::PostgresMetrics;
using pgagent::PsqlFetcher;

struct terminator {
  terminator() noexcept = default;

  // returns false if killed:
  template <class R, class P>
  bool wait_for(std::chrono::duration<R, P> const& time) {
    if (time.count() <= 0) {
      Logger()->warn("waiting for zero ticks!");
      return true;
    }
    std::unique_lock<std::mutex> lock(m);
    return !cv.wait_for(lock, time, [&] { return terminate; });
  }
  void kill() {
    std::unique_lock<std::mutex> lock(m);
    terminate = true;
    cv.notify_all();
  }

 private:
  std::condition_variable cv;
  std::mutex m;
  bool terminate = false;
};

terminator runner;

static void handle_signal(int signal) {
  const char* name;
  switch (signal) {
    case SIGINT:
      name = "SIGINT";
      break;
    case SIGTERM:
      name = "SIGTERM";
      break;
    default:
      name = "Unknown";
  }

  Logger()->info("Caught {}, cleaning up", name);
  runner.kill();
}

static void init_signals() {
  struct sigaction sa {};
  sa.sa_handler = &handle_signal;
  sa.sa_flags = SA_RESETHAND;  // remove the handler after the first signal
  sigfillset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

// delay the first poll so we do not publish too close to a step boundary
long initial_polling_delay(int interval) {
  std::random_device rdev;
  std::mt19937 generator(rdev());

  auto now = std::chrono::system_clock::now();
  auto epoch = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
  long step_boundary = epoch.count() / interval * interval;
  long start_second = epoch.count() - step_boundary;

  Logger()->debug("epoch={} step_boundary={} start_second={}", epoch.count(), step_boundary,
                  start_second);

  auto margin = interval / 6;
  if (start_second < margin) {
    std::uniform_int_distribution<long> start_delay_dist(margin - start_second,
                                                         interval - margin - start_second);
    return start_delay_dist(generator);
  } else if (start_second > interval - margin) {
    auto next_step = interval - start_second;
    std::uniform_int_distribution<long> start_delay_dist(margin, interval - margin);
    return next_step + start_delay_dist(generator);
  }
  return 0;
}

void collect_postgres_metrics(Registry* registry, const AgentConfig& config) {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  using std::chrono::seconds;
  using std::chrono::system_clock;

  std::vector<std::unique_ptr<PostgresMetrics>> collectors;
  for (const auto& database : config.databases) {
    auto fetcher = std::make_unique<PsqlFetcher>(config.connection, database, registry);
    collectors.emplace_back(
        std::make_unique<PostgresMetrics>(registry, std::move(fetcher), database, config.tags));
    Logger()->info("Collecting PostgreSQL statistics for database {}", database);
  }

  auto delay = initial_polling_delay(config.poll_interval);
  Logger()->info("Initial polling delay is {}s", delay);
  if (delay > 0 && !runner.wait_for(seconds(delay))) {
    return;
  }

  auto next_run = system_clock::now();
  std::chrono::nanoseconds time_to_sleep;
  do {
    auto start = system_clock::now();
    for (auto& collector : collectors) {
      collector->update_stats();
    }
    auto elapsed = duration_cast<milliseconds>(system_clock::now() - start);
    Logger()->debug("Published PostgreSQL metrics (delay={})", elapsed);

    next_run += seconds(config.poll_interval);
    time_to_sleep = next_run - system_clock::now();
  } while (runner.wait_for(time_to_sleep));
}

struct agent_options {
  std::string cfg_file;
  // settings given on the command line, applied over the config file
  std::vector<std::pair<std::string, std::string>> settings;
  bool verbose;
};

static void usage(const char* progname) {
  fprintf(stderr,
          "Usage: %s [-c cfg_file] [-d databases] [-H host] [-p port] [-U user]\n"
          "          [-i poll-interval] [-t extra-tags] [-v]\n"
          "\t-c\tUse cfg_file as the configuration file. Default %s\n"
          "\t-d\tComma separated list of databases to monitor\n"
          "\t-H\tDatabase server host\n"
          "\t-p\tDatabase server port\n"
          "\t-U\tDatabase user\n"
          "\t-i\tSeconds between polls\n"
          "\t-t tags\tAdd extra tags to every metric.\n"
          "\t\tExpects a string of the form key=val,key2=val2\n"
          "\t-v\tBe very verbose\n",
          progname, ConfigConstants::DefaultPath);
  exit(EXIT_FAILURE);
}

static int parse_options(int& argc, char* const argv[], agent_options* result) {
  result->verbose = std::getenv("PGAGENT_VERBOSE") != nullptr;

  int ch;
  while ((ch = getopt(argc, argv, "c:d:H:p:U:i:t:v")) != -1) {
    switch (ch) {
      case 'c':
        result->cfg_file = optarg;
        break;
      case 'd':
        result->settings.emplace_back("databases", optarg);
        break;
      case 'H':
        result->settings.emplace_back("host", optarg);
        break;
      case 'p':
        result->settings.emplace_back("port", optarg);
        break;
      case 'U':
        result->settings.emplace_back("user", optarg);
        break;
      case 'i':
        result->settings.emplace_back("poll_interval", optarg);
        break;
      case 't':
        result->settings.emplace_back("tags", optarg);
        break;
      case 'v':
        result->verbose = true;
        break;
      case '?':
      default:
        usage(argv[0]);
    }
  }
  if (result->cfg_file.empty()) {
    result->cfg_file = ConfigConstants::DefaultPath;
  }
  return optind;
}

int main(int argc, char* const argv[]) {
  agent_options options{};
  const char* progname = argv[0];
  parse_options(argc, argv, &options);

  auto logger = Logger();
  if (options.verbose) {
    pgagent::log_manager().SetLevel(spdlog::level::debug);
  }

  auto maybe_config = pgagent::parse_config_file(options.cfg_file);
  if (!maybe_config) {
    logger->error("Invalid configuration in {}", options.cfg_file);
    return EXIT_FAILURE;
  }
  auto config = std::move(maybe_config.value());
  for (const auto& setting : options.settings) {
    if (!pgagent::apply_setting(setting.first, setting.second, &config)) {
      fprintf(stderr, "Invalid value for %s: %s\n", setting.first.c_str(),
              setting.second.c_str());
      usage(progname);
    }
  }

  std::vector<std::string> psql_cmd = absl::StrSplit(config.connection.psql, ' ');
  if (!pgagent::can_execute(psql_cmd.front())) {
    logger->warn("{} not found, PostgreSQL statistics will not be available",
                 config.connection.psql);
  }

  init_signals();
  Config spectator_config(WriterConfig(WriterTypes::Unix));
  Registry registry(spectator_config);

  logger->info("Start gathering PostgreSQL metrics every {}s", config.poll_interval);
  collect_postgres_metrics(&registry, config);
  logger->info("Shutting down");
  spdlog::shutdown();
  return 0;
}
