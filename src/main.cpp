#include "memtftp/detail/argument_parser.hpp"
#include "memtftp/file_store.hpp"
#include "memtftp/tftp_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <thread>

using namespace net::service;
using namespace memtftp;

using tftp_server = context_thread<server>;

static constexpr unsigned short PORT = 69;
static constexpr char const *const usage =
    "usage: {} [-l <LEVEL>] [-p <PORT>] [-t <MS>] [-r <N>]\n"
    "\n"
    "Options:\n"
    "-h, --help                         print this help.\n"
    "-l, --log-level=<LEVEL>            set the log-level (critical, error, "
    "warn, info, debug)\n"
    "-p, --port=<PORT>                  set the port to listen on (default: "
    "69).\n"
    "-t, --timeout=<MS>                 milliseconds to wait for a reply "
    "(default: 5000).\n"
    "-r, --retries=<N>                  transmissions of a packet before a "
    "transfer is abandoned (default: 5).\n";

static auto signal_mask() -> sigset_t *
{
  static auto set = sigset_t{};
  static sigset_t *setp = nullptr;
  static auto mtx = std::mutex{};

  if (auto lock = std::lock_guard{mtx}; !setp)
  {
    sigemptyset(&set);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    sigaddset(&set, SIGINT);
    setp = &set;
  }
  return setp;
}

static auto signal_handler(tftp_server &server) -> std::jthread
{
  static const sigset_t *sigmask = nullptr;
  static auto mtx = std::mutex();

  if (auto lock = std::lock_guard{mtx}; !sigmask)
  {
    sigmask = signal_mask();
    pthread_sigmask(SIG_BLOCK, sigmask, nullptr);

    return std::jthread([&](const std::stop_token &token) noexcept {
      static const auto timeout = timespec{.tv_sec = 0, .tv_nsec = 50000000};

      while (!token.stop_requested())
      {
        using enum tftp_server::signals;
        switch (sigtimedwait(sigmask, nullptr, &timeout))
        {
          case SIGTERM:
          case SIGHUP:
          case SIGINT:
            server.signal(terminate);
            break;

          default:
            break;
        }
      }
    });
  }

  return {};
}

struct config {
  unsigned short port = PORT;
  server::options options;
};

static auto set_loglevel(std::string_view value) -> int
{
  using std::tolower;
  auto level = std::string(value);
  std::ranges::transform(level, level.begin(),
                         [](unsigned char chr) { return tolower(chr); });

  auto spdlog_level = spdlog::level::from_str(level);
  if (spdlog_level != spdlog::level::off || level == "off")
  {
    spdlog::set_level(spdlog_level);
    return 0;
  }

  std::cerr << std::format("Unrecognized log level: {}\n", value)
            << "Valid log levels are: ";

  int count = 0;
  for (const auto &level_str : spdlog::level::level_string_views)
  {
    if (count++ > 0)
      std::cerr << ", ";

    std::cerr << std::string(level_str.begin(), level_str.end());
  }
  std::cerr << "\n";
  return -1;
}

/** @brief Parses a positive integer option value into out. */
template <typename T>
static auto parse_positive(std::string_view value, T &out) -> bool
{
  auto parsed = T{};
  auto [ptr, err] = std::from_chars(value.cbegin(), value.cend(), parsed);
  if (err != std::errc{} || ptr != value.cend() || parsed == 0)
    return false;

  out = parsed;
  return true;
}

// NOLINTNEXTLINE
auto parse_args(int argc, char const *const *argv,
                int &status) -> std::optional<config>
{
  using namespace memtftp::detail;

  auto conf = config();
  auto progname = std::filesystem::path(*argv).stem();

  status = EXIT_SUCCESS;
  auto error = [&]() -> std::optional<config> {
    std::cerr << std::format(usage, progname.c_str());
    status = EXIT_FAILURE;
    return std::nullopt;
  };

  for (const auto &option : argument_parser::parse(argc, argv))
  {
    const auto &[flag, value] = option;
    if (flag.empty())
    {
      std::cerr << std::format("Unexpected argument: {}\n", value);
      return error();
    }

    if (flag == "-h" || flag == "--help")
    {
      std::cout << std::format(usage, progname.c_str());
      return std::nullopt;
    }

    if (flag == "-l" || flag == "--log-level")
    {
      if (!set_loglevel(value))
        continue;

      return error();
    }

    if (flag == "-p" || flag == "--port")
    {
      if (!parse_positive(value, conf.port))
      {
        std::cerr << std::format("Invalid port number: {}\n", value);
        return error();
      }
    }
    else if (flag == "-t" || flag == "--timeout")
    {
      auto millis = session::duration::rep{};
      if (!parse_positive(value, millis))
      {
        std::cerr << std::format("Invalid timeout: {}\n", value);
        return error();
      }
      conf.options.timeout = session::duration(millis);
    }
    else if (flag == "-r" || flag == "--retries")
    {
      auto attempts = unsigned{};
      if (!parse_positive(value, attempts) ||
          attempts > std::numeric_limits<std::uint8_t>::max())
      {
        std::cerr << std::format("Invalid retry count: {}\n", value);
        return error();
      }
      conf.options.max_attempts = static_cast<std::uint8_t>(attempts);
    }
    else
    {
      std::cerr << std::format("Unknown flag: {}\n", flag);
      return error();
    }
  }

  return {conf};
}

auto main(int argc, char *argv[]) -> int
{
  using namespace io::socket;

  auto status = EXIT_SUCCESS;
  auto conf = parse_args(argc, argv, status);
  if (!conf)
    return status;

  auto store = std::make_shared<file_store>();
  store->init();

  auto address = socket_address<sockaddr_in6>{};
  address->sin6_family = AF_INET6;
  address->sin6_port = htons(conf->port);

  auto server = tftp_server();

  auto sighandler = signal_handler(server);

  spdlog::info("TFTP server starting on UDP port {} (timeout {}ms, {} "
               "attempts).",
               conf->port, conf->options.timeout.count(),
               static_cast<int>(conf->options.max_attempts));
  server.start(address, store, conf->options);
  server.state.wait(server.PENDING);
  server.state.wait(server.STARTED);

  spdlog::info("TFTP server stopped, {} files discarded.", store->reset());
  return 0;
}
