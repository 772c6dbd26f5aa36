#include "app/DashboardServer.hpp"
#include "app/HttpRoutes.hpp"
#include "util/Log.hpp"

#include <liburing.h>
#include <arpa/inet.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/uio.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string_view>

namespace sysgraph::app {

// Tags for distinguishing CQE sources
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

DashboardServer::DashboardServer(const Ticker& ticker, const HistoryStore& store,
                                 std::string bind_addr, uint16_t port)
    : ticker_(ticker), store_(store), bind_addr_(std::move(bind_addr)), port_(port) {
  // Created up front so stop() can always wake the loop
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    SYSGRAPH_LOG_ERROR("server", "eventfd() failed: %s", std::strerror(errno));
  }
}

DashboardServer::~DashboardServer() {
  stop();
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
}

void DashboardServer::start() {
  if (thread_.joinable() || stop_eventfd_ < 0) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void DashboardServer::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  uint64_t val = 1;
  if (::write(stop_eventfd_, &val, sizeof(val)) < 0) {
    SYSGRAPH_LOG_WARN("server", "stop signal write failed: %s", std::strerror(errno));
  }
  thread_.join();
}

void DashboardServer::run(std::stop_token st) {
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listen_fd_ < 0) {
    SYSGRAPH_LOG_ERROR("server", "socket() failed: %s", std::strerror(errno));
    return;
  }

  int optval = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (::inet_pton(AF_INET, bind_addr_.c_str(), &addr.sin_addr) != 1) {
    SYSGRAPH_LOG_ERROR("server", "invalid bind address '%s'", bind_addr_.c_str());
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    SYSGRAPH_LOG_ERROR("server", "bind(%s:%d) failed: %s", bind_addr_.c_str(), port_, std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  if (::listen(listen_fd_, 16) < 0) {
    SYSGRAPH_LOG_ERROR("server", "listen() failed: %s", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  struct io_uring ring{};
  if (int rc = io_uring_queue_init(16, &ring, 0); rc < 0) {
    SYSGRAPH_LOG_ERROR("server", "io_uring_queue_init() failed: %s", std::strerror(-rc));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  auto submit_poll = [&](int fd, UringTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    if (!sqe) return false;
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
    return true;
  };

  if (!submit_poll(listen_fd_, UringTag::ListenPoll) || !submit_poll(stop_eventfd_, UringTag::StopPoll)) {
    SYSGRAPH_LOG_ERROR("server", "io_uring submission queue unavailable");
    io_uring_queue_exit(&ring);
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }
  io_uring_submit(&ring);

  SYSGRAPH_LOG_INFO("server", "dashboard listening on http://%s:%d/", bind_addr_.c_str(), port_);

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      SYSGRAPH_LOG_ERROR("server", "io_uring_wait_cqe() failed: %s", std::strerror(-ret));
      break;
    }

    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);

    if (tag == UringTag::StopPoll || st.stop_requested()) break;

    if (tag == UringTag::ListenPoll) {
      if (res >= 0) {
        int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd >= 0) {
          handle_client(client_fd);
          ::close(client_fd);
        } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
          SYSGRAPH_LOG_WARN("server", "accept4() failed: %s", std::strerror(errno));
        }
      }
      // Re-arm listen poll
      if (!submit_poll(listen_fd_, UringTag::ListenPoll)) {
        SYSGRAPH_LOG_ERROR("server", "submission queue full; stopping");
        break;
      }
      io_uring_submit(&ring);
    }
  }

  io_uring_queue_exit(&ring);
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

void DashboardServer::handle_client(int fd) {
  // Timeouts keep a slow client from holding the loop
  struct timeval tv{.tv_sec = 5, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  char reqbuf[4096];
  ssize_t nr = ::recv(fd, reqbuf, sizeof(reqbuf) - 1, 0);
  if (nr <= 0) return;

  std::string_view req(reqbuf, static_cast<size_t>(nr));
  auto line_end = req.find('\r');
  if (line_end == std::string_view::npos) line_end = req.find('\n');
  std::string_view request_line = req.substr(0, line_end);

  HttpResponse resp = route_request(request_line, ticker_, store_);
  std::string head = response_head(resp);
  SYSGRAPH_LOG_DEBUG("server", "%.*s -> %d", static_cast<int>(request_line.size()),
                     request_line.data(), resp.status);

  // Scatter-gather send: headers + body without concatenation
  struct iovec iov[2] = {
    {.iov_base = head.data(), .iov_len = head.size()},
    {.iov_base = resp.body.data(), .iov_len = resp.body.size()}
  };
  struct msghdr msg{};
  msg.msg_iov = iov;
  msg.msg_iovlen = 2;
  if (::sendmsg(fd, &msg, MSG_NOSIGNAL) < 0) {
    SYSGRAPH_LOG_DEBUG("server", "sendmsg() failed: %s", std::strerror(errno));
  }
}

} // namespace sysgraph::app
