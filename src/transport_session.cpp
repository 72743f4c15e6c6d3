#include "transport_session.hpp"

#include <array>

#include <fmt/format.h>

#include "io_wait.hpp"
#include "transfer_error.hpp"

using tcp = asio::ip::tcp;

namespace {

TransferFailure timeout_failure(const char* what, const std::string& peer, std::chrono::milliseconds timeout) {
  auto error = make_error(TransferErrorKind::Timeout,
                          fmt::format("{} {} timed out after {} ms", what, peer, timeout.count()));
  error.retryable = true;
  return TransferFailure(std::move(error));
}

} // namespace

std::string describe_endpoint(const tcp::endpoint& endpoint) {
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

std::size_t TransportSession::read_exact(char* data, std::size_t size, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::size_t total = 0;
  while(total < size) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
    if(remaining.count() <= 0) {
      throw timeout_failure("read from", peer_description(), timeout);
    }
    auto n = read_some(data + total, size - total, remaining);
    if(n == 0) break;
    total += n;
  }
  return total;
}

TcpSession::TcpSession(asio::io_context& io, tcp::socket socket)
  : io_(io), socket_(std::move(socket)) {
  std::error_code ec;
  auto remote = socket_.remote_endpoint(ec);
  peer_ = ec ? std::string("<unconnected>") : describe_endpoint(remote);
  socket_.set_option(tcp::no_delay(true), ec);
}

TcpSession::~TcpSession() {
  close();
}

std::unique_ptr<TcpSession> TcpSession::connect(asio::io_context& io,
                                                const tcp::endpoint& endpoint,
                                                std::chrono::milliseconds timeout) {
  tcp::socket socket(io);
  bool done = false;
  std::error_code result;
  socket.async_connect(endpoint, [&](const std::error_code& ec){
    result = ec;
    done = true;
  });
  if(!run_until(io, done, std::chrono::steady_clock::now() + timeout)) {
    std::error_code ignored;
    socket.close(ignored);
    drain_until(io, done);
    throw timeout_failure("connect to", describe_endpoint(endpoint), timeout);
  }
  if(result) {
    throw TransferFailure(network_error(result, "connect to " + describe_endpoint(endpoint)));
  }
  return std::make_unique<TcpSession>(io, std::move(socket));
}

void TcpSession::await(const bool& done, std::chrono::milliseconds timeout, const char* what) {
  if(run_until(io_, done, std::chrono::steady_clock::now() + timeout)) return;
  std::error_code ignored;
  socket_.close(ignored);
  drain_until(io_, done);
  throw timeout_failure(what, peer_, timeout);
}

std::size_t TcpSession::read_some(char* data, std::size_t size, std::chrono::milliseconds timeout) {
  bool done = false;
  std::error_code result;
  std::size_t transferred = 0;
  socket_.async_read_some(asio::buffer(data, size),
    [&](const std::error_code& ec, std::size_t n){
      result = ec;
      transferred = n;
      done = true;
    });
  await(done, timeout, "read from");
  if(result == asio::error::eof) return 0;
  if(result) {
    throw TransferFailure(network_error(result, "read from " + peer_));
  }
  return transferred;
}

void TcpSession::write_all(const char* data, std::size_t size, std::chrono::milliseconds timeout) {
  bool done = false;
  std::error_code result;
  asio::async_write(socket_, asio::buffer(data, size),
    [&](const std::error_code& ec, std::size_t){
      result = ec;
      done = true;
    });
  await(done, timeout, "write to");
  if(result) {
    throw TransferFailure(network_error(result, "write to " + peer_));
  }
}

bool TcpSession::wait_readable(std::chrono::milliseconds timeout) {
  bool done = false;
  std::error_code result;
  std::size_t peeked = 0;
  std::array<char, 1> probe{};
  socket_.async_receive(asio::buffer(probe), tcp::socket::message_peek,
    [&](const std::error_code& ec, std::size_t n){
      result = ec;
      peeked = n;
      done = true;
    });
  await(done, timeout, "handshake with");
  if(result == asio::error::eof) return false;
  if(result) {
    throw TransferFailure(network_error(result, "handshake with " + peer_));
  }
  return peeked > 0;
}

bool TcpSession::finish(std::chrono::milliseconds timeout) {
  std::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_send, ec);
  if(ec) return false;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<char, 512> sink{};
  while(true) {
    bool done = false;
    std::error_code result;
    socket_.async_read_some(asio::buffer(sink),
      [&](const std::error_code& read_ec, std::size_t){
        result = read_ec;
        done = true;
      });
    if(!run_until(io_, done, deadline)) {
      std::error_code ignored;
      socket_.close(ignored);
      drain_until(io_, done);
      return false;
    }
    if(result == asio::error::eof) return true;
    if(result) return false;
  }
}

void TcpSession::close() {
  if(!socket_.is_open()) return;
  std::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}
