#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

// Ordered, reliable, bidirectional byte stream between two paired peers.
// Every blocking call takes its own timeout and raises
// TransferFailure(Timeout) when it expires.
class TransportSession {
public:
  virtual ~TransportSession() = default;

  // Returns the number of bytes read, 0 on orderly end of stream.
  virtual std::size_t read_some(char* data, std::size_t size, std::chrono::milliseconds timeout) = 0;
  virtual void write_all(const char* data, std::size_t size, std::chrono::milliseconds timeout) = 0;

  // Half-closes our side and waits for the peer to close theirs. Returns
  // false when the peer did not close in time.
  virtual bool finish(std::chrono::milliseconds timeout) = 0;
  virtual void close() = 0;
  virtual std::string peer_description() const = 0;

  // Loops read_some until size bytes arrived or the stream ended; returns
  // the count actually read. The timeout applies to the whole call.
  std::size_t read_exact(char* data, std::size_t size, std::chrono::milliseconds timeout);
};

class TcpSession : public TransportSession {
public:
  TcpSession(asio::io_context& io, asio::ip::tcp::socket socket);
  ~TcpSession() override;

  static std::unique_ptr<TcpSession> connect(asio::io_context& io,
                                             const asio::ip::tcp::endpoint& endpoint,
                                             std::chrono::milliseconds timeout);

  std::size_t read_some(char* data, std::size_t size, std::chrono::milliseconds timeout) override;
  void write_all(const char* data, std::size_t size, std::chrono::milliseconds timeout) override;
  bool finish(std::chrono::milliseconds timeout) override;
  void close() override;
  std::string peer_description() const override { return peer_; }

  // Waits for the first readable byte without consuming it. Returns false
  // when the peer closed the stream instead.
  bool wait_readable(std::chrono::milliseconds timeout);

private:
  void await(const bool& done, std::chrono::milliseconds timeout, const char* what);

  asio::io_context& io_;
  asio::ip::tcp::socket socket_;
  std::string peer_;
};

std::string describe_endpoint(const asio::ip::tcp::endpoint& endpoint);
