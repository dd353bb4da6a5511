#pragma once

#include "core/errors.hpp"
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <cstdint>
#include <string>

namespace net = boost::asio;
using tcp = net::ip::tcp;

// namespace sockops: thin expected-returning wrappers over the Asio socket
// calls the listeners and sessions use.
namespace sockops {

inline bridge::Result<tcp::endpoint> ResolveBind(net::io_context &ioc,
                                                 const std::string &host,
                                                 std::uint16_t port) {
  const std::string h = host.empty() ? "0.0.0.0" : host;
  boost::system::error_code ec;
  const auto addr = net::ip::make_address(h, ec);
  if (!ec) {
    return tcp::endpoint(addr, port);
  }
  tcp::resolver resolver(ioc);
  auto results = resolver.resolve(h, std::to_string(port),
                                  tcp::resolver::passive, ec);
  if (ec) {
    return std::unexpected(ec);
  }
  if (results.empty()) {
    return std::unexpected(
        boost::system::error_code(net::error::host_not_found));
  }
  return results.begin()->endpoint();
}

// open + SO_REUSEADDR + bind + listen
inline bridge::Status OpenAcceptor(tcp::acceptor &acceptor,
                                   const tcp::endpoint &ep) {
  boost::system::error_code ec;
  acceptor.open(ep.protocol(), ec);
  if (ec) {
    return std::unexpected(ec);
  }
  acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
  if (ec) {
    return std::unexpected(ec);
  }
  acceptor.bind(ep, ec);
  if (ec) {
    boost::system::error_code ignored;
    acceptor.close(ignored);
    return std::unexpected(ec);
  }
  acceptor.listen(net::socket_base::max_listen_connections, ec);
  return bridge::MakeStatus(ec);
}

inline bridge::Result<tcp::socket> AsyncAccept(tcp::acceptor &acceptor,
                                               net::yield_context yield) {
  boost::system::error_code ec;
  tcp::socket sock(acceptor.get_executor());
  acceptor.async_accept(sock, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  return sock;
}

inline bridge::Status AsyncWriteAll(tcp::socket &sock, net::const_buffer data,
                                    net::yield_context yield) {
  boost::system::error_code ec;
  net::async_write(sock, data, yield[ec]);
  return bridge::MakeStatus(ec);
}

inline void SetTcpNoDelay(tcp::socket &sock) {
  boost::system::error_code ec;
  sock.set_option(net::ip::tcp::no_delay(true), ec);
  (void)ec;
}

inline void ShutdownAndClose(tcp::socket &sock) {
  boost::system::error_code ec;
  sock.shutdown(tcp::socket::shutdown_both, ec);
  sock.close(ec);
}

inline std::string PeerName(const tcp::socket &sock) {
  boost::system::error_code ec;
  const auto ep = sock.remote_endpoint(ec);
  if (ec) {
    return "?";
  }
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace sockops
