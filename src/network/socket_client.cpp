#include "network/socket_client.hpp"
#include "network/http_helper.hpp"
#include "network/tls_context.hpp"
#include "network/url.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
//---------------------------------------------------------------------------
// UrlBlob - Range-Aware Blob Access over HTTP
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace urlblob::network {
//---------------------------------------------------------------------------
using namespace std;
//---------------------------------------------------------------------------
namespace {
//---------------------------------------------------------------------------
/// The largest accepted response header
constexpr uint64_t maxHeaderSize = 1ull << 20;
//---------------------------------------------------------------------------
void ignoreSigPipe()
// Writes to a closed tls socket must fail with EPIPE instead of a signal
{
    static once_flag ignored;
    call_once(ignored, [] {
        struct sigaction current = {};
        if (sigaction(SIGPIPE, nullptr, &current) == 0 && current.sa_handler == SIG_DFL) {
            struct sigaction ignore = {};
            ignore.sa_handler = SIG_IGN;
            sigemptyset(&ignore.sa_mask);
            if (sigaction(SIGPIPE, &ignore, nullptr) != 0)
                cerr << "Could not ignore SIGPIPE: " << strerror(errno) << endl;
        }
    });
}
//---------------------------------------------------------------------------
} // namespace
//---------------------------------------------------------------------------
class SocketClient::Connection {
    /// The socket
    int _fd;
    /// The tls session
    SSL* _ssl;
    /// The tls context
    TLSContext* _context;
    /// The session cache key
    string _peer;
    /// Finished the handshake?
    bool _connected;

    public:
    /// The constructor
    explicit Connection(int fd) : _fd(fd), _ssl(nullptr), _context(nullptr), _connected(false) {}
    /// The destructor
    ~Connection();
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Performs the tls handshake
    void startTLS(TLSContext& context, const Url& url, bool verifyPeer);
    /// Send all bytes
    void send(string_view data);
    /// Receive some bytes, returns 0 once the peer closed the connection
    uint64_t recv(char* data, uint64_t length);
};
//---------------------------------------------------------------------------
SocketClient::Connection::~Connection()
// The destructor
{
    if (_ssl) {
        if (_connected) {
            _context->cacheSession(_peer, _ssl);
            if (SSL_shutdown(_ssl) < 0)
                ERR_clear_error();
        }
        SSL_free(_ssl);
    }
    if (_fd >= 0)
        close(_fd);
}
//---------------------------------------------------------------------------
void SocketClient::Connection::startTLS(TLSContext& context, const Url& url, bool verifyPeer)
// Performs the tls handshake
{
    _context = &context;
    _peer = url.host + ":" + to_string(url.port);
    _ssl = SSL_new(context.get());
    if (!_ssl)
        throw runtime_error("TLS error! Could not create the session: " + TLSContext::lastError());
    if (SSL_set_fd(_ssl, _fd) != 1)
        throw runtime_error("TLS error! Could not attach the socket: " + TLSContext::lastError());

    // Server name indication
    if (SSL_set_tlsext_host_name(_ssl, url.host.c_str()) != 1)
        throw runtime_error("TLS error! Could not set the server name: " + TLSContext::lastError());
    if (verifyPeer && SSL_set1_host(_ssl, url.host.c_str()) != 1)
        throw runtime_error("TLS error! Could not set the verified host: " + TLSContext::lastError());

    context.reuseSession(_peer, _ssl);
    if (SSL_connect(_ssl) != 1) {
        context.dropSession(_peer);
        auto verify = SSL_get_verify_result(_ssl);
        if (verifyPeer && verify != X509_V_OK)
            throw runtime_error("TLS error! Certificate verification failed for " + url.host + ": " + X509_verify_cert_error_string(verify));
        throw runtime_error("TLS error! Handshake with " + url.host + " failed: " + TLSContext::lastError());
    }
    _connected = true;
}
//---------------------------------------------------------------------------
void SocketClient::Connection::send(string_view data)
// Send all bytes
{
    while (!data.empty()) {
        if (_ssl) {
            size_t written = 0;
            if (SSL_write_ex(_ssl, data.data(), data.size(), &written) != 1) {
                auto error = SSL_get_error(_ssl, 0);
                if (error == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))
                    throw runtime_error("Send error! Timeout reached");
                throw runtime_error("Send error! " + TLSContext::lastError());
            }
            data.remove_prefix(written);
        } else {
            auto written = ::send(_fd, data.data(), data.size(), MSG_NOSIGNAL);
            if (written < 0) {
                if (errno == EINTR)
                    continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                    throw runtime_error("Send error! Timeout reached");
                throw runtime_error("Send error! " + string(strerror(errno)));
            }
            data.remove_prefix(static_cast<size_t>(written));
        }
    }
}
//---------------------------------------------------------------------------
uint64_t SocketClient::Connection::recv(char* data, uint64_t length)
// Receive some bytes
{
    if (_ssl) {
        size_t read = 0;
        if (SSL_read_ex(_ssl, data, length, &read) == 1)
            return read;
        auto error = SSL_get_error(_ssl, 0);
        if (error == SSL_ERROR_ZERO_RETURN)
            return 0;
        if (error == SSL_ERROR_SYSCALL) {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                throw runtime_error("Recv error! Timeout reached");
            if (!ERR_peek_error())
                return 0;
        }
        throw runtime_error("Recv error! " + TLSContext::lastError());
    }
    while (true) {
        auto read = ::recv(_fd, data, length, 0);
        if (read >= 0)
            return static_cast<uint64_t>(read);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            throw runtime_error("Recv error! Timeout reached");
        throw runtime_error("Recv error! " + string(strerror(errno)));
    }
}
//---------------------------------------------------------------------------
SocketClient::SocketClient(Config config) : _config(move(config)), _resolver(), _context()
// The constructor
{
    if (!_config.chunkSize)
        _config.chunkSize = Config::defaultChunkSize;
    ignoreSigPipe();
}
//---------------------------------------------------------------------------
SocketClient::~SocketClient() noexcept = default;
//---------------------------------------------------------------------------
TLSContext& SocketClient::context()
// Get the tls context
{
    if (!_context)
        _context = make_unique<TLSContext>(_config.verifyPeer);
    return *_context;
}
//---------------------------------------------------------------------------
int SocketClient::connectAddress(const addrinfo& addr)
// Connect to one address
{
    auto fd = socket(addr.ai_family, addr.ai_socktype | SOCK_CLOEXEC, addr.ai_protocol);
    if (fd == -1)
        return -1;

    auto fail = [fd]() {
        auto error = errno;
        close(fd);
        errno = error;
        return -1;
    };

    // No blocking mode during the connect
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        return fail();

    auto connectRes = ::connect(fd, addr.ai_addr, addr.ai_addrlen);
    if (connectRes < 0 && errno != EINPROGRESS)
        return fail();

    if (connectRes < 0) {
        // connection check
        struct pollfd pollEvent;
        pollEvent.fd = fd;
        pollEvent.events = POLLOUT;
        pollEvent.revents = 0;

        int t;
        do {
            t = poll(&pollEvent, 1, static_cast<int>(_config.connectTimeout));
        } while (t < 0 && errno == EINTR);
        if (t == 0) {
            errno = ETIMEDOUT;
            return fail();
        }
        if (t < 0)
            return fail();

        int socketError;
        socklen_t socketErrorLen = sizeof(socketError);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &socketError, &socketErrorLen))
            return fail();
        if (socketError) {
            errno = socketError;
            return fail();
        }
    }

    // Blocking mode with timeouts for the exchange
    if (fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0)
        return fail();
    struct timeval tv;
    tv.tv_sec = _config.ioTimeout / 1000;
    tv.tv_usec = (_config.ioTimeout % 1000) * 1000;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&tv), sizeof tv))
        return fail();
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&tv), sizeof tv))
        return fail();
    int noDelay = 1;
    if (setsockopt(fd, SOL_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)))
        return fail();
    return fd;
}
//---------------------------------------------------------------------------
int SocketClient::connect(const Url& url)
// Creates a new socket connection
{
    int lastError = 0;
    for (auto attempt = 0u; attempt <= _config.connectRetries; attempt++) {
        bool oldAddress;
        auto addr = _resolver.resolve(url.host, url.port, oldAddress);
        for (auto it = addr; it; it = it->ai_next) {
            auto fd = connectAddress(*it);
            if (fd >= 0)
                return fd;
            lastError = errno;
        }
        cerr << "Connect to " << url.host << ":" << url.port << " failed (attempt " << attempt + 1 << "): " << strerror(lastError) << endl;
        // Resolve again, the cached addresses may be stale
        _resolver.invalidate(url.host, url.port);
    }
    throw runtime_error("Socket creation error! Could not connect to " + url.host + ": " + strerror(lastError));
}
//---------------------------------------------------------------------------
HttpResponse SocketClient::perform(const HttpRequest& request, string_view body, const ChunkCallback* onChunk)
// Performs the exchange
{
    auto url = Url::parse(request.url);

    // Complete the headers
    HttpRequest message = request;
    message.type = HttpRequest::Type::HTTP_1_1;
    message.headers.try_emplace("Host", url.hostHeader());
    message.headers.try_emplace("User-Agent", _config.userAgent);
    message.headers["Connection"] = "close";
    if (!body.empty() || request.method == HttpRequest::Method::PUT)
        message.headers["Content-Length"] = to_string(body.size());

    Connection connection(connect(url));
    if (url.tls)
        connection.startTLS(context(), url, _config.verifyPeer);

    connection.send(HttpRequest::serialize(message, url.target));
    if (!body.empty())
        connection.send(body);

    vector<char> chunk(_config.chunkSize);
    auto receive = [&connection, &chunk]() {
        auto length = connection.recv(chunk.data(), chunk.size());
        return string_view(chunk.data(), length);
    };

    // Read the header, skips interim responses
    string buffer;
    HttpHelper::Info info;
    while (true) {
        optional<uint64_t> headerEnd;
        while (!(headerEnd = HttpHelper::findHeaderEnd(buffer))) {
            if (buffer.size() > maxHeaderSize)
                throw runtime_error("Invalid HttpResponse: Header too large!");
            auto data = receive();
            if (data.empty())
                throw runtime_error("Recv error! Connection closed before the response header");
            buffer.append(data);
        }
        info = HttpHelper::detect(string_view(buffer).substr(0, *headerEnd), request.method == HttpRequest::Method::HEAD);
        if (info.response.status >= 100 && info.response.status < 200) {
            buffer.erase(0, info.headerLength);
            continue;
        }
        break;
    }

    auto response = move(info.response);
    auto forward = onChunk && response.success();
    auto deliver = [&response, forward, onChunk](string_view data) {
        if (data.empty())
            return;
        if (forward)
            (*onChunk)(data);
        else
            response.body.append(data);
    };

    auto rest = string_view(buffer).substr(info.headerLength);
    switch (info.encoding) {
        case HttpHelper::Encoding::None: break;
        case HttpHelper::Encoding::ContentLength: {
            auto remaining = info.length;
            auto take = [&remaining, &deliver](string_view data) {
                auto length = min<uint64_t>(remaining, data.size());
                deliver(data.substr(0, length));
                remaining -= length;
            };
            take(rest);
            while (remaining) {
                auto data = receive();
                if (data.empty())
                    throw runtime_error("Recv error! Connection closed before the response body was complete");
                take(data);
            }
            break;
        }
        case HttpHelper::Encoding::ChunkedEncoding: {
            HttpHelper::ChunkedDecoder decoder;
            auto finished = decoder.feed(rest, deliver);
            while (!finished) {
                auto data = receive();
                if (data.empty())
                    throw runtime_error("Recv error! Connection closed before the last chunk");
                finished = decoder.feed(data, deliver);
            }
            break;
        }
        case HttpHelper::Encoding::UntilClose: {
            deliver(rest);
            for (auto data = receive(); !data.empty(); data = receive())
                deliver(data);
            break;
        }
    }
    return response;
}
//---------------------------------------------------------------------------
HttpResponse SocketClient::request(const HttpRequest& request, string_view body)
// Performs the request and buffers the response
{
    return perform(request, body, nullptr);
}
//---------------------------------------------------------------------------
HttpResponse SocketClient::stream(const HttpRequest& request, const ChunkCallback& onChunk)
// Performs the request and forwards the body
{
    return perform(request, {}, &onChunk);
}
//---------------------------------------------------------------------------
} // namespace urlblob::network
