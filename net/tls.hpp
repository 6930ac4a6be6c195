#pragma once

#include "fd_wait.hpp"
#include "tcp_stream.hpp"
#include "worker.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <cerrno>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace convgate::net {

namespace detail {

    struct ssl_ctx_deleter {
        void operator()(SSL_CTX* ctx) const noexcept
        {
            if (ctx)
                SSL_CTX_free(ctx);
        }
    };

    inline void ensure_global_init()
    {
        static std::once_flag once;
        std::call_once(once, [] { OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS, nullptr); });
    }

    /**
     * @brief Drain the OpenSSL error queue into a string.
     */
    inline std::string collect_errors()
    {
        BIO* bio = BIO_new(BIO_s_mem());
        if (!bio)
            return "unknown";
        ERR_print_errors(bio);
        BUF_MEM* mem = nullptr;
        BIO_get_mem_ptr(bio, &mem);
        std::string out = (mem && mem->data) ? std::string(mem->data, mem->length) : std::string {};
        BIO_free(bio);
        return out;
    }

    /**
     * @brief Map an SSL_get_error code to a negative errno.
     */
    inline int translate_failure(int ssl_err, int saved_errno)
    {
        switch (ssl_err) {
        case SSL_ERROR_SYSCALL:
            return (saved_errno != 0) ? -saved_errno : -EIO;
        case SSL_ERROR_SSL:
            return -EPROTO;
        case SSL_ERROR_ZERO_RETURN:
            return -ECONNRESET;
        default:
            return -EIO;
        }
    }

} // namespace detail

/**
 * @brief Client TLS context. Shared by every upstream connection.
 */
class tls_context {
public:
    tls_context() = default;

    explicit tls_context(std::shared_ptr<SSL_CTX> ctx, bool verify_peer)
        : _ctx(std::move(ctx)), _verify_peer(verify_peer)
    {
    }

    SSL_CTX* native_handle() const noexcept { return _ctx.get(); }
    bool     valid() const noexcept { return static_cast<bool>(_ctx); }
    bool     verify_peer() const noexcept { return _verify_peer; }

    /**
     * @brief Build a client context; @p verify_peer loads the system trust store.
     * @throws std::runtime_error when OpenSSL cannot create the context.
     */
    static tls_context make_client(bool verify_peer)
    {
        detail::ensure_global_init();
        SSL_CTX* raw = SSL_CTX_new(TLS_client_method());
        if (!raw)
            throw std::runtime_error("SSL_CTX_new failed: " + detail::collect_errors());
        std::shared_ptr<SSL_CTX> ctx(raw, detail::ssl_ctx_deleter {});
        SSL_CTX_set_options(raw, SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3 | SSL_OP_NO_COMPRESSION);
        SSL_CTX_set_min_proto_version(raw, TLS1_2_VERSION);
        if (verify_peer) {
            SSL_CTX_set_verify(raw, SSL_VERIFY_PEER, nullptr);
            if (SSL_CTX_set_default_verify_paths(raw) != 1)
                throw std::runtime_error("failed to load default CA paths: " + detail::collect_errors());
        } else {
            SSL_CTX_set_verify(raw, SSL_VERIFY_NONE, nullptr);
        }
        static const unsigned char alpn[] = { 8, 'h', 't', 't', 'p', '/', '1', '.', '1' };
        SSL_CTX_set_alpn_protos(raw, alpn, sizeof(alpn));
        return tls_context { std::move(ctx), verify_peer };
    }

private:
    std::shared_ptr<SSL_CTX> _ctx;
    bool                     _verify_peer { true };
};

/**
 * @brief TLS client stream over an owned tcp_stream. The socket stays non-blocking; WANT_READ
 * and WANT_WRITE park the coroutine on the reactor.
 */
template <lockable Lock> class tls_stream {
public:
    using task_int   = Task<int, Work_Promise<Lock, int>>;
    using task_ssize = Task<ssize_t, Work_Promise<Lock, ssize_t>>;

    tls_stream(tcp_stream<Lock>&& transport, const tls_context& ctx, const std::string& server_name)
        : _transport(std::move(transport)), _ssl(nullptr, &SSL_free)
    {
        detail::ensure_global_init();
        _ssl.reset(SSL_new(ctx.native_handle()));
        if (!_ssl)
            throw std::runtime_error("SSL_new failed: " + detail::collect_errors());
        SSL_set_mode(_ssl.get(), SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
        if (!server_name.empty()) {
            SSL_set_tlsext_host_name(_ssl.get(), server_name.c_str());
            if (ctx.verify_peer())
                SSL_set1_host(_ssl.get(), server_name.c_str());
        }
        SSL_set_fd(_ssl.get(), _transport.native_handle());
    }

    tls_stream(const tls_stream&)            = delete;
    tls_stream& operator=(const tls_stream&) = delete;

    ~tls_stream() { close(); }

    void close()
    {
        if (_ssl) {
            if (_handshake_done)
                SSL_shutdown(_ssl.get());
            _ssl.reset();
        }
        _transport.close();
        _handshake_done = false;
    }

    bool handshake_done() const noexcept { return _handshake_done; }

    task_int handshake()
    {
        for (;;) {
            if (!_ssl)
                co_return -EBADF;
            ERR_clear_error();
            int rc = SSL_connect(_ssl.get());
            if (rc == 1) {
                _handshake_done = true;
                co_return 0;
            }
            int saved = errno;
            int err   = SSL_get_error(_ssl.get(), rc);
            if (err == SSL_ERROR_WANT_READ) {
                co_await fd_wait_read(_transport.reactor(), _transport.native_handle());
            } else if (err == SSL_ERROR_WANT_WRITE) {
                co_await fd_wait_write(_transport.reactor(), _transport.native_handle());
            } else {
                CONVGATE_LOG_WARN("[tls] handshake failed: %s", detail::collect_errors().c_str());
                co_return detail::translate_failure(err, saved);
            }
        }
    }

    // 0 means the peer closed the TLS session.
    task_ssize recv(void* buf, size_t len)
    {
        for (;;) {
            if (!_ssl)
                co_return -EBADF;
            ERR_clear_error();
            size_t got = 0;
            int    rc  = SSL_read_ex(_ssl.get(), buf, len, &got);
            if (rc == 1)
                co_return static_cast<ssize_t>(got);
            int saved = errno;
            int err   = SSL_get_error(_ssl.get(), rc);
            if (err == SSL_ERROR_ZERO_RETURN)
                co_return 0;
            if (err == SSL_ERROR_SYSCALL && saved == 0)
                co_return 0; // unexpected EOF, treated as close
            if (err == SSL_ERROR_WANT_READ) {
                co_await fd_wait_read(_transport.reactor(), _transport.native_handle());
            } else if (err == SSL_ERROR_WANT_WRITE) {
                co_await fd_wait_write(_transport.reactor(), _transport.native_handle());
            } else {
                co_return detail::translate_failure(err, saved);
            }
        }
    }

    task_ssize send_all(const void* buf, size_t len)
    {
        auto*  p    = static_cast<const char*>(buf);
        size_t sent = 0;
        while (sent < len) {
            if (!_ssl)
                co_return -EBADF;
            ERR_clear_error();
            size_t wrote = 0;
            int    rc    = SSL_write_ex(_ssl.get(), p + sent, len - sent, &wrote);
            if (rc == 1) {
                sent += wrote;
                continue;
            }
            int saved = errno;
            int err   = SSL_get_error(_ssl.get(), rc);
            if (err == SSL_ERROR_WANT_READ) {
                co_await fd_wait_read(_transport.reactor(), _transport.native_handle());
            } else if (err == SSL_ERROR_WANT_WRITE) {
                co_await fd_wait_write(_transport.reactor(), _transport.native_handle());
            } else {
                co_return detail::translate_failure(err, saved);
            }
        }
        co_return static_cast<ssize_t>(sent);
    }

private:
    tcp_stream<Lock>                       _transport;
    std::unique_ptr<SSL, decltype(&SSL_free)> _ssl;
    bool                                   _handshake_done { false };
};

} // namespace convgate::net
