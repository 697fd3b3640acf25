#pragma once

#include <utility>  // before Boost.Asio: its awaitable.hpp uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "result.hpp"
#include "socket.hpp"

namespace http_connector {

    /**
     * Socket pool for one host, in the style of an http.Agent.
     *
     * SAFETY:
     * - Not thread-safe. Every call, and every Lease destruction, must run
     *   on the single event loop that owns the executor.
     *
     * INVARIANTS:
     * 1. A socket is in at most one of sockets_ (in use) or free_sockets_.
     * 2. sockets_[key].size() <= max_sockets() whenever a socket is handed
     *    out.
     * 3. Once drained, nothing is ever added to sockets_ or free_sockets_.
     *
     * LIFECYCLE:
     * 1. Construction: limits copied from AgentOptions.
     * 2. Operation: acquire()/try_acquire() and Lease release.
     * 3. drain(): limits set to zero, waiters woken with PoolClosed, every
     *    socket detached and destroyed. Never reopened.
     *
     * The base Agent destroys a socket as soon as its request finishes.
     * KeepAliveAgent parks reusable sockets in the free list instead.
     */
    class Agent : public std::enable_shared_from_this<Agent> {
       public:
        using executor_type = boost::asio::any_io_executor;
        using clock_type = std::chrono::steady_clock;
        using socket_ptr = std::shared_ptr<Socket>;

        /// @brief Queue entry for a request waiting on capacity.
        class Waiter {
           public:
            explicit Waiter(const executor_type& ex) : timer_(ex) {}

            /// @brief Stop waiting; acquire() returns Aborted.
            void cancel() noexcept {
                cancelled_ = true;
                timer_.cancel();
            }

            bool cancelled() const noexcept { return cancelled_; }

           private:
            friend class Agent;
            boost::asio::steady_timer timer_;
            bool cancelled_{false};
        };

        class Lease {
           public:
            Lease() = default;
            ~Lease() { reset(); }

            Lease(const Lease&) = delete;
            Lease& operator=(const Lease&) = delete;

            Lease(Lease&& other) noexcept
                : agent_(std::move(other.agent_)),
                  key_(std::move(other.key_)),
                  socket_(std::move(other.socket_)),
                  reused_(other.reused_),
                  reusable_(std::exchange(other.reusable_, true)) {}

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    agent_ = std::move(other.agent_);
                    key_ = std::move(other.key_);
                    socket_ = std::move(other.socket_);
                    reused_ = other.reused_;
                    reusable_ = std::exchange(other.reusable_, true);
                }
                return *this;
            }

            Socket* operator->() const noexcept { return socket_.get(); }
            Socket& operator*() const noexcept { return *socket_; }
            socket_ptr get() const noexcept { return socket_; }

            explicit operator bool() const noexcept {
                return static_cast<bool>(socket_);
            }

            /// @brief The socket must not go back to the free list.
            void mark_bad() noexcept { reusable_ = false; }

            /// @brief True when the socket came from the free list.
            bool reused() const noexcept { return reused_; }

            const std::string& key() const noexcept { return key_; }

            /// @brief Hand the socket back to the pool now.
            void reset() noexcept;

           private:
            friend class Agent;

            Lease(std::weak_ptr<Agent> agent, std::string key,
                  socket_ptr socket, bool reused) noexcept
                : agent_(std::move(agent)),
                  key_(std::move(key)),
                  socket_(std::move(socket)),
                  reused_(reused) {}

            std::weak_ptr<Agent> agent_;
            std::string key_;
            socket_ptr socket_;
            bool reused_{false};
            bool reusable_{true};
        };

        struct Stats {
            std::uint64_t created = 0;    ///< Sockets opened
            std::uint64_t reused = 0;     ///< Handed out from the free list
            std::uint64_t destroyed = 0;  ///< Sockets force-closed
            std::size_t in_use = 0;
            std::size_t free = 0;
            std::size_t queued = 0;
        };

        /**
         * @param ex Executor every socket and timer runs on.
         * @param host Host name sockets connect to.
         * @param port Port sockets connect to.
         * @param options Limits; a set tls member makes every socket TLS.
         * @throws boost::system::system_error if the TLS options are
         * rejected by OpenSSL.
         */
        Agent(executor_type ex, std::string host, std::uint16_t port,
              AgentOptions options);

        Agent(const Agent&) = delete;
        Agent& operator=(const Agent&) = delete;

        virtual ~Agent();

        /// @brief True for pools that reuse idle sockets.
        virtual bool keep_alive() const noexcept { return false; }

        /// @brief Take a free socket or open a new one; nullopt at capacity
        /// or after drain().
        std::optional<Lease> try_acquire(const std::string& key);

        /**
         * @brief Acquire a socket, queueing behind max_sockets when needed.
         * @param waiter Optional queue entry the caller can cancel().
         * @return Lease, or PoolClosed after drain(), or Aborted when the
         * waiter was cancelled.
         */
        boost::asio::awaitable<Result<Lease>> acquire(
            std::string key, std::shared_ptr<Waiter> waiter = {});

        /// @brief Tear the pool down. See class comment. Idempotent.
        void drain() noexcept;

        /// @brief Detach a socket from the bookkeeping of key without
        /// closing it.
        /// @return false when the socket was not tracked under key.
        bool remove_socket(const socket_ptr& socket, const std::string& key);

        bool closed() const noexcept { return closed_; }
        std::size_t max_sockets() const noexcept { return max_sockets_; }
        std::size_t max_free_sockets() const noexcept {
            return max_free_sockets_;
        }

        const AgentOptions& options() const noexcept { return options_; }
        executor_type get_executor() const noexcept { return ex_; }

        /// @brief In-use sockets for key.
        std::vector<socket_ptr> sockets(const std::string& key) const;

        /// @brief Idle sockets for key, oldest first.
        std::vector<socket_ptr> free_sockets(const std::string& key) const;

        Stats stats() const;

       protected:
        /// @brief A lease returned a socket that may be reused.
        virtual void on_free(const std::string& key, socket_ptr socket);

        /// @brief Close a socket the pool no longer tracks.
        void destroy_socket(const socket_ptr& socket) noexcept;

        struct FreeEntry {
            socket_ptr socket;
            clock_type::time_point since;
            std::shared_ptr<boost::asio::steady_timer> timer;
        };

        executor_type ex_;
        AgentOptions options_;
        std::string host_;
        std::uint16_t port_;
        std::optional<boost::asio::ssl::context> ssl_ctx_;

        std::map<std::string, std::vector<socket_ptr>> sockets_;
        std::map<std::string, std::deque<FreeEntry>> free_sockets_;
        std::map<std::string, std::deque<std::shared_ptr<Waiter>>> requests_;

        std::size_t max_sockets_;
        std::size_t max_free_sockets_;
        bool closed_{false};

        std::uint64_t created_{0};
        std::uint64_t reused_{0};
        std::uint64_t destroyed_{0};

       private:
        void release(const std::string& key, socket_ptr socket,
                     bool reusable) noexcept;
        socket_ptr create_socket();
        void wake_one(const std::string& key);
    };

    /**
     * @brief Agent that keeps finished sockets open for reuse, up to
     * max_free_sockets per key, each for at most free_socket_timeout.
     *
     * A parked socket is also watched for readability; the peer closing
     * an idle connection removes it from the free list at once.
     */
    class KeepAliveAgent : public Agent {
       public:
        using Agent::Agent;

        bool keep_alive() const noexcept override { return true; }

       protected:
        void on_free(const std::string& key, socket_ptr socket) override;

       private:
        /// @brief Idle timer fired or the peer hung up; timer identifies
        /// the free-list entry.
        void expire_free_socket(
            const std::string& key,
            const boost::asio::steady_timer* timer) noexcept;
    };

}  // namespace http_connector
