#include "http_connector/agent.hpp"

#include <algorithm>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <exception>

#include "http_connector/logging.hpp"
#include "http_connector/tls.hpp"

namespace http_connector {

    using boost::asio::redirect_error;
    using boost::asio::use_awaitable;

    void Agent::Lease::reset() noexcept {
        if (!socket_) return;
        auto socket = std::move(socket_);
        socket_.reset();

        if (auto agent = agent_.lock()) {
            agent->release(key_, std::move(socket), reusable_);
        } else {
            // Pool is gone, nobody can reuse this socket.
            socket->destroy();
        }
        agent_.reset();
    }

    Agent::Agent(executor_type ex, std::string host, std::uint16_t port,
                 AgentOptions options)
        : ex_(std::move(ex)),
          options_(std::move(options)),
          host_(std::move(host)),
          port_(port),
          max_sockets_(options_.max_sockets),
          max_free_sockets_(options_.max_free_sockets) {
        if (options_.tls) {
            ssl_ctx_.emplace(boost::asio::ssl::context::tls_client);
            configure_tls_context(*ssl_ctx_, *options_.tls);
        }
    }

    Agent::~Agent() { drain(); }

    Agent::socket_ptr Agent::create_socket() {
        std::optional<std::string> servername;
        bool verify_host = true;
        if (options_.tls) {
            servername = options_.tls->servername;
            verify_host = options_.tls->reject_unauthorized;
        }
        ++created_;
        return std::make_shared<Socket>(
            ex_, ssl_ctx_ ? &*ssl_ctx_ : nullptr, host_, port_,
            std::move(servername), verify_host);
    }

    std::optional<Agent::Lease> Agent::try_acquire(const std::string& key) {
        if (closed_) return std::nullopt;

        // Most recently freed first, matching the free list being a stack.
        auto free_it = free_sockets_.find(key);
        if (free_it != free_sockets_.end()) {
            auto& list = free_it->second;
            while (!list.empty()) {
                FreeEntry entry = std::move(list.back());
                list.pop_back();
                if (entry.timer) entry.timer->cancel();
                if (entry.socket->destroyed()) continue;
                entry.socket->cancel_idle_wait();

                ++reused_;
                sockets_[key].push_back(entry.socket);
                HTTP_CONNECTOR_LOG_DEBUG("reusing socket {} for {}",
                                         entry.socket->id(), key);
                if (list.empty()) free_sockets_.erase(free_it);
                return Lease(weak_from_this(), key, std::move(entry.socket),
                             true);
            }
            free_sockets_.erase(free_it);
        }

        auto& in_use = sockets_[key];
        if (in_use.size() >= max_sockets_) return std::nullopt;

        auto socket = create_socket();
        in_use.push_back(socket);
        HTTP_CONNECTOR_LOG_DEBUG("created socket {} for {}", socket->id(),
                                 key);
        return Lease(weak_from_this(), key, std::move(socket), false);
    }

    boost::asio::awaitable<Result<Agent::Lease>> Agent::acquire(
        std::string key, std::shared_ptr<Waiter> waiter) {
        // Keep the pool alive while this coroutine is suspended.
        auto self = shared_from_this();
        bool woken = false;

        for (;;) {
            if (closed_) {
                co_return Result<Lease>::err(Error::Code::PoolClosed,
                                             "connection pool is closed");
            }
            if (waiter && waiter->cancelled()) {
                // A wake-up aimed at this waiter must not be lost.
                if (woken) wake_one(key);
                co_return Result<Lease>::err(Error::Code::Aborted,
                                             "request aborted");
            }

            if (auto lease = try_acquire(key)) {
                co_return Result<Lease>::ok(std::move(*lease));
            }

            if (!waiter) waiter = std::make_shared<Waiter>(ex_);

            auto& queue = requests_[key];
            // A woken waiter lost its slot to a newer caller; keep its place.
            if (woken)
                queue.push_front(waiter);
            else
                queue.push_back(waiter);

            waiter->timer_.expires_at(clock_type::time_point::max());
            boost::system::error_code ec;
            co_await waiter->timer_.async_wait(
                redirect_error(use_awaitable, ec));
            woken = true;

            auto it = requests_.find(key);
            if (it != requests_.end()) {
                auto& q = it->second;
                q.erase(std::remove(q.begin(), q.end(), waiter), q.end());
                if (q.empty()) requests_.erase(it);
            }
        }
    }

    void Agent::wake_one(const std::string& key) {
        auto it = requests_.find(key);
        if (it == requests_.end()) return;

        auto& queue = it->second;
        while (!queue.empty()) {
            auto waiter = std::move(queue.front());
            queue.pop_front();
            if (!waiter || waiter->cancelled()) continue;
            waiter->timer_.cancel();
            break;
        }
        if (queue.empty()) requests_.erase(it);
    }

    void Agent::release(const std::string& key, socket_ptr socket,
                        bool reusable) noexcept {
        try {
            if (!remove_socket(socket, key)) {
                // Already detached, e.g. by drain().
                destroy_socket(socket);
                return;
            }

            if (reusable && !closed_ && !socket->destroyed() &&
                socket->is_open()) {
                on_free(key, std::move(socket));
            } else {
                destroy_socket(socket);
            }
            wake_one(key);
        } catch (const std::exception& e) {
            HTTP_CONNECTOR_LOG_WARN("failed to release socket for {}: {}",
                                    key, e.what());
            destroy_socket(socket);
        }
    }

    void Agent::on_free(const std::string& key, socket_ptr socket) {
        (void)key;
        destroy_socket(socket);
    }

    void Agent::destroy_socket(const socket_ptr& socket) noexcept {
        if (!socket || socket->destroyed()) return;
        HTTP_CONNECTOR_LOG_DEBUG("destroying socket {}", socket->id());
        ++destroyed_;
        socket->destroy();
    }

    bool Agent::remove_socket(const socket_ptr& socket,
                              const std::string& key) {
        bool found = false;

        if (auto it = sockets_.find(key); it != sockets_.end()) {
            auto& v = it->second;
            auto pos = std::find(v.begin(), v.end(), socket);
            if (pos != v.end()) {
                v.erase(pos);
                found = true;
            }
            if (v.empty()) sockets_.erase(it);
        }

        if (auto it = free_sockets_.find(key); it != free_sockets_.end()) {
            auto& list = it->second;
            auto pos = std::find_if(
                list.begin(), list.end(),
                [&](const FreeEntry& e) { return e.socket == socket; });
            if (pos != list.end()) {
                if (pos->timer) pos->timer->cancel();
                list.erase(pos);
                found = true;
            }
            if (list.empty()) free_sockets_.erase(it);
        }

        return found;
    }

    void Agent::drain() noexcept {
        closed_ = true;
        max_sockets_ = 0;
        max_free_sockets_ = 0;

        // Queued acquires wake up, see closed_ and fail with PoolClosed.
        auto requests = std::move(requests_);
        requests_.clear();
        for (auto& [key, queue] : requests) {
            (void)key;
            for (auto& waiter : queue) {
                if (waiter) waiter->timer_.cancel();
            }
        }

        std::vector<std::pair<std::string, socket_ptr>> all;
        for (const auto& [key, v] : sockets_) {
            for (const auto& s : v) all.emplace_back(key, s);
        }
        for (const auto& [key, list] : free_sockets_) {
            for (const auto& e : list) {
                if (e.timer) e.timer->cancel();
                all.emplace_back(key, e.socket);
            }
        }

        for (auto& [key, socket] : all) {
            try {
                remove_socket(socket, key);
            } catch (const std::exception& e) {
                HTTP_CONNECTOR_LOG_WARN("failed to detach socket {}: {}",
                                        socket->id(), e.what());
            }
            destroy_socket(socket);
        }

        if (!all.empty()) {
            HTTP_CONNECTOR_LOG_DEBUG("drained {} sockets to {}:{}",
                                     all.size(), host_, port_);
        }
    }

    std::vector<Agent::socket_ptr> Agent::sockets(
        const std::string& key) const {
        auto it = sockets_.find(key);
        if (it == sockets_.end()) return {};
        return it->second;
    }

    std::vector<Agent::socket_ptr> Agent::free_sockets(
        const std::string& key) const {
        std::vector<socket_ptr> out;
        auto it = free_sockets_.find(key);
        if (it == free_sockets_.end()) return out;
        out.reserve(it->second.size());
        for (const auto& e : it->second) out.push_back(e.socket);
        return out;
    }

    Agent::Stats Agent::stats() const {
        Stats s;
        s.created = created_;
        s.reused = reused_;
        s.destroyed = destroyed_;
        for (const auto& [k, v] : sockets_) s.in_use += v.size();
        for (const auto& [k, v] : free_sockets_) s.free += v.size();
        for (const auto& [k, v] : requests_) s.queued += v.size();
        return s;
    }

    void KeepAliveAgent::on_free(const std::string& key, socket_ptr socket) {
        auto& list = free_sockets_[key];
        if (list.size() >= max_free_sockets_) {
            if (list.empty()) free_sockets_.erase(key);
            destroy_socket(socket);
            return;
        }

        auto timer = std::make_shared<boost::asio::steady_timer>(ex_);
        timer->expires_after(options_.free_socket_timeout);

        std::weak_ptr<Agent> weak = weak_from_this();
        const boost::asio::steady_timer* raw = timer.get();
        timer->async_wait([weak, key, raw](boost::system::error_code ec) {
            if (ec) return;
            if (auto self = weak.lock()) {
                static_cast<KeepAliveAgent&>(*self).expire_free_socket(key,
                                                                       raw);
            }
        });

        std::weak_ptr<boost::asio::steady_timer> token = timer;
        socket->async_wait_idle(
            [weak, key, token](boost::system::error_code ec) {
                if (ec == boost::asio::error::operation_aborted) return;
                auto self = weak.lock();
                auto entry_timer = token.lock();
                if (!self || !entry_timer) return;
                HTTP_CONNECTOR_LOG_DEBUG("idle socket for {} closed by peer",
                                         key);
                static_cast<KeepAliveAgent&>(*self).expire_free_socket(
                    key, entry_timer.get());
            });

        HTTP_CONNECTOR_LOG_DEBUG("socket {} freed for {}", socket->id(), key);
        list.push_back(FreeEntry{std::move(socket), clock_type::now(),
                                 std::move(timer)});
    }

    void KeepAliveAgent::expire_free_socket(
        const std::string& key,
        const boost::asio::steady_timer* timer) noexcept {
        auto it = free_sockets_.find(key);
        if (it == free_sockets_.end()) return;

        auto& list = it->second;
        auto pos = std::find_if(
            list.begin(), list.end(),
            [timer](const FreeEntry& e) { return e.timer.get() == timer; });
        if (pos == list.end()) return;

        auto victim = std::move(pos->socket);
        list.erase(pos);
        if (list.empty()) free_sockets_.erase(it);

        HTTP_CONNECTOR_LOG_TRACE("idle socket {} expired", victim->id());
        destroy_socket(victim);
    }

}  // namespace http_connector
