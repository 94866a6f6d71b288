#include "subscription_registry.H"

#include "common/errors.H"
#include "common/utils.H"

#include <spdlog/fmt/fmt.h>

namespace tws::client {

SubscriptionRegistry::SubscriptionRegistry(Correlator& correlator, cycle_requester request_cycle,
                                           std::shared_ptr<spdlog::logger> logger)
    : correlator(correlator), request_cycle(std::move(request_cycle)), logger(logger) {}

wire::request_id SubscriptionRegistry::subscribe(const wire::contract& instrument,
                                                 const subscription_options& options) {
    if (options.capacity < 1) {
        logger->error("Subscription buffer for {} needs room for at least one quote", instrument.symbol);
        throw tws_error("subscription capacity must be at least 1");
    }

    wire::market_data_request req;
    req.instrument = instrument;
    req.generic_ticks = options.generic_ticks;
    req.snapshot = false;

    std::lock_guard<std::mutex> replay_lock(replay_mutex);
    wire::request_id id = wire::NO_REQUEST_ID;
    try {
        // registered before the request leaves so the first tick finds it
        correlator.submit_batch({req}, REQUEST_KIND::STREAMING,
                                [&](std::vector<wire::request>& batch, const std::vector<wire::request_id>& ids) {
                                    id = ids.front();
                                    subscription sub;
                                    sub.request = std::get<wire::market_data_request>(batch.front());
                                    sub.capacity = options.capacity;
                                    sub.quote_limit = options.quote_limit;
                                    sub.state.ticker = instrument.local_symbol.empty() ? instrument.symbol
                                                                                        : instrument.local_symbol;
                                    sub.state.req_id = id;
                                    sub.state.tick = options.min_tick;

                                    std::lock_guard<std::mutex> lock(mutex);
                                    subscriptions[id] = std::move(sub);
                                    reconnect_every = options.reconnect_every;
                                });
    } catch (const tws_error&) {
        if (id != wire::NO_REQUEST_ID) {
            std::lock_guard<std::mutex> lock(mutex);
            subscriptions.erase(id);
        }
        throw;
    }

    logger->info("Subscribed {} as request {} (buffer {}, limit {}, reconnect every {})", instrument.symbol, id,
                 options.capacity, options.quote_limit, options.reconnect_every);
    return id;
}

std::vector<quote> SubscriptionRegistry::pop_all(wire::request_id id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = subscriptions.find(id);
    if (it == subscriptions.end()) {
        logger->error("No subscription {}", id);
        throw tws_error(fmt::format("no subscription {}", id));
    }
    std::vector<quote> out(it->second.buffer.begin(), it->second.buffer.end());
    it->second.buffer.clear();
    return out;
}

std::vector<quote> SubscriptionRegistry::unsubscribe(wire::request_id id) {
    std::vector<quote> remaining;
    bool stopped;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = subscriptions.find(id);
        if (it == subscriptions.end()) {
            logger->error("Cannot unsubscribe unknown subscription {}", id);
            throw tws_error(fmt::format("no subscription {}", id));
        }
        remaining.assign(it->second.buffer.begin(), it->second.buffer.end());
        stopped = it->second.stopped;
        subscriptions.erase(it);
    }

    if (!stopped) {
        stop_stream(id, false);
    }
    logger->info("Unsubscribed {} with {} unread quotes", id, remaining.size());
    return remaining;
}

void SubscriptionRegistry::stop_stream(wire::request_id id, bool deferred) {
    correlator.cancel(id);
    if (deferred) {
        correlator.post_untracked(wire::cancel_market_data_request{id});
        return;
    }
    try {
        correlator.send_untracked(wire::cancel_market_data_request{id});
    } catch (const connection_lost& e) {
        // the gateway forgets the stream with the session
        logger->warn("Market data cancel for {} not sent: {}", id, e.what());
    }
}

std::vector<wire::request> SubscriptionRegistry::resubscribe_requests() const {
    std::lock_guard<std::mutex> replay_lock(replay_mutex);
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<wire::request> out;
    for (const auto& [id, sub] : subscriptions) {
        if (!sub.stopped) {
            out.push_back(sub.request);
        }
    }
    return out;
}

void SubscriptionRegistry::on_stream_event(wire::request_id id, const wire::event& ev) {
    bool stop = false;
    bool cycle = false;
    uint64_t every = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = subscriptions.find(id);
        if (it == subscriptions.end()) {
            logger->debug("Dropping {} for closed subscription {}", wire::event_name(ev), id);
            return;
        }
        subscription& sub = it->second;

        if (auto* err = std::get_if<wire::error_message>(&ev)) {
            if (wire::is_warning_code(err->code)) {
                logger->info("Subscription {} ({}) notice {}: {}", id, sub.state.ticker, err->code, err->message);
            } else {
                logger->warn("Subscription {} ({}) error {}: {}", id, sub.state.ticker, err->code, err->message);
            }
            return;
        }
        if (sub.stopped || !apply_tick(sub.state, ev)) {
            return;
        }

        sub.state.arrival_time = walltime();
        if (sub.buffer.size() >= sub.capacity) {
            sub.buffer.pop_front();
            sub.evicted++;
        }
        sub.buffer.push_back(sub.state);
        sub.delivered++;

        if (sub.quote_limit > 0 && sub.delivered >= sub.quote_limit) {
            sub.stopped = true;
            stop = true;
        }
        every = reconnect_every;
        if (every > 0 && ++quote_counter >= every) {
            quote_counter = 0;
            cycle = true;
        }
    }

    if (stop) {
        logger->info("Subscription {} reached its quote limit", id);
        stop_stream(id, true);
    }
    if (cycle && request_cycle) {
        request_cycle(fmt::format("{} quotes received", every));
    }
}

bool SubscriptionRegistry::is_active(wire::request_id id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = subscriptions.find(id);
    return it != subscriptions.end() && !it->second.stopped;
}

size_t SubscriptionRegistry::buffered(wire::request_id id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = subscriptions.find(id);
    return it == subscriptions.end() ? 0 : it->second.buffer.size();
}

uint64_t SubscriptionRegistry::quotes_since_cycle() const {
    std::lock_guard<std::mutex> lock(mutex);
    return quote_counter;
}

} // namespace tws::client
