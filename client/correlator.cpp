#include "correlator.H"

#include "common/errors.H"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace tws::client {

Correlator::Correlator(conn::Transmitter& transmitter, std::shared_ptr<spdlog::logger> logger)
    : transmitter(transmitter), logger(logger) {}

void Correlator::seed(wire::request_id id) {
    wire::request_id current = next_id.load();
    while (id > current && !next_id.compare_exchange_weak(current, id)) {
    }
    if (id > current) {
        logger->info("Next request id raised to {}", id);
    }
}

bool Correlator::reserve(wire::request_id id) {
    wire::request_id current = next_id.load();
    while (id >= current) {
        if (next_id.compare_exchange_weak(current, id + 1)) {
            return true;
        }
    }
    return false;
}

std::vector<wire::request_id> Correlator::allocate_ids(size_t count) {
    std::lock_guard<std::mutex> lock(submit_mutex);
    wire::request_id first = next_id.fetch_add(static_cast<wire::request_id>(count));
    std::vector<wire::request_id> ids;
    for (size_t i = 0; i < count; i++) {
        ids.push_back(first + static_cast<wire::request_id>(i));
    }
    return ids;
}

wire::request_id Correlator::allocate(wire::request& req) {
    auto existing = wire::request_id_of(req);
    if (!existing) {
        return wire::NO_REQUEST_ID;
    }
    if (wire::is_channel(*existing)) {
        return *existing;
    }
    if (*existing > 0) {
        seed(*existing + 1);
        return *existing;
    }
    wire::request_id id = next_id.fetch_add(1);
    wire::assign_request_id(req, id);
    return id;
}

bool Correlator::track(wire::request_id id, const wire::request& req, REQUEST_KIND kind) {
    std::lock_guard<std::mutex> lock(pending_mutex);
    if (pending.count(id)) {
        return false;
    }

    pending_request entry;
    entry.kind = kind;
    entry.name = wire::request_name(req);
    entry.placement = std::holds_alternative<wire::place_order_request>(req);
    if (kind == REQUEST_KIND::ONESHOT) {
        entry.promise = std::make_shared<std::promise<response>>();
        entry.future = entry.promise->get_future().share();
    }
    pending.emplace(id, std::move(entry));
    forget_resolved(id);
    return true;
}

void Correlator::untrack(wire::request_id id) {
    std::lock_guard<std::mutex> lock(pending_mutex);
    pending.erase(id);
}

wire::request_id Correlator::submit(wire::request req, REQUEST_KIND kind) {
    std::lock_guard<std::mutex> lock(submit_mutex);

    wire::request_id id = allocate(req);
    bool tracked = id != wire::NO_REQUEST_ID && track(id, req, kind);
    if (wire::is_channel(id) && !tracked) {
        logger->error("A {} is already in flight", wire::request_name(req));
        throw tws_error(fmt::format("{} already in flight", wire::request_name(req)));
    }
    try {
        transmitter.send(req);
    } catch (const tws_error& e) {
        if (tracked) {
            untrack(id);
        }
        logger->error("Failed to submit {} {}: {}", wire::request_name(req), id, e.what());
        throw;
    }

    logger->debug("Submitted {} {}", wire::request_name(req), id);
    return id;
}

std::vector<wire::request_id> Correlator::submit_batch(std::vector<wire::request> reqs, REQUEST_KIND kind,
                                                       const batch_linker& link) {
    std::lock_guard<std::mutex> lock(submit_mutex);

    std::vector<wire::request_id> ids;
    ids.reserve(reqs.size());
    for (auto& req : reqs) {
        ids.push_back(allocate(req));
    }
    if (link) {
        link(reqs, ids);
    }

    std::vector<bool> tracked(reqs.size(), false);
    for (size_t i = 0; i < reqs.size(); i++) {
        tracked[i] = ids[i] != wire::NO_REQUEST_ID && track(ids[i], reqs[i], kind);
    }

    for (size_t i = 0; i < reqs.size(); i++) {
        try {
            transmitter.send(reqs[i]);
        } catch (const tws_error& e) {
            logger->error("Batch send failed at {} {}: {}", wire::request_name(reqs[i]), ids[i], e.what());
            for (size_t j = i; j < reqs.size(); j++) {
                if (tracked[j]) {
                    untrack(ids[j]);
                }
            }
            throw;
        }
    }

    logger->debug("Submitted batch of {} starting at {}", reqs.size(), ids.empty() ? 0 : ids.front());
    return ids;
}

void Correlator::send_untracked(const wire::request& req) {
    std::lock_guard<std::mutex> lock(submit_mutex);
    transmitter.send(req);
}

void Correlator::post_untracked(const wire::request& req) {
    logger->debug("Queueing {}", wire::request_name(req));
    transmitter.post(req);
}

response Correlator::await_once(wire::request_id id, std::chrono::milliseconds timeout) {
    std::shared_future<response> future;
    {
        std::lock_guard<std::mutex> lock(pending_mutex);
        auto it = pending.find(id);
        if (it != pending.end()) {
            if (it->second.kind != REQUEST_KIND::ONESHOT) {
                logger->error("Request {} is streaming and cannot be awaited", id);
                throw tws_error(fmt::format("request {} is streaming", id));
            }
            future = it->second.future;
        } else {
            auto done = resolved.find(id);
            if (done == resolved.end()) {
                logger->error("No pending request {} to await", id);
                throw tws_error(fmt::format("no pending request {}", id));
            }
            future = done->second;
        }
    }

    if (timeout.count() > 0 && future.wait_for(timeout) != std::future_status::ready) {
        {
            std::lock_guard<std::mutex> lock(pending_mutex);
            pending.erase(id);
            forget_resolved(id);
            retire(id);
        }
        logger->warn("Request {} timed out after {}ms", id, timeout.count());
        throw timeout_error(fmt::format("request {} timed out after {}ms", id, timeout.count()));
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex);
        forget_resolved(id);
    }
    return future.get();
}

bool Correlator::dispatch(const wire::event& ev) {
    auto id = wire::correlation_id(ev);
    if (!id) {
        return false;
    }

    StreamSink* sink = nullptr;
    {
        std::lock_guard<std::mutex> lock(pending_mutex);
        auto it = pending.find(*id);
        if (it == pending.end()) {
            // order statuses for untracked orders are the order manager's
            if (retired.count(*id) || wire::is_channel(*id) || std::holds_alternative<wire::order_status>(ev)) {
                logger->debug("Dropping {} for retired request {}", wire::event_name(ev), *id);
            } else {
                logger->warn("Dropping {} for unknown request {}", wire::event_name(ev), *id);
            }
            return false;
        }

        pending_request& entry = it->second;
        if (entry.kind == REQUEST_KIND::STREAMING) {
            sink = stream_sink;
        } else if (wire::is_terminal(ev, entry.placement)) {
            entry.promise->set_value(response{ev, std::move(entry.parts)});
            logger->debug("Resolved {} {} with {}", entry.name, *id, wire::event_name(ev));
            keep_resolved(*id, entry.future);
            pending.erase(it);
            retire(*id);
        } else {
            entry.parts.push_back(ev);
        }
    }

    if (sink) {
        sink->on_stream_event(*id, ev);
    }
    return true;
}

void Correlator::cancel(wire::request_id id) {
    std::lock_guard<std::mutex> lock(pending_mutex);
    auto it = pending.find(id);
    if (it != pending.end()) {
        if (it->second.kind == REQUEST_KIND::ONESHOT) {
            it->second.promise->set_exception(
                std::make_exception_ptr(tws_error(fmt::format("request {} cancelled", id))));
        }
        pending.erase(it);
    }
    forget_resolved(id);
    retire(id);
    logger->debug("Cancelled request {}", id);
}

void Correlator::fail_all(const std::string& reason) {
    std::lock_guard<std::mutex> lock(pending_mutex);
    size_t failed = 0;
    for (auto it = pending.begin(); it != pending.end();) {
        if (it->second.kind != REQUEST_KIND::ONESHOT) {
            ++it;
            continue;
        }
        it->second.promise->set_exception(std::make_exception_ptr(connection_lost(reason)));
        keep_resolved(it->first, it->second.future);
        retire(it->first);
        it = pending.erase(it);
        failed++;
    }
    if (failed > 0) {
        logger->warn("Failed {} outstanding requests: {}", failed, reason);
    }
}

void Correlator::keep_resolved(wire::request_id id, std::shared_future<response> future) {
    forget_resolved(id);
    resolved.emplace(id, std::move(future));
    resolved_order.push_back(id);
    while (resolved_order.size() > RESOLVED_LIMIT) {
        resolved.erase(resolved_order.front());
        resolved_order.pop_front();
    }
}

void Correlator::forget_resolved(wire::request_id id) {
    if (resolved.erase(id) > 0) {
        resolved_order.erase(std::find(resolved_order.begin(), resolved_order.end(), id));
    }
}

void Correlator::retire(wire::request_id id) {
    if (!retired.insert(id).second) {
        return;
    }
    retired_order.push_back(id);
    while (retired_order.size() > RETIRED_LIMIT) {
        retired.erase(retired_order.front());
        retired_order.pop_front();
    }
}

bool Correlator::is_pending(wire::request_id id) const {
    std::lock_guard<std::mutex> lock(pending_mutex);
    return pending.count(id) > 0;
}

size_t Correlator::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex);
    return pending.size();
}

size_t Correlator::resolved_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex);
    return resolved.size();
}

size_t Correlator::retired_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex);
    return retired.size();
}

} // namespace tws::client
