#include "order_manager.H"

#include "common/errors.H"
#include "common/utils.H"
#include "wire/wire_codec.H"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace tws::client {

namespace {

wire::ACTION opposite(wire::ACTION action) {
    return action == wire::ACTION::BUY ? wire::ACTION::SELL : wire::ACTION::BUY;
}

void price_child(wire::order_params& child, const std::string& type, double price) {
    child.order_type = type;
    child.limit_price.reset();
    child.aux_price.reset();
    if (type == "STP" || type == "MIT" || type == "TRAIL") {
        child.aux_price = price;
    } else if (type == "STP LMT" || type == "LIT") {
        child.aux_price = price;
        child.limit_price = price;
    } else if (type != "MKT") {
        child.limit_price = price;
    }
}

// keeps the family links of an existing order when its fields are replaced
void keep_links(wire::order_params& order, const order_record& record) {
    order.order_id = record.order_id;
    order.parent_id = record.parent_id;
    order.bracket.reset();
    if (record.parent_id != 0 || !record.children.empty()) {
        order.oca_group = record.params.oca_group;
        order.oca_type = record.params.oca_type;
        order.transmit = record.params.transmit;
    }
}

} // namespace

OrderManager::OrderManager(Correlator& correlator, std::shared_ptr<spdlog::logger> logger)
    : correlator(correlator), logger(logger) {}

std::vector<wire::order_params> OrderManager::build_family(const wire::order_params& order) const {
    std::vector<wire::order_params> family{order};
    wire::order_params& parent = family.front();
    parent.bracket.reset();
    if (!order.bracket) {
        return family;
    }

    const wire::bracket_spec& spec = *order.bracket;
    bool buy = order.action == wire::ACTION::BUY;
    double limit = *order.limit_price;
    double upper_delta = spec.upper_delta > 0 ? spec.upper_delta : spec.lower_delta;

    wire::order_params child;
    child.instrument = order.instrument;
    child.action = opposite(order.action);
    child.quantity = order.quantity;
    child.tif = order.tif;
    child.account = order.account;
    child.outside_rth = order.outside_rth;
    child.oca_group = order.oca_group;
    child.oca_type = 1;
    child.transmit = false;

    wire::order_params lower = child;
    price_child(lower, spec.lower_type.empty() ? (buy ? "STP" : "LMT") : spec.lower_type, limit - spec.lower_delta);

    wire::order_params upper = child;
    price_child(upper, spec.upper_type.empty() ? (buy ? "LMT" : "STP") : spec.upper_type, limit + upper_delta);
    // the last child releases the whole family
    upper.transmit = order.transmit;

    parent.transmit = false;
    family.push_back(lower);
    family.push_back(upper);
    return family;
}

void OrderManager::record_family(std::vector<wire::order_params>& family, const std::vector<wire::request_id>& ids,
                                 bool held) {
    uint64_t now = walltime();
    wire::request_id parent_id = ids.front();

    std::lock_guard<std::mutex> lock(mutex);
    for (size_t i = 0; i < family.size(); i++) {
        wire::order_params& params = family[i];
        params.order_id = ids[i];
        if (i > 0) {
            params.parent_id = parent_id;
            if (params.oca_group.empty()) {
                params.oca_group = fmt::format("bracket_{}", parent_id);
            }
        }

        order_record& record = records[ids[i]];
        record = order_record{};
        record.order_id = ids[i];
        record.parent_id = params.parent_id;
        record.params = params;
        record.held = held;
        record.state = held ? ORDER_STATE::CREATED : ORDER_STATE::PENDING_SUBMIT;
        record.remaining = params.quantity;
        record.created_time = now;
        record.updated_time = now;
    }
    records[parent_id].children.assign(ids.begin() + 1, ids.end());
}

wire::request_id OrderManager::submit(wire::order_params order, bool hold) {
    std::vector<wire::order_params> family;
    try {
        wire::validate_order(order);
        family = build_family(order);
        for (const auto& member : family) {
            wire::validate_order(member);
        }
    } catch (const encoding_error& e) {
        logger->error("Rejecting order for {}: {}", order.instrument.symbol, e.what());
        throw;
    }

    if (order.order_id > 0) {
        bool exists;
        {
            std::lock_guard<std::mutex> lock(mutex);
            exists = records.count(order.order_id) > 0;
        }
        if (exists) {
            return modify_existing(std::move(order), hold);
        }
        if (!correlator.reserve(order.order_id)) {
            logger->error("Order id {} is below the next valid id {}", order.order_id, correlator.peek_next_id());
            throw order_error(fmt::format("order id {} was already used", order.order_id));
        }
    }

    if (hold) {
        std::vector<wire::request_id> ids;
        if (order.order_id > 0) {
            ids.push_back(order.order_id);
            auto rest = correlator.allocate_ids(family.size() - 1);
            ids.insert(ids.end(), rest.begin(), rest.end());
        } else {
            ids = correlator.allocate_ids(family.size());
        }
        record_family(family, ids, true);
        logger->info("Holding order {} {} {} {} ({} orders)", ids.front(), wire::to_string(order.action),
                     order.quantity, order.instrument.symbol, family.size());
        return ids.front();
    }

    std::vector<wire::request> reqs;
    for (const auto& member : family) {
        reqs.push_back(wire::place_order_request{member});
    }

    std::vector<wire::request_id> family_ids;
    try {
        correlator.submit_batch(std::move(reqs), REQUEST_KIND::ONESHOT,
                                [&](std::vector<wire::request>& batch, const std::vector<wire::request_id>& ids) {
                                    family_ids = ids;
                                    record_family(family, ids, false);
                                    for (size_t i = 0; i < batch.size(); i++) {
                                        std::get<wire::place_order_request>(batch[i]).order = family[i];
                                    }
                                });
    } catch (const tws_error&) {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto id : family_ids) {
            records.erase(id);
        }
        throw;
    }

    const wire::order_params& parent = family.front();
    logger->info("Placed order {} {} {} {} {} @ {}", family_ids.front(), wire::to_string(parent.action),
                 parent.quantity, parent.instrument.symbol, parent.order_type,
                 parent.limit_price ? *parent.limit_price : 0.0);
    return family_ids.front();
}

wire::request_id OrderManager::modify_existing(wire::order_params order, bool hold) {
    wire::request_id id = order.order_id;
    bool held;
    {
        std::lock_guard<std::mutex> lock(mutex);
        order_record& record = records.at(id);
        if (is_terminal(record.state)) {
            logger->error("Order id {} is {} and cannot be reused", id, to_string(record.state));
            throw order_error(fmt::format("order {} is {}", id, to_string(record.state)));
        }

        keep_links(order, record);
        held = record.held;
        if (held) {
            record.params = order;
            record.remaining = order.quantity;
            record.updated_time = walltime();
            logger->info("Merged new fields into held order {}", id);
        }
    }

    if (held) {
        if (!hold) {
            transmit(id);
        }
        return id;
    }

    correlator.submit(wire::place_order_request{order}, REQUEST_KIND::ONESHOT);

    std::lock_guard<std::mutex> lock(mutex);
    order_record& record = records.at(id);
    record.params = order;
    record.remaining = std::max(0.0, order.quantity - record.filled);
    record.updated_time = walltime();
    logger->info("Modified live order {} in place", id);
    return id;
}

void OrderManager::transmit(wire::request_id order_id) {
    std::vector<wire::request> reqs;
    std::vector<wire::request_id> ids;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = records.find(order_id);
        if (it == records.end()) {
            logger->error("Cannot transmit unknown order {}", order_id);
            throw order_error(fmt::format("unknown order {}", order_id));
        }
        order_record& record = it->second;
        if (!record.held) {
            logger->error("Order {} is not held", order_id);
            throw order_error(fmt::format("order {} is not held", order_id));
        }
        if (record.parent_id != 0) {
            auto parent = records.find(record.parent_id);
            if (parent != records.end() && parent->second.held) {
                logger->error("Order {} belongs to held parent {}", order_id, record.parent_id);
                throw order_error(fmt::format("transmit parent order {} first", record.parent_id));
            }
        }

        ids.push_back(order_id);
        for (auto child : record.children) {
            auto c = records.find(child);
            if (c != records.end() && c->second.held) {
                ids.push_back(child);
            }
        }
        for (auto id : ids) {
            order_record& member = records.at(id);
            member.held = false;
            member.state = ORDER_STATE::PENDING_SUBMIT;
            member.updated_time = walltime();
            reqs.push_back(wire::place_order_request{member.params});
        }
    }

    try {
        correlator.submit_batch(std::move(reqs), REQUEST_KIND::ONESHOT);
    } catch (const tws_error&) {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto id : ids) {
            order_record& member = records.at(id);
            member.held = true;
            member.state = ORDER_STATE::CREATED;
        }
        throw;
    }
    logger->info("Transmitted held order {} ({} orders)", order_id, ids.size());
}

void OrderManager::update_held(wire::request_id order_id, wire::order_params order) {
    try {
        wire::validate_order(order);
    } catch (const encoding_error& e) {
        logger->error("Rejecting update of order {}: {}", order_id, e.what());
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex);
    auto it = records.find(order_id);
    if (it == records.end()) {
        logger->error("Cannot update unknown order {}", order_id);
        throw order_error(fmt::format("unknown order {}", order_id));
    }
    order_record& record = it->second;
    if (!record.held) {
        logger->error("Order {} is not held and cannot be updated locally", order_id);
        throw order_error(fmt::format("order {} is not held", order_id));
    }

    keep_links(order, record);
    record.params = order;
    record.remaining = order.quantity;
    record.updated_time = walltime();
    logger->info("Updated held order {}", order_id);
}

void OrderManager::cancel(wire::request_id order_id) {
    cancel_order(order_id, false);
}

void OrderManager::cancel_order(wire::request_id order_id, bool deferred) {
    ORDER_STATE previous;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = records.find(order_id);
        if (it == records.end()) {
            logger->error("Cannot cancel unknown order {}", order_id);
            throw order_error(fmt::format("unknown order {}", order_id));
        }
        order_record& record = it->second;
        if (is_terminal(record.state)) {
            logger->error("Cannot cancel order {}: already {}", order_id, to_string(record.state));
            throw order_error(fmt::format("order {} is already {}", order_id, to_string(record.state)));
        }
        if (record.state == ORDER_STATE::PENDING_CANCEL) {
            logger->info("Cancel already pending for order {}", order_id);
            return;
        }

        if (record.held) {
            size_t removed = 0;
            for (auto child : record.children) {
                auto c = records.find(child);
                if (c != records.end() && c->second.held) {
                    records.erase(c);
                    removed++;
                }
            }
            record.children.erase(std::remove_if(record.children.begin(), record.children.end(),
                                                 [this](wire::request_id child) { return !records.count(child); }),
                                  record.children.end());
            record.held = false;
            record.state = ORDER_STATE::CANCELLED;
            record.updated_time = walltime();
            logger->info("Cancelled held order {} locally, removed {} children", order_id, removed);
            return;
        }

        previous = record.state;
        record.state = ORDER_STATE::PENDING_CANCEL;
        record.updated_time = walltime();
    }

    if (deferred) {
        correlator.post_untracked(wire::cancel_order_request{order_id});
        logger->info("Cancel queued for order {}", order_id);
        return;
    }

    try {
        correlator.send_untracked(wire::cancel_order_request{order_id});
    } catch (const tws_error&) {
        std::lock_guard<std::mutex> lock(mutex);
        order_record& record = records.at(order_id);
        if (record.state == ORDER_STATE::PENDING_CANCEL) {
            record.state = previous;
        }
        throw;
    }
    logger->info("Cancel sent for order {}", order_id);
}

bool OrderManager::apply_status_event(const wire::event& ev) {
    std::vector<wire::request_id> to_cancel;
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (auto* status = std::get_if<wire::order_status>(&ev)) {
            known = apply_order_status(*status, to_cancel);
        } else if (auto* err = std::get_if<wire::error_message>(&ev)) {
            known = err->id >= 0 && apply_error(*err, to_cancel);
        } else if (auto* details = std::get_if<wire::execution_details>(&ev)) {
            known = apply_execution(details->exec);
        } else if (auto* open = std::get_if<wire::open_order>(&ev)) {
            known = apply_open_order(*open);
        }
    }

    // runs on the reader thread, which must not wait on the socket
    for (auto sibling : to_cancel) {
        try {
            cancel_order(sibling, true);
        } catch (const tws_error& e) {
            logger->warn("Could not cancel bracket sibling {}: {}", sibling, e.what());
        }
    }
    return known;
}

void OrderManager::move_to(order_record& record, ORDER_STATE next, std::vector<wire::request_id>& to_cancel) {
    if (progress_rank(next) < progress_rank(record.state)) {
        logger->warn("Ignoring regression of order {} from {} to {}", record.order_id, to_string(record.state),
                     to_string(next));
        return;
    }
    if (next == record.state) {
        return;
    }

    logger->info("Order {} {} -> {}", record.order_id, to_string(record.state), to_string(next));
    record.state = next;

    if ((next == ORDER_STATE::FILLED || next == ORDER_STATE::CANCELLED) && record.parent_id != 0) {
        auto parent = records.find(record.parent_id);
        if (parent == records.end()) {
            return;
        }
        for (auto sibling : parent->second.children) {
            if (sibling == record.order_id) {
                continue;
            }
            auto s = records.find(sibling);
            if (s != records.end() && !is_terminal(s->second.state)
                && s->second.state != ORDER_STATE::PENDING_CANCEL) {
                to_cancel.push_back(sibling);
            }
        }
    }
}

bool OrderManager::apply_order_status(const wire::order_status& status, std::vector<wire::request_id>& to_cancel) {
    auto it = records.find(status.order_id);
    if (it == records.end()) {
        return false;
    }
    order_record& record = it->second;
    if (is_terminal(record.state)) {
        logger->debug("Order {} already {}, ignoring status {}", record.order_id, to_string(record.state),
                      status.status);
        return true;
    }

    record.status = status.status;
    record.held = false;
    if (status.perm_id != 0) {
        record.perm_id = status.perm_id;
    }
    if (status.filled >= record.filled) {
        record.filled = status.filled;
        record.remaining = status.remaining;
        if (status.avg_fill_price > 0) {
            record.avg_fill_price = status.avg_fill_price;
        }
        if (status.last_fill_price > 0) {
            record.last_fill_price = status.last_fill_price;
        }
    } else {
        logger->warn("Order {} reported filled {} below known {}", record.order_id, status.filled, record.filled);
    }
    record.updated_time = walltime();

    auto next = state_from_status(status.status, record.filled, record.remaining);
    if (!next) {
        logger->warn("Unknown status '{}' for order {}", status.status, record.order_id);
        return true;
    }
    move_to(record, *next, to_cancel);
    return true;
}

bool OrderManager::apply_error(const wire::error_message& err, std::vector<wire::request_id>& to_cancel) {
    auto it = records.find(err.id);
    if (it == records.end()) {
        return false;
    }
    order_record& record = it->second;

    if (wire::is_warning_code(err.code)) {
        logger->info("Order {} notice {}: {}", err.id, err.code, err.message);
        return true;
    }
    if (is_terminal(record.state)) {
        logger->debug("Order {} already {}, ignoring error {}", err.id, to_string(record.state), err.code);
        return true;
    }

    record.error_code = err.code;
    record.error_text = err.message;
    record.updated_time = walltime();

    if (err.code == wire::ERR_ORDER_CANCELLED) {
        move_to(record, ORDER_STATE::CANCELLED, to_cancel);
    } else if (wire::is_rejection_code(err.code)) {
        logger->warn("Order {} rejected ({}): {}", err.id, err.code, err.message);
        move_to(record, ORDER_STATE::REJECTED, to_cancel);
    } else {
        logger->warn("Order {} error {}: {}", err.id, err.code, err.message);
    }
    return true;
}

bool OrderManager::apply_open_order(const wire::open_order& open) {
    auto it = records.find(open.order_id);
    if (it != records.end()) {
        if (open.perm_id != 0) {
            it->second.perm_id = open.perm_id;
        }
        return true;
    }
    if (open.order_id <= 0) {
        // placed outside the API; cannot be addressed by id
        logger->debug("Skipping open order with id {}", open.order_id);
        return false;
    }

    order_record record;
    record.order_id = open.order_id;
    record.params.order_id = open.order_id;
    record.params.instrument = open.instrument;
    record.params.order_type = open.order_type;
    record.params.quantity = open.quantity;
    record.params.limit_price = open.limit_price;
    record.params.aux_price = open.aux_price;
    record.params.oca_group = open.oca_group;
    record.params.account = open.account;
    record.params.open_close = open.open_close;
    record.params.order_ref = open.order_ref;
    if (auto action = wire::action_from_string(open.action)) {
        record.params.action = *action;
    } else {
        logger->warn("Open order {} has unknown action '{}'", open.order_id, open.action);
    }
    if (auto tif = wire::tif_from_string(open.tif)) {
        record.params.tif = *tif;
    }
    record.state = ORDER_STATE::PENDING_SUBMIT;
    record.remaining = open.quantity;
    record.perm_id = open.perm_id;
    record.created_time = walltime();
    record.updated_time = record.created_time;

    logger->info("Adopted open order {} ({} {} {})", open.order_id, open.action, open.quantity,
                 open.instrument.symbol);
    records.emplace(open.order_id, std::move(record));
    return true;
}

bool OrderManager::apply_execution(const wire::execution& exec) {
    auto it = records.find(exec.order_id);
    if (it == records.end()) {
        return false;
    }
    order_record& record = it->second;
    if (!record.exec_ids.insert(exec.exec_id).second) {
        logger->debug("Duplicate execution {} for order {}", exec.exec_id, exec.order_id);
        return true;
    }
    record.executions.push_back(exec);

    double shares = 0;
    double notional = 0;
    for (const auto& e : record.executions) {
        shares += e.shares;
        notional += e.shares * e.price;
    }
    double filled = shares;
    double avg = shares > 0 ? notional / shares : 0.0;
    if (exec.cum_qty >= filled && exec.avg_price > 0) {
        filled = exec.cum_qty;
        avg = exec.avg_price;
    }

    logger->info("Execution {} on order {}: {} @ {}", exec.exec_id, exec.order_id, exec.shares, exec.price);

    if (filled > record.filled) {
        record.filled = filled;
        record.avg_fill_price = avg;
        record.last_fill_price = exec.price;
        record.remaining = std::max(0.0, record.params.quantity - filled);
        record.updated_time = walltime();

        if (!is_terminal(record.state) && record.remaining > 0
            && progress_rank(record.state) < progress_rank(ORDER_STATE::PARTIALLY_FILLED)) {
            logger->info("Order {} {} -> {}", record.order_id, to_string(record.state),
                         to_string(ORDER_STATE::PARTIALLY_FILLED));
            record.state = ORDER_STATE::PARTIALLY_FILLED;
        }
    }
    return true;
}

std::optional<order_record> OrderManager::get(wire::request_id order_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = records.find(order_id);
    if (it == records.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<order_record> OrderManager::orders() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<order_record> out;
    out.reserve(records.size());
    for (const auto& [id, record] : records) {
        out.push_back(record);
    }
    return out;
}

std::vector<order_record> OrderManager::children(wire::request_id order_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<order_record> out;
    auto it = records.find(order_id);
    if (it == records.end()) {
        return out;
    }
    for (auto child : it->second.children) {
        auto c = records.find(child);
        if (c != records.end()) {
            out.push_back(c->second);
        }
    }
    return out;
}

} // namespace tws::client
