#include "tws_client.H"

#include "common/errors.H"
#include "common/utils.H"

#include <spdlog/fmt/fmt.h>

namespace tws::client {

TwsClient::TwsClient(client_config config, std::shared_ptr<spdlog::logger> logger)
    : config(config),
      logger(logger),
      connection(config.connection, *this, logger),
      correlator(connection, logger),
      order_manager(correlator, logger),
      registry(correlator, [this](const std::string& reason) { connection.request_cycle(reason); }, logger),
      handlers(logger) {
    correlator.set_stream_sink(&registry);
}

TwsClient::~TwsClient() {
    // the reader thread calls back into the members below
    connection.disconnect();
}

conn::connection_info TwsClient::connect() {
    conn::connection_info info = connection.connect();
    correlator.seed(info.next_valid_id);
    logger->info("Client {} ready on {}:{}, server version {}, accounts {}", config.connection.client_id,
                 config.connection.host, config.connection.port, info.server_version, info.accounts);
    return info;
}

void TwsClient::disconnect() {
    bool was_connected = connection.state() != conn::CONNECTION_STATE::DISCONNECTED;
    connection.disconnect();
    correlator.fail_all("disconnected by client");
    if (was_connected) {
        handlers.publish(wire::connection_closed{"disconnected by client"});
    }
}

wire::request_id TwsClient::place_order(const wire::order_params& order, bool hold) {
    return order_manager.submit(order, hold);
}

void TwsClient::transmit(wire::request_id order_id) {
    order_manager.transmit(order_id);
}

void TwsClient::update_held(wire::request_id order_id, const wire::order_params& order) {
    order_manager.update_held(order_id, order);
}

void TwsClient::cancel(wire::request_id order_id) {
    order_manager.cancel(order_id);
}

void TwsClient::global_cancel() {
    logger->info("Requesting global cancel");
    correlator.send_untracked(wire::global_cancel_request{});
}

response TwsClient::await_once(wire::request_id id) {
    return correlator.await_once(id, config.request_timeout);
}

response TwsClient::await_once(wire::request_id id, std::chrono::milliseconds timeout) {
    return correlator.await_once(id, timeout);
}

wire::request_id TwsClient::subscribe(const wire::contract& instrument) {
    subscription_options options;
    options.capacity = config.quotes_buffer_size;
    options.reconnect_every = config.reconnect_every;
    return subscribe(instrument, options);
}

wire::request_id TwsClient::subscribe(const wire::contract& instrument, const subscription_options& options) {
    // a subscription registered mid-reconnect could be replayed and then erased
    conn::CONNECTION_STATE current = connection.state();
    if (current != conn::CONNECTION_STATE::CONNECTED) {
        logger->error("Cannot subscribe {} while {}", instrument.symbol, conn::to_string(current));
        throw connection_lost(fmt::format("cannot subscribe {} while {}", instrument.symbol,
                                          conn::to_string(current)));
    }
    return registry.subscribe(instrument, options);
}

quote TwsClient::query_quote(const wire::contract& instrument) {
    return query_quote(instrument, config.request_timeout);
}

quote TwsClient::query_quote(const wire::contract& instrument, std::chrono::milliseconds timeout) {
    wire::market_data_request req;
    req.instrument = instrument;
    req.snapshot = true;

    wire::request_id id = correlator.submit(req, REQUEST_KIND::ONESHOT);
    response res = correlator.await_once(id, timeout);
    if (auto* err = std::get_if<wire::error_message>(&res.terminal)) {
        logger->error("Quote query for {} failed with {}: {}", instrument.symbol, err->code, err->message);
        throw tws_error(fmt::format("quote query for {} failed ({}): {}", instrument.symbol, err->code,
                                    err->message));
    }

    quote q;
    q.ticker = instrument.local_symbol.empty() ? instrument.symbol : instrument.local_symbol;
    q.req_id = id;
    for (const auto& part : res.parts) {
        apply_tick(q, part);
    }
    q.arrival_time = walltime();
    return q;
}

std::vector<wire::execution> TwsClient::request_executions(const wire::execution_filter& filter) {
    return request_executions(filter, config.request_timeout);
}

std::vector<wire::execution> TwsClient::request_executions(const wire::execution_filter& filter,
                                                           std::chrono::milliseconds timeout) {
    wire::executions_request req;
    req.filter = filter;

    wire::request_id id = correlator.submit(req, REQUEST_KIND::ONESHOT);
    response res = correlator.await_once(id, timeout);
    if (auto* err = std::get_if<wire::error_message>(&res.terminal)) {
        logger->error("Execution query {} failed with {}: {}", id, err->code, err->message);
        throw tws_error(fmt::format("execution query failed ({}): {}", err->code, err->message));
    }

    std::vector<wire::execution> out;
    for (const auto& part : res.parts) {
        if (auto* details = std::get_if<wire::execution_details>(&part)) {
            out.push_back(details->exec);
        }
    }
    logger->info("Execution query {} returned {} rows", id, out.size());
    return out;
}

std::vector<wire::open_order> TwsClient::open_orders() {
    return open_orders(config.request_timeout);
}

std::vector<wire::open_order> TwsClient::open_orders(std::chrono::milliseconds timeout) {
    wire::request_id id = correlator.submit(wire::open_orders_request{}, REQUEST_KIND::ONESHOT);
    response res = correlator.await_once(id, timeout);
    if (auto* err = std::get_if<wire::error_message>(&res.terminal)) {
        logger->error("Open orders query failed with {}: {}", err->code, err->message);
        throw tws_error(fmt::format("open orders query failed ({}): {}", err->code, err->message));
    }

    std::vector<wire::open_order> out;
    for (const auto& part : res.parts) {
        if (auto* open = std::get_if<wire::open_order>(&part)) {
            out.push_back(*open);
        }
    }
    logger->info("Open orders query returned {} orders", out.size());
    return out;
}

account_snapshot TwsClient::request_account(const std::string& account) {
    return request_account(account, config.request_timeout);
}

account_snapshot TwsClient::request_account(const std::string& account, std::chrono::milliseconds timeout) {
    wire::account_updates_request req;
    req.subscribe = true;
    req.account = account;

    wire::request_id id = correlator.submit(req, REQUEST_KIND::ONESHOT);
    response res;
    try {
        res = correlator.await_once(id, timeout);
    } catch (const timeout_error&) {
        stop_account_updates(account);
        throw;
    }
    stop_account_updates(account);

    if (auto* err = std::get_if<wire::error_message>(&res.terminal)) {
        logger->error("Account download for {} failed with {}: {}", account, err->code, err->message);
        throw tws_error(fmt::format("account download for {} failed ({}): {}", account, err->code,
                                    err->message));
    }

    account_snapshot snap = fold_account(account, res.parts);
    logger->info("Account {} downloaded: {} values, {} positions", snap.account, snap.values.size(),
                 snap.positions.size());
    return snap;
}

void TwsClient::stop_account_updates(const std::string& account) {
    wire::account_updates_request stop;
    stop.subscribe = false;
    stop.account = account;
    try {
        correlator.send_untracked(stop);
    } catch (const connection_lost& e) {
        logger->warn("Account update stop for {} not sent: {}", account, e.what());
    }
}

void TwsClient::on_event(const wire::event& ev) {
    if (auto* next = std::get_if<wire::next_valid_id>(&ev)) {
        correlator.seed(next->order_id);
    }
    order_manager.apply_status_event(ev);
    correlator.dispatch(ev);
    handlers.publish(ev);
}

void TwsClient::on_connection_lost(const std::string& reason) {
    logger->warn("Session lost: {}", reason);
    correlator.fail_all(reason);
    handlers.publish(wire::connection_closed{reason});
}

std::vector<wire::request> TwsClient::resubscribe_requests() {
    return registry.resubscribe_requests();
}

void TwsClient::on_reconnected(const conn::connection_info& info) {
    correlator.seed(info.next_valid_id);
    logger->info("Session restored, next valid id {}", info.next_valid_id);
    handlers.publish(wire::connection_restored{info.next_valid_id});
}

void TwsClient::on_reconnect_failed(const std::string& reason) {
    logger->error("Gave up reconnecting: {}", reason);
    correlator.fail_all(reason);
    handlers.publish(wire::connection_closed{"reconnect failed: " + reason});
}

} // namespace tws::client
