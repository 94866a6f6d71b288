#include "messages.H"

#include <type_traits>

namespace tws::wire {

const char* to_string(ACTION action) {
    switch (action) {
        case ACTION::BUY: return "BUY";
        case ACTION::SELL: return "SELL";
        case ACTION::SSHORT: return "SSHORT";
        case ACTION::SLONG: return "SLONG";
        case ACTION::CLOSE: return "CLOSE";
    }
    return "";
}

const char* to_string(TIME_IN_FORCE tif) {
    switch (tif) {
        case TIME_IN_FORCE::DAY: return "DAY";
        case TIME_IN_FORCE::GTC: return "GTC";
        case TIME_IN_FORCE::IOC: return "IOC";
        case TIME_IN_FORCE::GTD: return "GTD";
    }
    return "";
}

std::optional<ACTION> action_from_string(const std::string& action) {
    for (ACTION a : {ACTION::BUY, ACTION::SELL, ACTION::SSHORT, ACTION::SLONG}) {
        if (action == to_string(a)) {
            return a;
        }
    }
    return std::nullopt;
}

std::optional<TIME_IN_FORCE> tif_from_string(const std::string& tif) {
    for (TIME_IN_FORCE t : {TIME_IN_FORCE::DAY, TIME_IN_FORCE::GTC, TIME_IN_FORCE::IOC, TIME_IN_FORCE::GTD}) {
        if (tif == to_string(t)) {
            return t;
        }
    }
    return std::nullopt;
}

const char* event_name(const event& ev) {
    static const char* names[] = {
        "TickPrice", "TickSize", "TickGeneric", "TickString", "TickSnapshotEnd",
        "OrderStatus", "Error", "NextValidId", "ManagedAccounts", "ExecDetails",
        "ExecDetailsEnd", "CurrentTime", "OpenOrder", "OpenOrderEnd", "AccountValue", "PortfolioValue",
        "AccountUpdateTime", "AccountDownloadEnd", "Unknown", "ConnectionClosed", "ConnectionRestored",
    };
    static_assert(sizeof(names) / sizeof(names[0]) == std::variant_size_v<event>);
    return names[ev.index()];
}

const char* request_name(const request& req) {
    static const char* names[] = {
        "StartApi", "PlaceOrder", "CancelOrder", "ReqMktData", "CancelMktData",
        "ReqExecutions", "ReqIds", "ReqCurrentTime", "ReqGlobalCancel", "ReqOpenOrders", "ReqAccountUpdates",
    };
    static_assert(sizeof(names) / sizeof(names[0]) == std::variant_size_v<request>);
    return names[req.index()];
}

std::optional<request_id> correlation_id(const event& ev) {
    return std::visit([](const auto& msg) -> std::optional<request_id> {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, tick_price> || std::is_same_v<T, tick_size>
                      || std::is_same_v<T, tick_generic> || std::is_same_v<T, tick_string>
                      || std::is_same_v<T, tick_snapshot_end> || std::is_same_v<T, execution_details_end>) {
            return msg.req_id;
        } else if constexpr (std::is_same_v<T, order_status>) {
            return msg.order_id;
        } else if constexpr (std::is_same_v<T, error_message>) {
            if (msg.id < 0) {
                return std::nullopt;
            }
            return msg.id;
        } else if constexpr (std::is_same_v<T, execution_details>) {
            // unsolicited executions carry -1 and are routed by order id only
            if (msg.req_id < 0) {
                return std::nullopt;
            }
            return msg.req_id;
        } else if constexpr (std::is_same_v<T, open_order> || std::is_same_v<T, open_order_end>) {
            return OPEN_ORDERS_CHANNEL;
        } else if constexpr (std::is_same_v<T, account_value> || std::is_same_v<T, portfolio_value>
                             || std::is_same_v<T, account_update_time>
                             || std::is_same_v<T, account_download_end>) {
            return ACCOUNT_CHANNEL;
        } else {
            return std::nullopt;
        }
    }, ev);
}

bool is_terminal_order_status(const std::string& status) {
    return status == "Filled" || status == "Cancelled" || status == "ApiCancelled" || status == "Inactive";
}

bool is_terminal(const event& ev, bool order_placement) {
    if (auto status = std::get_if<order_status>(&ev)) {
        return is_terminal_order_status(status->status);
    }
    if (auto err = std::get_if<error_message>(&ev)) {
        if (err->id < 0) {
            return false;
        }
        return order_placement ? is_order_ending_error(err->code) : !is_warning_code(err->code);
    }
    return std::holds_alternative<tick_snapshot_end>(ev) || std::holds_alternative<execution_details_end>(ev)
        || std::holds_alternative<open_order_end>(ev) || std::holds_alternative<account_download_end>(ev);
}

void assign_request_id(request& req, request_id id) {
    std::visit([id](auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, place_order_request>) {
            msg.order.order_id = id;
        } else if constexpr (std::is_same_v<T, cancel_order_request>) {
            msg.order_id = id;
        } else if constexpr (std::is_same_v<T, market_data_request> || std::is_same_v<T, cancel_market_data_request>
                             || std::is_same_v<T, executions_request>) {
            msg.req_id = id;
        }
    }, req);
}

std::optional<request_id> request_id_of(const request& req) {
    return std::visit([](const auto& msg) -> std::optional<request_id> {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, open_orders_request>) {
            return OPEN_ORDERS_CHANNEL;
        } else if constexpr (std::is_same_v<T, account_updates_request>) {
            if (!msg.subscribe) {
                return std::nullopt;
            }
            return ACCOUNT_CHANNEL;
        } else if constexpr (std::is_same_v<T, place_order_request>) {
            return msg.order.order_id;
        } else if constexpr (std::is_same_v<T, cancel_order_request>) {
            return msg.order_id;
        } else if constexpr (std::is_same_v<T, market_data_request> || std::is_same_v<T, cancel_market_data_request>
                             || std::is_same_v<T, executions_request>) {
            return msg.req_id;
        } else {
            return std::nullopt;
        }
    }, req);
}

} // namespace tws::wire
