#include "wire_codec.H"
#include "field_codec.H"

#include "common/errors.H"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace tws::wire {

namespace {

std::string upper(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::toupper(c); });
    return out;
}

bool needs_limit_price(const std::string& type) {
    return type == "LMT" || type == "STP LMT" || type == "STPLMT" || type == "LIT" || type == "LOC"
        || type == "LMTCLS" || type == "REL" || type == "VWAP" || type == "TRAIL LIMIT" || type == "TRAILLIMIT";
}

bool needs_aux_price(const std::string& type) {
    return type == "STP" || type == "STP LMT" || type == "STPLMT" || type == "MIT" || type == "LIT";
}

void write_contract(FieldWriter& w, const contract& c) {
    w.add_int(c.con_id)
     .add_string(c.symbol)
     .add_string(c.sec_type)
     .add_string(c.expiry)
     .add_double(c.strike)
     .add_string(c.right)
     .add_string(c.multiplier)
     .add_string(c.exchange)
     .add_string(c.primary_exchange)
     .add_string(c.currency)
     .add_string(c.local_symbol)
     .add_string(""); // trading class
}

const char* wire_action(const order_params& order) {
    // a close is sent as a closing sell
    if (order.action == ACTION::CLOSE) {
        return "SELL";
    }
    return to_string(order.action);
}

void encode_request(FieldWriter& w, const start_api_request& req, int) {
    w.add_int(static_cast<int>(OUT_MSG::START_API))
     .add_int(START_API_VERSION)
     .add_int(req.client_id)
     .add_string(req.optional_capabilities);
}

void encode_request(FieldWriter& w, const place_order_request& req, int server_version) {
    const order_params& o = req.order;
    validate_order(o);
    if (o.order_id <= 0) {
        throw encoding_error("place order without an order id");
    }

    std::string open_close = o.open_close;
    if (o.action == ACTION::CLOSE && open_close.empty()) {
        open_close = "C";
    }

    w.add_int(static_cast<int>(OUT_MSG::PLACE_ORDER));
    if (server_version < MIN_SERVER_VER_ORDER_CONTAINER) {
        w.add_int(PLACE_ORDER_VERSION);
    }
    w.add_int(o.order_id);
    write_contract(w, o.instrument);
    w.add_string(o.instrument.sec_id_type)
     .add_string(o.instrument.sec_id)
     .add_string(wire_action(o));
    if (server_version >= MIN_SERVER_VER_FRACTIONAL_POSITIONS) {
        w.add_double(o.quantity);
    } else {
        w.add_int(std::llround(o.quantity));
    }
    w.add_string(upper(o.order_type))
     .add_optional(o.limit_price)
     .add_optional(o.aux_price)
     .add_string(to_string(o.tif))
     .add_string(o.oca_group)
     .add_string(o.account)
     .add_string(open_close)
     .add_int(0) // origin: customer
     .add_string(o.order_ref)
     .add_bool(o.transmit)
     .add_int(o.parent_id)
     .add_bool(false) // block order
     .add_bool(false) // sweep to fill
     .add_int(0)      // display size
     .add_int(o.trigger_method)
     .add_bool(o.outside_rth)
     .add_bool(false) // hidden
     .add_string("")  // shares allocation, deprecated
     .add_double(0)   // discretionary amount
     .add_string(o.good_after_time)
     .add_string(o.good_till_date);

    // financial advisor group, method, percentage and profile
    w.add_string("").add_string("").add_string("").add_string("");
    if (server_version >= MIN_SERVER_VER_MODELS_SUPPORT) {
        w.add_string(""); // model code
    }

    w.add_int(0)       // short sale slot
     .add_string("")   // designated location
     .add_int(-1)      // exempt code
     .add_int(o.oca_type)
     .add_string("")   // rule 80A
     .add_string("")   // settling firm
     .add_bool(false)  // all or none
     .add_string("")   // minimum quantity
     .add_string("")   // percent offset
     .add_bool(false)  // e-trade only
     .add_bool(false)  // firm quote only
     .add_string("")   // NBBO price cap
     .add_int(0)       // auction strategy
     .add_string("")   // starting price
     .add_string("")   // stock reference price
     .add_string("")   // delta
     .add_string("")   // stock range lower
     .add_string("")   // stock range upper
     .add_bool(false)  // override percentage constraints
     .add_string("")   // volatility
     .add_string("")   // volatility type
     .add_string("")   // delta neutral order type
     .add_string("")   // delta neutral aux price
     .add_bool(false)  // continuous update
     .add_string("")   // reference price type
     .add_optional(o.trail_stop_price)
     .add_optional(o.trailing_percent)
     .add_string("")   // scale initial level size
     .add_string("")   // scale subsequent level size
     .add_string("")   // scale price increment
     .add_string("")   // scale table
     .add_string("")   // active start time
     .add_string("")   // active stop time
     .add_string("")   // hedge type
     .add_bool(false)  // opt out of smart routing
     .add_string("")   // clearing account
     .add_string("")   // clearing intent
     .add_bool(false)  // not held
     .add_bool(false)  // no delta neutral contract
     .add_string("")   // algo strategy
     .add_string("")   // algo id
     .add_bool(o.what_if)
     .add_string("")   // misc options
     .add_bool(false)  // solicited
     .add_bool(false)  // randomize size
     .add_bool(false); // randomize price

    if (server_version >= MIN_SERVER_VER_PEGGED_TO_BENCHMARK) {
        w.add_int(0)      // no conditions
         .add_string("")  // adjusted order type
         .add_string("")  // trigger price
         .add_string("")  // limit price offset
         .add_string("")  // adjusted stop price
         .add_string("")  // adjusted stop limit price
         .add_string("")  // adjusted trailing amount
         .add_int(0);     // adjustable trailing unit
    }
    if (server_version >= MIN_SERVER_VER_EXT_OPERATOR) {
        w.add_string("");
    }
    if (server_version >= MIN_SERVER_VER_SOFT_DOLLAR_TIER) {
        w.add_string("").add_string(""); // tier name and value
    }
    if (server_version >= MIN_SERVER_VER_CASH_QTY) {
        w.add_string("");
    }
    if (server_version >= MIN_SERVER_VER_DECISION_MAKER) {
        w.add_string("").add_string(""); // MiFID II decision maker and algo
    }
    if (server_version >= MIN_SERVER_VER_MIFID_EXECUTION) {
        w.add_string("").add_string(""); // MiFID II execution trader and algo
    }
    if (server_version >= MIN_SERVER_VER_AUTO_PRICE_FOR_HEDGE) {
        w.add_bool(false); // don't use auto price for hedge
    }
    if (server_version >= MIN_SERVER_VER_ORDER_CONTAINER) {
        w.add_bool(false); // OMS container
    }
    if (server_version >= MIN_SERVER_VER_D_PEG_ORDERS) {
        w.add_bool(false); // discretionary up to limit price
    }
    if (server_version >= MIN_SERVER_VER_PRICE_MGMT_ALGO) {
        w.add_string(""); // price management algo: gateway default
    }
}

void encode_request(FieldWriter& w, const cancel_order_request& req, int) {
    if (req.order_id <= 0) {
        throw encoding_error("cancel order without an order id");
    }
    w.add_int(static_cast<int>(OUT_MSG::CANCEL_ORDER))
     .add_int(CANCEL_ORDER_VERSION)
     .add_int(req.order_id);
}

void encode_request(FieldWriter& w, const market_data_request& req, int server_version) {
    validate_contract(req.instrument);
    w.add_int(static_cast<int>(OUT_MSG::REQ_MKT_DATA))
     .add_int(REQ_MKT_DATA_VERSION)
     .add_int(req.req_id);
    write_contract(w, req.instrument);
    w.add_bool(false) // no delta neutral contract
     .add_string(req.generic_ticks)
     .add_bool(req.snapshot);
    if (server_version >= MIN_SERVER_VER_REQ_SMART_COMPONENTS) {
        w.add_bool(false); // regulatory snapshot
    }
    w.add_string(""); // market data options
}

void encode_request(FieldWriter& w, const cancel_market_data_request& req, int) {
    w.add_int(static_cast<int>(OUT_MSG::CANCEL_MKT_DATA))
     .add_int(CANCEL_MKT_DATA_VERSION)
     .add_int(req.req_id);
}

void encode_request(FieldWriter& w, const executions_request& req, int) {
    w.add_int(static_cast<int>(OUT_MSG::REQ_EXECUTIONS))
     .add_int(REQ_EXECUTIONS_VERSION)
     .add_int(req.req_id)
     .add_int(req.filter.client_id)
     .add_string(req.filter.account)
     .add_string(req.filter.time)
     .add_string(req.filter.symbol)
     .add_string(req.filter.sec_type)
     .add_string(req.filter.exchange)
     .add_string(req.filter.side);
}

void encode_request(FieldWriter& w, const ids_request& req, int) {
    w.add_int(static_cast<int>(OUT_MSG::REQ_IDS))
     .add_int(REQ_IDS_VERSION)
     .add_int(req.num_ids);
}

void encode_request(FieldWriter& w, const current_time_request&, int) {
    w.add_int(static_cast<int>(OUT_MSG::REQ_CURRENT_TIME))
     .add_int(REQ_CURRENT_TIME_VERSION);
}

void encode_request(FieldWriter& w, const global_cancel_request&, int) {
    w.add_int(static_cast<int>(OUT_MSG::REQ_GLOBAL_CANCEL))
     .add_int(REQ_GLOBAL_CANCEL_VERSION);
}

void encode_request(FieldWriter& w, const open_orders_request&, int) {
    w.add_int(static_cast<int>(OUT_MSG::REQ_OPEN_ORDERS))
     .add_int(REQ_OPEN_ORDERS_VERSION);
}

void encode_request(FieldWriter& w, const account_updates_request& req, int) {
    w.add_int(static_cast<int>(OUT_MSG::REQ_ACCT_DATA))
     .add_int(REQ_ACCT_DATA_VERSION)
     .add_bool(req.subscribe)
     .add_string(req.account);
}

// Fields gated on a message version are always present once the server
// stops sending the version, so that case reads as "newest".
int message_version(FieldReader& r, int server_version, int unversioned_from) {
    if (server_version >= unversioned_from) {
        return std::numeric_limits<int>::max();
    }
    return r.read_int();
}

order_status read_order_status(FieldReader& r, int server_version) {
    int version = message_version(r, server_version, MIN_SERVER_VER_MARKET_CAP_PRICE);
    order_status msg;
    msg.order_id = r.read_int64();
    msg.status = r.read_string();
    msg.filled = r.read_double();
    msg.remaining = r.read_double();
    msg.avg_fill_price = r.read_double();
    if (version >= 2) {
        msg.perm_id = r.read_int64();
    }
    if (version >= 3) {
        msg.parent_id = r.read_int64();
    }
    if (version >= 4) {
        msg.last_fill_price = r.read_double();
    }
    if (version >= 5) {
        msg.client_id = r.read_int();
    }
    if (version >= 6) {
        msg.why_held = r.read_string();
    }
    if (server_version >= MIN_SERVER_VER_MARKET_CAP_PRICE) {
        msg.mkt_cap_price = r.read_double();
    }
    return msg;
}

execution_details read_execution(FieldReader& r, int server_version) {
    int version = message_version(r, server_version, MIN_SERVER_VER_LAST_LIQUIDITY);
    execution_details msg;
    if (version >= 7) {
        msg.req_id = r.read_int64();
    }

    execution& e = msg.exec;
    e.order_id = r.read_int64();

    contract& c = e.instrument;
    if (version >= 5) {
        c.con_id = r.read_int64();
    }
    c.symbol = r.read_string();
    c.sec_type = r.read_string();
    c.expiry = r.read_string();
    c.strike = r.read_double();
    c.right = r.read_string();
    if (version >= 9) {
        c.multiplier = r.read_string();
    }
    c.exchange = r.read_string();
    c.currency = r.read_string();
    c.local_symbol = r.read_string();
    if (version >= 10) {
        r.skip(); // trading class
    }

    e.exec_id = r.read_string();
    e.time = r.read_string();
    e.account = r.read_string();
    e.exchange = r.read_string();
    e.side = r.read_string();
    e.shares = r.read_double();
    e.price = r.read_double();
    if (version >= 2) {
        e.perm_id = r.read_int64();
    }
    if (version >= 3) {
        e.client_id = r.read_int();
    }
    if (version >= 4) {
        e.liquidation = r.read_int();
    }
    if (version >= 6) {
        e.cum_qty = r.read_double();
        e.avg_price = r.read_double();
    }
    if (version >= 8) {
        e.order_ref = r.read_string();
    }
    if (version >= 9) {
        e.ev_rule = r.read_string();
        e.ev_multiplier = r.read_double();
    }
    if (server_version >= MIN_SERVER_VER_MODELS_SUPPORT) {
        e.model_code = r.read_string();
    }
    if (server_version >= MIN_SERVER_VER_LAST_LIQUIDITY) {
        e.last_liquidity = r.read_int();
    }
    return msg;
}

open_order read_open_order(FieldReader& r, int server_version) {
    message_version(r, server_version, MIN_SERVER_VER_ORDER_CONTAINER);
    open_order msg;
    msg.order_id = r.read_int64();

    contract& c = msg.instrument;
    c.con_id = r.read_int64();
    c.symbol = r.read_string();
    c.sec_type = r.read_string();
    c.expiry = r.read_string();
    c.strike = r.read_double();
    c.right = r.read_string();
    c.multiplier = r.read_string();
    c.exchange = r.read_string();
    c.currency = r.read_string();
    c.local_symbol = r.read_string();
    r.skip(); // trading class

    msg.action = r.read_string();
    msg.quantity = r.read_double();
    msg.order_type = r.read_string();
    msg.limit_price = r.read_optional_double();
    msg.aux_price = r.read_optional_double();
    msg.tif = r.read_string();
    msg.oca_group = r.read_string();
    msg.account = r.read_string();
    msg.open_close = r.read_string();
    r.skip(); // origin
    msg.order_ref = r.read_string();
    msg.client_id = r.read_int();
    msg.perm_id = r.read_int64();
    return msg;
}

portfolio_value read_portfolio_value(FieldReader& r) {
    int version = r.read_int();
    portfolio_value msg;
    contract& c = msg.instrument;
    if (version >= 6) {
        c.con_id = r.read_int64();
    }
    c.symbol = r.read_string();
    c.sec_type = r.read_string();
    c.expiry = r.read_string();
    c.strike = r.read_double();
    c.right = r.read_string();
    if (version >= 7) {
        c.multiplier = r.read_string();
        c.primary_exchange = r.read_string();
    }
    c.currency = r.read_string();
    if (version >= 2) {
        c.local_symbol = r.read_string();
    }
    if (version >= 8) {
        r.skip(); // trading class
    }
    msg.position = r.read_double();
    msg.market_price = r.read_double();
    msg.market_value = r.read_double();
    if (version >= 3) {
        msg.average_cost = r.read_double();
        msg.unrealized_pnl = r.read_double();
        msg.realized_pnl = r.read_double();
    }
    if (version >= 4) {
        msg.account = r.read_string();
    }
    return msg;
}

} // namespace

void validate_contract(const contract& c) {
    if (c.symbol.empty() && c.local_symbol.empty() && c.con_id == 0 && c.sec_id.empty()) {
        throw encoding_error("contract needs a symbol, local symbol, con id or sec id");
    }
    if (c.sec_id.empty() != c.sec_id_type.empty()) {
        throw encoding_error("sec id and sec id type must be given together");
    }
}

void validate_order(const order_params& o) {
    validate_contract(o.instrument);

    if (!(o.quantity > 0)) {
        throw encoding_error(fmt::format("order quantity must be positive, got {}", o.quantity));
    }

    std::string type = upper(o.order_type);
    if (type.empty()) {
        throw encoding_error("order type is empty");
    }
    if (needs_limit_price(type) && !o.limit_price) {
        throw encoding_error(fmt::format("{} order requires a limit price", type));
    }
    if (needs_aux_price(type) && !o.aux_price) {
        throw encoding_error(fmt::format("{} order requires an aux price", type));
    }
    if (type == "TRAIL" && !o.aux_price && !o.trailing_percent) {
        throw encoding_error("TRAIL order requires an aux price or a trailing percent");
    }
    if (o.tif == TIME_IN_FORCE::GTD && o.good_till_date.empty()) {
        throw encoding_error("GTD order requires a good till date");
    }
    if (o.bracket) {
        if (!o.limit_price) {
            throw encoding_error("bracket order requires a parent limit price");
        }
        // a zero upper delta reuses the lower one
        if (!(o.bracket->lower_delta > 0) || o.bracket->upper_delta < 0) {
            throw encoding_error("bracket deltas must be positive");
        }
    }
}

std::string encode(const request& req, int server_version) {
    FieldWriter w;
    std::visit([&w, server_version](const auto& msg) { encode_request(w, msg, server_version); }, req);
    return w.frame();
}

std::string encode_handshake() {
    std::string out(API_PREFIX, sizeof(API_PREFIX)); // keeps the trailing NUL
    out.append(make_frame(fmt::format("v{}..{}", MIN_CLIENT_VERSION, MAX_CLIENT_VERSION)));
    return out;
}

std::vector<std::string> split_fields(const char* payload, size_t len) {
    std::vector<std::string> fields;
    size_t start = 0;
    for (size_t i = 0; i < len; i++) {
        if (payload[i] == '\0') {
            fields.emplace_back(payload + start, i - start);
            start = i + 1;
        }
    }
    if (start < len) {
        fields.emplace_back(payload + start, len - start);
    }
    return fields;
}

event decode_event(const std::vector<std::string>& fields, int server_version) {
    FieldReader r(fields);
    int msg_id = r.read_int();

    switch (static_cast<IN_MSG>(msg_id)) {
        case IN_MSG::TICK_PRICE: {
            int version = r.read_int();
            tick_price msg;
            msg.req_id = r.read_int64();
            msg.tick_type = r.read_int();
            msg.price = r.read_double();
            if (version >= 2) {
                msg.size = r.read_double();
            }
            if (version >= 3) {
                msg.attrib_mask = r.read_int();
            }
            return msg;
        }
        case IN_MSG::TICK_SIZE: {
            r.skip(); // version
            tick_size msg;
            msg.req_id = r.read_int64();
            msg.tick_type = r.read_int();
            msg.size = r.read_double();
            return msg;
        }
        case IN_MSG::TICK_GENERIC: {
            r.skip();
            tick_generic msg;
            msg.req_id = r.read_int64();
            msg.tick_type = r.read_int();
            msg.value = r.read_double();
            return msg;
        }
        case IN_MSG::TICK_STRING: {
            r.skip();
            tick_string msg;
            msg.req_id = r.read_int64();
            msg.tick_type = r.read_int();
            msg.value = r.read_string();
            return msg;
        }
        case IN_MSG::TICK_SNAPSHOT_END: {
            r.skip();
            return tick_snapshot_end{r.read_int64()};
        }
        case IN_MSG::ORDER_STATUS:
            return read_order_status(r, server_version);
        case IN_MSG::ERR_MSG: {
            r.skip();
            error_message msg;
            msg.id = r.read_int64();
            msg.code = r.read_int();
            msg.message = r.read_string();
            return msg;
        }
        case IN_MSG::OPEN_ORDER:
            return read_open_order(r, server_version);
        case IN_MSG::ACCT_VALUE: {
            int version = r.read_int();
            account_value msg;
            msg.key = r.read_string();
            msg.value = r.read_string();
            msg.currency = r.read_string();
            if (version >= 2) {
                msg.account = r.read_string();
            }
            return msg;
        }
        case IN_MSG::PORTFOLIO_VALUE:
            return read_portfolio_value(r);
        case IN_MSG::ACCT_UPDATE_TIME: {
            r.skip();
            return account_update_time{r.read_string()};
        }
        case IN_MSG::NEXT_VALID_ID: {
            r.skip();
            return next_valid_id{r.read_int64()};
        }
        case IN_MSG::MANAGED_ACCTS: {
            r.skip();
            return managed_accounts{r.read_string()};
        }
        case IN_MSG::EXECUTION_DATA:
            return read_execution(r, server_version);
        case IN_MSG::EXECUTION_DATA_END: {
            r.skip();
            return execution_details_end{r.read_int64()};
        }
        case IN_MSG::CURRENT_TIME: {
            r.skip();
            return current_time{r.read_int64()};
        }
        case IN_MSG::OPEN_ORDER_END:
            r.skip();
            return open_order_end{};
        case IN_MSG::ACCT_DOWNLOAD_END: {
            r.skip();
            return account_download_end{r.read_string()};
        }
        default:
            break;
    }

    unknown_message msg;
    msg.msg_id = msg_id;
    msg.fields.assign(fields.begin() + 1, fields.end());
    return msg;
}

void FrameDecoder::feed(const char* data, size_t len) {
    // drop consumed bytes before growing the buffer
    if (read_pos > 0 && read_pos == buffer.size()) {
        buffer.clear();
        read_pos = 0;
    } else if (read_pos > 4096 && read_pos * 2 > buffer.size()) {
        buffer.erase(0, read_pos);
        read_pos = 0;
    }
    buffer.append(data, len);
}

std::optional<std::vector<std::string>> FrameDecoder::next_frame() {
    if (corrupt || buffered() < 4) {
        return std::nullopt;
    }

    const unsigned char* p = reinterpret_cast<const unsigned char*>(buffer.data() + read_pos);
    uint32_t len = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16)
        | (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);

    if (len == 0 || len > MAX_FRAME_LENGTH) {
        corrupt = true;
        throw protocol_error(fmt::format("invalid frame length {}", len));
    }

    if (buffered() < 4 + static_cast<size_t>(len)) {
        return std::nullopt;
    }

    auto fields = split_fields(buffer.data() + read_pos + 4, len);
    read_pos += 4 + len;
    return fields;
}

std::optional<event> FrameDecoder::next() {
    auto fields = next_frame();
    if (!fields) {
        return std::nullopt;
    }
    if (fields->empty()) {
        throw protocol_error("empty frame");
    }
    return decode_event(*fields, version);
}

void FrameDecoder::reset() {
    buffer.clear();
    read_pos = 0;
    corrupt = false;
}

} // namespace tws::wire
