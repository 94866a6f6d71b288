#include "quote.H"

#include <cstdlib>

namespace tws::client {

namespace {

using wire::TICK_TYPE;

// delayed ticks fill the same fields as their live counterparts
TICK_TYPE live_type(int tick_type) {
    switch (static_cast<TICK_TYPE>(tick_type)) {
        case TICK_TYPE::DELAYED_BID: return TICK_TYPE::BID;
        case TICK_TYPE::DELAYED_ASK: return TICK_TYPE::ASK;
        case TICK_TYPE::DELAYED_LAST: return TICK_TYPE::LAST;
        case TICK_TYPE::DELAYED_BID_SIZE: return TICK_TYPE::BID_SIZE;
        case TICK_TYPE::DELAYED_ASK_SIZE: return TICK_TYPE::ASK_SIZE;
        case TICK_TYPE::DELAYED_LAST_SIZE: return TICK_TYPE::LAST_SIZE;
        case TICK_TYPE::DELAYED_HIGH: return TICK_TYPE::HIGH;
        case TICK_TYPE::DELAYED_LOW: return TICK_TYPE::LOW;
        case TICK_TYPE::DELAYED_VOLUME: return TICK_TYPE::VOLUME;
        case TICK_TYPE::DELAYED_CLOSE: return TICK_TYPE::CLOSE;
        case TICK_TYPE::DELAYED_OPEN: return TICK_TYPE::OPEN;
        default: return static_cast<TICK_TYPE>(tick_type);
    }
}

bool apply_price(quote& q, TICK_TYPE type, double price, double size) {
    switch (type) {
        case TICK_TYPE::BID:
            q.bid_price = price;
            if (size > 0) q.bid_size = size;
            return true;
        case TICK_TYPE::ASK:
            q.ask_price = price;
            if (size > 0) q.ask_size = size;
            return true;
        case TICK_TYPE::LAST:
            q.last_price = price;
            if (size > 0) q.last_size = size;
            return true;
        case TICK_TYPE::HIGH: q.high = price; return true;
        case TICK_TYPE::LOW: q.low = price; return true;
        case TICK_TYPE::CLOSE: q.close = price; return true;
        case TICK_TYPE::OPEN: q.open = price; return true;
        default: return false;
    }
}

bool apply_size(quote& q, TICK_TYPE type, double size) {
    switch (type) {
        case TICK_TYPE::BID_SIZE: q.bid_size = size; return true;
        case TICK_TYPE::ASK_SIZE: q.ask_size = size; return true;
        case TICK_TYPE::LAST_SIZE: q.last_size = size; return true;
        case TICK_TYPE::VOLUME: q.volume = size; return true;
        default: return false;
    }
}

} // namespace

bool apply_tick(quote& q, const wire::event& ev) {
    if (auto* tick = std::get_if<wire::tick_price>(&ev)) {
        return apply_price(q, live_type(tick->tick_type), tick->price, tick->size);
    }
    if (auto* tick = std::get_if<wire::tick_size>(&ev)) {
        return apply_size(q, live_type(tick->tick_type), tick->size);
    }
    if (auto* tick = std::get_if<wire::tick_string>(&ev)) {
        if (tick->tick_type == static_cast<int>(TICK_TYPE::LAST_TIMESTAMP)) {
            q.event_time = std::strtoull(tick->value.c_str(), nullptr, 10) * 1'000'000'000ull;
        }
    }
    return false;
}

} // namespace tws::client
