#include "order.H"

namespace tws::client {

const char* to_string(ORDER_STATE state) {
    switch (state) {
        case ORDER_STATE::CREATED: return "Created";
        case ORDER_STATE::PENDING_SUBMIT: return "PendingSubmit";
        case ORDER_STATE::PRE_SUBMITTED: return "PreSubmitted";
        case ORDER_STATE::SUBMITTED: return "Submitted";
        case ORDER_STATE::PARTIALLY_FILLED: return "PartiallyFilled";
        case ORDER_STATE::PENDING_CANCEL: return "PendingCancel";
        case ORDER_STATE::FILLED: return "Filled";
        case ORDER_STATE::CANCELLED: return "Cancelled";
        case ORDER_STATE::REJECTED: return "Rejected";
    }
    return "Unknown";
}

int progress_rank(ORDER_STATE state) {
    switch (state) {
        case ORDER_STATE::CREATED: return 0;
        case ORDER_STATE::PENDING_SUBMIT: return 1;
        case ORDER_STATE::PRE_SUBMITTED: return 2;
        case ORDER_STATE::SUBMITTED: return 3;
        case ORDER_STATE::PARTIALLY_FILLED: return 4;
        case ORDER_STATE::PENDING_CANCEL: return 5;
        case ORDER_STATE::FILLED:
        case ORDER_STATE::CANCELLED:
        case ORDER_STATE::REJECTED:
            return 6;
    }
    return 0;
}

bool is_terminal(ORDER_STATE state) {
    return progress_rank(state) == 6;
}

std::optional<ORDER_STATE> state_from_status(const std::string& status, double filled, double remaining) {
    if (status == "PendingSubmit" || status == "ApiPending") {
        return ORDER_STATE::PENDING_SUBMIT;
    }
    if (status == "PreSubmitted") {
        return ORDER_STATE::PRE_SUBMITTED;
    }
    if (status == "Submitted") {
        if (filled > 0 && remaining > 0) {
            return ORDER_STATE::PARTIALLY_FILLED;
        }
        return ORDER_STATE::SUBMITTED;
    }
    if (status == "PendingCancel") {
        return ORDER_STATE::PENDING_CANCEL;
    }
    if (status == "Filled") {
        return ORDER_STATE::FILLED;
    }
    if (status == "Cancelled" || status == "ApiCancelled") {
        return ORDER_STATE::CANCELLED;
    }
    if (status == "Inactive") {
        return ORDER_STATE::REJECTED;
    }
    return std::nullopt;
}

} // namespace tws::client
