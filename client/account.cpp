#include "account.H"

#include <algorithm>

namespace tws::client {

namespace {

bool same_instrument(const wire::contract& a, const wire::contract& b) {
    if (a.con_id != 0 || b.con_id != 0) {
        return a.con_id == b.con_id;
    }
    return a.symbol == b.symbol && a.sec_type == b.sec_type && a.currency == b.currency
        && a.local_symbol == b.local_symbol;
}

bool wanted(const std::string& account, const std::string& row_account) {
    return account.empty() || row_account.empty() || row_account == account;
}

} // namespace

std::optional<std::string> account_snapshot::value(const std::string& key, const std::string& currency) const {
    for (const auto& v : values) {
        if (v.key == key && (currency.empty() || v.currency == currency)) {
            return v.value;
        }
    }
    return std::nullopt;
}

account_snapshot fold_account(const std::string& account, const std::vector<wire::event>& parts) {
    account_snapshot snap;
    snap.account = account;

    for (const auto& part : parts) {
        if (auto* v = std::get_if<wire::account_value>(&part)) {
            if (!wanted(account, v->account)) {
                continue;
            }
            auto it = std::find_if(snap.values.begin(), snap.values.end(), [&](const wire::account_value& x) {
                return x.key == v->key && x.currency == v->currency;
            });
            if (it == snap.values.end()) {
                snap.values.push_back(*v);
            } else {
                *it = *v;
            }
        } else if (auto* p = std::get_if<wire::portfolio_value>(&part)) {
            if (!wanted(account, p->account)) {
                continue;
            }
            auto it = std::find_if(snap.positions.begin(), snap.positions.end(), [&](const wire::portfolio_value& x) {
                return same_instrument(x.instrument, p->instrument);
            });
            if (it == snap.positions.end()) {
                snap.positions.push_back(*p);
            } else {
                *it = *p;
            }
        } else if (auto* t = std::get_if<wire::account_update_time>(&part)) {
            snap.update_time = t->time;
        } else if (auto* end = std::get_if<wire::account_download_end>(&part)) {
            if (snap.account.empty()) {
                snap.account = end->account;
            }
        }
    }
    return snap;
}

} // namespace tws::client
