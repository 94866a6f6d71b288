/**
 * Connects to a gateway with a JSON config and performs one action.
 */
#include "client/client_config.H"
#include "client/tws_client.H"
#include "common/errors.H"
#include "common/utils.H"

#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/sinks/daily_file_sink.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace tws;

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <config.json> <action> [args]\n"
              << "  buy <symbol> <quantity> <limit price>\n"
              << "  sell <symbol> <quantity> <limit price>\n"
              << "  cancel [order id]           cancel one order, or every open order\n"
              << "  open                        list open orders\n"
              << "  account [account]           account values\n"
              << "  portfolio [account]         positions\n"
              << "  query <symbol>\n"
              << "  stream <symbol> <seconds>\n"
              << "  executions [symbol]" << std::endl;
}

wire::contract stock(const std::string& symbol) {
    wire::contract c;
    c.symbol = symbol;
    return c;
}

void print_quote(const client::quote& q) {
    std::cout << format_walltime(q.arrival_time) << " " << q.ticker
              << " bid " << q.bid_size << " @ " << q.bid_price
              << " ask " << q.ask_size << " @ " << q.ask_price
              << " last " << q.last_size << " @ " << q.last_price << std::endl;
}

int place(client::TwsClient& client, wire::ACTION action, int argc, char* argv[]) {
    if (argc != 6) {
        usage(argv[0]);
        return 1;
    }
    wire::order_params order;
    order.instrument = stock(argv[3]);
    order.action = action;
    order.quantity = std::stod(argv[4]);
    order.limit_price = std::stod(argv[5]);

    auto id = client.place_order(order);
    std::cout << "Placed order " << id << std::endl;

    client.await_once(id);
    auto record = client.order(id);
    if (record) {
        std::cout << "Order " << id << " " << client::to_string(record->state) << " filled " << record->filled
                  << " @ " << record->avg_fill_price;
        if (!record->error_text.empty()) {
            std::cout << " (" << record->error_text << ")";
        }
        std::cout << std::endl;
    }
    return record && record->state == client::ORDER_STATE::FILLED ? 0 : 2;
}

std::string first_account(const std::string& accounts) {
    return accounts.substr(0, accounts.find(','));
}

// waits for the cancel to settle and prints the order's state
void await_settled(client::TwsClient& client, wire::request_id id) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        auto record = client.order(id);
        if (record && client::is_terminal(record->state)) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    auto record = client.order(id);
    std::cout << "Order " << id << " " << (record ? client::to_string(record->state) : "unknown") << std::endl;
}

int run_action(client::TwsClient& client, const std::string& action, int argc, char* argv[]) {
    if (action == "buy") {
        return place(client, wire::ACTION::BUY, argc, argv);
    }
    if (action == "sell") {
        return place(client, wire::ACTION::SELL, argc, argv);
    }
    if (action == "cancel" && argc == 3) {
        client.global_cancel();
        std::cout << "Global cancel sent" << std::endl;
        return 0;
    }
    if (action == "cancel" && argc == 4) {
        wire::request_id id = std::stoll(argv[3]);
        // adopts orders placed by earlier sessions
        client.open_orders();
        client.cancel(id);
        await_settled(client, id);
        return 0;
    }
    if (action == "open" && argc == 3) {
        for (const auto& o : client.open_orders()) {
            std::cout << o.order_id << " " << o.action << " " << o.quantity << " " << o.instrument.symbol << " "
                      << o.order_type;
            if (o.limit_price) {
                std::cout << " @ " << *o.limit_price;
            }
            std::cout << " " << o.tif << " " << o.account << std::endl;
        }
        return 0;
    }
    if ((action == "account" || action == "portfolio") && (argc == 3 || argc == 4)) {
        std::string account = argc == 4 ? argv[3] : first_account(client.accounts());
        client::account_snapshot snap = client.request_account(account);
        if (action == "account") {
            for (const auto& v : snap.values) {
                std::cout << v.key << " " << v.value << " " << v.currency << std::endl;
            }
        } else {
            for (const auto& p : snap.positions) {
                std::cout << p.instrument.symbol << " " << p.position << " @ " << p.average_cost << " market "
                          << p.market_price << " unrealized " << p.unrealized_pnl << std::endl;
            }
        }
        std::cout << "Account " << snap.account << " as of " << snap.update_time << std::endl;
        return 0;
    }
    if (action == "query" && argc == 4) {
        print_quote(client.query_quote(stock(argv[3])));
        return 0;
    }
    if (action == "stream" && argc == 5) {
        auto id = client.subscribe(stock(argv[3]));
        auto end = std::chrono::steady_clock::now() + std::chrono::seconds(std::stoi(argv[4]));
        while (std::chrono::steady_clock::now() < end) {
            for (const auto& q : client.pop_all(id)) {
                print_quote(q);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        for (const auto& q : client.unsubscribe(id)) {
            print_quote(q);
        }
        return 0;
    }
    if (action == "executions" && (argc == 3 || argc == 4)) {
        wire::execution_filter filter;
        if (argc == 4) {
            filter.symbol = argv[3];
        }
        for (const auto& e : client.request_executions(filter)) {
            std::cout << e.time << " " << e.exec_id << " order " << e.order_id << " " << e.side << " "
                      << e.shares << " " << e.instrument.symbol << " @ " << e.price << std::endl;
        }
        return 0;
    }
    usage(argv[0]);
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {

    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    client::client_config config;
    try {
        config = client::load_config(argv[1]);
    } catch (const config_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    auto logger = spdlog::daily_logger_mt<spdlog::async_factory>("async_logger", config.log_dir + "/tws_cli");
    logger->set_level(spdlog::level::from_str(config.log_level));

    client::TwsClient client(config, logger);
    int rc;
    try {
        client.connect();
        rc = run_action(client, argv[2], argc, argv);
    } catch (const tws_error& e) {
        logger->error("{} failed: {}", argv[2], e.what());
        std::cerr << e.what() << std::endl;
        rc = 1;
    }

    client.disconnect();
    spdlog::shutdown();
    return rc;
}
