#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core.hpp>
#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "config.hpp"
#include "errors.hpp"
#include "http_handlers.hpp"
#include "record_store.hpp"
#include "transaction_runner.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;
using namespace std::chrono_literals;

struct App {
    ServiceConfig serviceCfg;
    std::shared_ptr<RecordStore> store;
};

net::awaitable<void> session(tcp::socket socket, App& app) {
    boost::beast::tcp_stream stream(std::move(socket));
    boost::beast::flat_buffer buffer;

    for (;;) {
        http::request<http::string_body> req;
        boost::system::error_code read_ec;
        co_await http::async_read(stream, buffer, req, net::redirect_error(net::use_awaitable, read_ec));
        if (read_ec) break;

        http::response<http::string_body> res;
        try {
            res = handleRequest(req, *app.store);
        } catch (const std::exception& e) {
            std::cerr << "[request-error] " << e.what() << '\n';
            http::response<http::string_body> err{http::status::internal_server_error, req.version()};
            err.set(http::field::content_type, "text/plain; charset=utf-8");
            err.keep_alive(false);
            err.body() = "internal error";
            err.prepare_payload();
            res = std::move(err);
        }

        co_await http::async_write(stream, res, net::use_awaitable);
        if (!res.keep_alive()) break;
    }

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    co_return;
}

net::awaitable<void> listener(tcp::endpoint ep, App& app) {
    tcp::acceptor acceptor(co_await net::this_coro::executor, ep);
    for (;;) {
        tcp::socket socket = co_await acceptor.async_accept(net::use_awaitable);
        net::co_spawn(acceptor.get_executor(), session(std::move(socket), app), net::detached);
    }
}

// Every worker runs the same keys so that most attempts either wait on the
// computing holder or hit its stored result.
static void runDemoWorker(RecordStore& store, unsigned worker, unsigned keys) {
    TransactionRunner runner(store);
    const std::string holder = "demo-worker-" + std::to_string(worker);
    for (unsigned i = 0; i < keys; ++i) {
        const std::string key = "demo-txn-" + std::to_string(i);
        try {
            auto outcome = runner.run(key, holder, [&] {
                std::this_thread::sleep_for(20ms);
                return StoredResult{"application/json",
                                    "{\"key\":\"" + key + "\",\"computed_by\":\"" + holder + "\"}"};
            }, 5s);
            if (outcome.fromCache && store.config().verbose) {
                std::cout << "[demo] key=" << key << " holder=" << holder << " reused cached result" << '\n';
            }
        } catch (const HolderConflictError& e) {
            std::cerr << "[demo-error] " << e.what() << '\n';
        } catch (const std::exception& e) {
            std::cerr << "[demo-error] key=" << key << " " << e.what() << '\n';
        }
    }
}

int main(int argc, char** argv) {
    ServiceConfig cfg;
    std::shared_ptr<RecordStore> store;
    try {
        cfg = ServiceConfig::fromEnvironment(argc, argv);
        store = RecordStore::shared();
    } catch (const std::invalid_argument& e) {
        std::cerr << "[config-error] " << e.what() << '\n';
        return 1;
    }

    App app{
        .serviceCfg = cfg,
        .store = store
    };

    net::io_context io;
    auto addr = net::ip::make_address(app.serviceCfg.bindHost);
    net::co_spawn(io, listener(tcp::endpoint{addr, app.serviceCfg.port}, app), net::detached);
    std::cout << "[record-store-service] listening on " << app.serviceCfg.bindHost << ":"
              << app.serviceCfg.port << '\n';

    net::thread_pool demo(app.serviceCfg.workers == 0 ? 1 : app.serviceCfg.workers);
    for (unsigned w = 0; w < app.serviceCfg.workers; ++w) {
        net::post(demo, [&app, w] { runDemoWorker(*app.store, w, app.serviceCfg.demoKeys); });
    }

    const unsigned numThreads = std::max(2u, std::thread::hardware_concurrency());
    std::vector<std::thread> workers;
    workers.reserve(numThreads - 1);
    for (unsigned i = 0; i + 1 < numThreads; ++i) workers.emplace_back([&]{ io.run(); });
    io.run();
    for (auto& t : workers) t.join();
    demo.join();
    return 0;
}
