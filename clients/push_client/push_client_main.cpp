/*
 * File: clients/push_client/push_client_main.cpp
 * Project: Tool Sync
 * Purpose: Example HTTP producer: submits a run of value_update events on a shared counter
 * Notes:
 *  - newState uses the shared counters layer: counters["counter-1:clicks"]
 *  - --sync sends one PUT reconcile with a stale clientVersion at the end
 * Last updated: 2026-10-19
 */

#include <iostream>
#include <thread>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <nlohmann/json.hpp>
#include <chrono>

namespace http = boost::beast::http;
using json = nlohmann::json;

static void print_response(const http::response<http::string_body> &res, bool pretty)
{
    auto j = json::parse(res.body(), nullptr, false);
    if (j.is_discarded())
    {
        std::cout << "[push_client] status=" << res.result_int() << " raw body=" << res.body() << std::endl;
        return;
    }
    std::cout << "[push_client] status=" << res.result_int() << " body:\n"
              << (pretty ? j.dump(2) : j.dump()) << std::endl;
}

int main(int argc, char **argv)
{
    bool pretty = false;
    bool sync = false;
    int count = 10;
    std::string base = "http://localhost:8080";
    std::string token = "dev-token";
    std::string tool = "tool-1";
    std::string deployment;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--token" && i + 1 < argc)
            token = argv[++i];
        else if (a == "--tool" && i + 1 < argc)
            tool = argv[++i];
        else if (a == "--deployment" && i + 1 < argc)
            deployment = argv[++i];
        else if (a == "--count" && i + 1 < argc)
            count = std::stoi(argv[++i]);
        else if (a == "--pretty")
            pretty = true;
        else if (a == "--sync")
            sync = true;
    }

    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver res{ioc};
    auto pos = base.find("//");
    auto hp = pos == std::string::npos ? base : base.substr(pos + 2);
    auto host = hp.substr(0, hp.find(":"));
    auto port = hp.substr(host.size() + 1);
    auto results = res.resolve(host, port);

    auto send = [&](http::verb verb, const json &body)
    {
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        http::request<http::string_body> req{verb, "/v1/tools/updates", 11};
        req.set(http::field::host, host);
        req.set(http::field::authorization, "Bearer " + token);
        req.set(http::field::content_type, "application/json");
        req.body() = body.dump();
        req.prepare_payload();
        http::write(sock, req);
        boost::beast::flat_buffer buf;
        http::response<http::string_body> out;
        http::read(sock, buf, out);
        print_response(out, pretty);
        boost::system::error_code ignored;
        sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    };

    try
    {
        for (int k = 0; k < count; ++k)
        {
            json body{{"toolId", tool},
                      {"updateType", "value_update"},
                      {"eventData", {{"newState", {{"counters", {{"counter-1:clicks", k + 1}}}}}}}};
            if (!deployment.empty())
                body["deploymentId"] = deployment;
            send(http::verb::post, body);
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (sync)
        {
            json body{{"toolId", tool},
                      {"clientVersion", 1},
                      {"clientState", {{"counters", {{"counter-1:clicks", 0}}}, {"resetBy", "push_client"}}},
                      {"conflictResolution", "merge"}};
            if (!deployment.empty())
                body["deploymentId"] = deployment;
            send(http::verb::put, body);
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "[push_client] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
