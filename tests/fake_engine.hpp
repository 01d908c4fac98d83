#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "utils/common.hpp"

namespace kalibox::testing {

// Minimal HTTP/1.1 server on a Unix-domain socket, one request per
// connection, answering with whatever the handler returns.
class FakeEngine {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Handler = std::function<Response(const Request&)>;

    explicit FakeEngine(Handler handler)
        : handler_(std::move(handler))
        , path_(std::filesystem::temp_directory_path() / ("kbx-" + utils::RandomHex(8) + ".sock"))
        , acceptor_(ioc_, boost::asio::local::stream_protocol::endpoint(path_.string())) {
        thread_ = std::thread([this]() { Serve(); });
    }

    ~FakeEngine() {
        stopping_ = true;
        {
            boost::asio::io_context ioc;
            boost::asio::local::stream_protocol::socket wake(ioc);
            boost::system::error_code ec;
            wake.connect(boost::asio::local::stream_protocol::endpoint(path_.string()), ec);
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string SocketPath() const { return path_.string(); }

    std::vector<std::string> Requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::string LastBody() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_body_;
    }

    static Response Reply(unsigned status, const std::string& body = {},
                          const std::string& content_type = "application/json") {
        Response response{static_cast<boost::beast::http::status>(status), 11};
        if (!body.empty()) {
            response.set(boost::beast::http::field::content_type, content_type);
            response.body() = body;
        }
        return response;
    }

private:
    void Serve() {
        namespace http = boost::beast::http;
        while (!stopping_) {
            boost::asio::local::stream_protocol::socket socket(ioc_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || stopping_) {
                return;
            }
            boost::beast::flat_buffer buffer;
            Request request;
            http::read(socket, buffer, request, ec);
            if (ec) {
                continue;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(std::string(request.method_string()) + " "
                                    + std::string(request.target()));
                last_body_ = request.body();
            }
            auto response = handler_(request);
            response.keep_alive(false);
            response.prepare_payload();
            http::write(socket, response, ec);
            socket.shutdown(boost::asio::local::stream_protocol::socket::shutdown_both, ec);
        }
    }

    Handler handler_;
    std::filesystem::path path_;
    boost::asio::io_context ioc_;
    boost::asio::local::stream_protocol::acceptor acceptor_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::string> requests_;
    std::string last_body_;
};

}  // namespace kalibox::testing
