#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "tusvault/cleanup_scheduler.hpp"
#include "tusvault/config.hpp"
#include "tusvault/protocol_engine.hpp"
#include "tusvault/tus_handler.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace tusvault
{

class HttpConnection : public std::enable_shared_from_this<HttpConnection>
{
    tcp::socket socket_;
    asio::steady_timer deadline_;
    beast::flat_buffer buffer_{8192};
    TusHandler& handler_;

    http::request_parser<http::dynamic_body> parser_;
    http::response<http::dynamic_body> response_;

public:
    HttpConnection(tcp::socket socket, TusHandler& handler, const Config& config)
        : socket_(std::move(socket)), deadline_{socket_.get_executor(), config.read_timeout}, handler_(handler)
    {
        parser_.body_limit(config.max_size);
    }

    void handle_request()
    {
        auto self = shared_from_this();

        read_reply_request_async(self);
        set_socket_timeout(self);
    }

private:
    void read_reply_request_async(const std::shared_ptr<HttpConnection>& self)
    {
        http::async_read( socket_, buffer_, parser_,
                          [this, self](beast::error_code ec, std::size_t bytes_transferred)
        {
            boost::ignore_unused(bytes_transferred);
            if (ec == http::error::body_limit)
            {
                response_ = http::response<http::dynamic_body>();
                response_.version(11);
                response_.keep_alive(false);
                response_.set(http::field::server, "tusvault 0.1");
                response_.set(TusHandler::TAG_TUS_RESUMABLE, ProtocolEngine::TUS_VERSION);
                response_.result(http::status::payload_too_large);
                response_.set(http::field::content_length, "0");
                write_response_async(self);
                return;
            }
            if (ec)
            {
                // nothing was committed; the store keeps the previous offset
                if (ec != asio::error::operation_aborted && ec != http::error::end_of_stream)
                    std::cerr << "read error: " << ec.message() << std::endl;
                deadline_.cancel();
                return;
            }
            response_ = handler_.MakeResponse(parser_.get());
            write_response_async(self);
        });
    }

    void write_response_async(const std::shared_ptr<HttpConnection>& self)
    {
        http::async_write( socket_, response_,
                           [this, self](beast::error_code ec, std::size_t)
        {
            if (!ec)
                socket_.shutdown(tcp::socket::shutdown_send, ec);
            deadline_.cancel();
        });
    }

    void set_socket_timeout(const std::shared_ptr<HttpConnection>& self)
    {
        deadline_.async_wait(
            [this, self](beast::error_code ec)
        {
            if (!ec)
            {
                socket_.close(ec);
            }
        });
    }
};

void http_server(asio::io_context& ioc, tcp::acceptor& acceptor, TusHandler& handler, const Config& config)
{
    acceptor.async_accept(asio::make_strand(ioc),
                          [&ioc, &acceptor, &handler, &config](beast::error_code ec, tcp::socket socket)
    {
        if (!ec)
            std::make_shared<HttpConnection>(std::move(socket), handler, config)->handle_request();
        else if (ec == asio::error::operation_aborted)
            return;
        else
            std::cerr << "Error while async_accept on acceptor: " << ec.message() << '\n';
        http_server(ioc, acceptor, handler, config);
    });
}

Hooks Logging_Hooks()
{
    Hooks hooks;
    hooks.on_created = [](const UploadSession& s)
    {
        std::cout << "upload " << s.id << " created" << std::endl;
    };
    hooks.on_completed = [](const UploadSession& s, const std::string& path)
    {
        std::cout << "upload " << s.id << " completed: " << path << std::endl;
    };
    hooks.on_termination = [](const UploadSession& s)
    {
        std::cout << "upload " << s.id << " terminated" << std::endl;
    };
    return hooks;
}
} // namespace tusvault

int main(int argc, char* argv[])
{
    if (argc != 3 && argc != 4)
    {
        std::cerr << "Usage: " << argv[0] << " <address> <port> [config.yaml]\n";
        std::cerr << "  For IPv4, try:\n";
        std::cerr << "    tusvault_server 0.0.0.0 8080\n";
        std::cerr << "  For IPv6, try:\n";
        std::cerr << "    tusvault_server 0::0 8080 tusvault.yaml\n";

        return EXIT_FAILURE;
    }

    tusvault::Config config;
    try
    {
        if (argc == 4)
            config = tusvault::LoadConfigFromYaml(argv[3]);
        else
            tusvault::Validate(config);
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        auto const address = asio::ip::make_address(argv[1]);
        unsigned short port = static_cast<unsigned short>(std::atoi(argv[2]));

        asio::io_context ioc{static_cast<int>(config.threads)};

        tusvault::ProtocolEngine engine(config, tusvault::Logging_Hooks());
        tusvault::TusHandler handler(engine);
        tusvault::CleanupScheduler scheduler(ioc, engine);

        tcp::acceptor acceptor{ioc, {address, port}};
        tusvault::http_server(ioc, acceptor, handler, config);
        scheduler.Start();

        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](beast::error_code, int sig)
        {
            std::cout << "signal " << sig << " received, shutting down" << std::endl;
            scheduler.Stop();
            ioc.stop();
        });

        std::cout << "tusvault listening on " << address << ":" << port << config.mount_path << std::endl;

        std::vector<std::thread> workers;
        workers.reserve(config.threads - 1);
        for (unsigned i = 1; i < config.threads; ++i)
            workers.emplace_back([&ioc] { ioc.run(); });
        ioc.run();

        for (auto& t : workers)
            t.join();
    }
    catch (std::exception const& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
