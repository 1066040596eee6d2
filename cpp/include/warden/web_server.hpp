#pragma once

#include "services.hpp"
#include <boost/beast/http.hpp>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

namespace warden
{
    namespace http = boost::beast::http;

    using HttpRequest = http::request<http::string_body>;
    using HttpResponse = http::response<http::string_body>;

    /** HTTP status for an error category (Cancelled maps to 499). */
    unsigned status_for(ErrorCode code);

    /** JSON response `{"error": ..., "reason"|"required": ...}` for an error. */
    HttpResponse error_response(const WardenError &error, unsigned version = 11);

    /**
     * Administrative API over the core services. Transport-free so routes can
     * be exercised without a socket.
     */
    class ApiRouter
    {
    public:
        explicit ApiRouter(std::shared_ptr<const Services> services);

        HttpResponse handle(const HttpRequest &req, std::stop_token stop = {}) const;

    private:
        std::shared_ptr<const Services> services_;
    };

    struct WebServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{3000};
        std::size_t threads{std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4};
    };

    /**
     * HTTP server using Boost.Beast. Each connection is a session on its own
     * strand; requests are routed through ApiRouter.
     */
    class WebServer
    {
    public:
        WebServer(const WebServerConfig &cfg, std::shared_ptr<const Services> services);
        ~WebServer();

        /** Start the server and block until stopped. */
        void run();

        /** Request a stop; in-flight pipelines observe cancellation. */
        void stop();

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}
