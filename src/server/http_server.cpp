#include "http_server.hpp"

#include "result_json.hpp"

#include <exception>
#include <format>
#include <print>

HttpServer::HttpServer(TranscriptionService& service, size_t max_body_bytes, int read_timeout_s)
    : service_(service), max_body_bytes_(max_body_bytes) {
    srv_.set_payload_max_length(max_body_bytes);
    srv_.set_read_timeout(read_timeout_s, 0);
    setup_routes_();
}

void HttpServer::setup_routes_() {
    srv_.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        service_.handle_health(req, res);
    });

    // Any path accepts audio.
    srv_.Post(".*", [this](const httplib::Request& req, httplib::Response& res) {
        service_.handle_transcribe(req, res);
    });

    srv_.set_exception_handler([](const httplib::Request&, httplib::Response& res,
                                  std::exception_ptr ep) {
        std::string message = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            // Non-std exception: reported with the generic message above.
        }
        std::println(stderr, "[kikitori-server] handler error: {}", message);
        res.status = 200;
        res.set_content(dump_json(error_json(message)), kJsonContentType);
    });

    srv_.set_error_handler([this](const httplib::Request&, httplib::Response& res) {
        if (res.status == 413) {
            res.set_content(dump_json(error_json(std::format(
                                "request body exceeds limit of {} bytes", max_body_bytes_))),
                            kJsonContentType);
        } else if (res.body.empty()) {
            res.set_content(std::format("{} {}\n", res.status, httplib::status_message(res.status)),
                            "text/plain; charset=utf-8");
        }
    });

    srv_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::println(stderr, "[kikitori-server] \"{} {} {}\" {}", req.method, req.path,
                     req.version, res.status);
    });
}

bool HttpServer::bind(const std::string& host, uint16_t port) {
    if (port == 0) {
        int bound = srv_.bind_to_any_port(host);
        if (bound < 0) {
            std::println(stderr, "[kikitori-server] cannot listen on {}:0", host);
            return false;
        }
        port_ = static_cast<uint16_t>(bound);
        return true;
    }

    if (!srv_.bind_to_port(host, port)) {
        std::println(stderr, "[kikitori-server] cannot listen on {}:{}", host, port);
        return false;
    }
    port_ = port;
    return true;
}

bool HttpServer::run() {
    return srv_.listen_after_bind();
}

void HttpServer::stop() {
    srv_.stop();
}
