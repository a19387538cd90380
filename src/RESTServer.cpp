#include "RESTServer.hpp"
#include "Annotator.hpp"
#include "CompliancePipeline.hpp"
#include "ReportJson.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>
#include <memory>
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>
#include <vector>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

namespace {
    // Base64 decoding table
    const unsigned char base64_table[256] = {
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 62, 64, 64, 64, 63,
        52, 53, 54, 55, 56, 57, 58, 59, 60, 61, 64, 64, 64, 64, 64, 64,
        64,  0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14,
        15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, 64, 64, 64, 64, 64,
        64, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40,
        41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
        64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64
    };

    const char base64_chars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::vector<unsigned char> base64_decode(const std::string& input) {
        if (input.size() < 4)
            return std::vector<unsigned char>();

        // Remove any padding characters
        size_t padding = 0;
        if (input[input.size() - 1] == '=') padding++;
        if (input[input.size() - 2] == '=') padding++;

        // Calculate output size
        std::vector<unsigned char> decoded((input.size() * 3) / 4 - padding);
        size_t i = 0, j = 0;

        // Process groups of 4 characters
        while (i < input.size() - padding) {
            uint32_t triple = 0;
            for (int k = 0; k < 4; k++) {
                triple <<= 6;
                if (i < input.size() && input[i] != '=')
                    triple |= base64_table[static_cast<unsigned char>(input[i])];
                i++;
            }

            // Extract bytes from triple
            if (j < decoded.size()) decoded[j++] = (triple >> 16) & 0xFF;
            if (j < decoded.size()) decoded[j++] = (triple >> 8) & 0xFF;
            if (j < decoded.size()) decoded[j++] = triple & 0xFF;
        }

        return decoded;
    }

    std::string base64_encode(const std::vector<unsigned char>& data) {
        std::string encoded;
        encoded.reserve(((data.size() + 2) / 3) * 4);

        size_t i = 0;
        for (; i + 2 < data.size(); i += 3) {
            uint32_t triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
            encoded.push_back(base64_chars[(triple >> 18) & 0x3F]);
            encoded.push_back(base64_chars[(triple >> 12) & 0x3F]);
            encoded.push_back(base64_chars[(triple >> 6) & 0x3F]);
            encoded.push_back(base64_chars[triple & 0x3F]);
        }

        // One or two trailing bytes, padded with '='
        size_t remaining = data.size() - i;
        if (remaining > 0) {
            uint32_t triple = data[i] << 16;
            if (remaining == 2) triple |= data[i + 1] << 8;
            encoded.push_back(base64_chars[(triple >> 18) & 0x3F]);
            encoded.push_back(base64_chars[(triple >> 12) & 0x3F]);
            encoded.push_back(remaining == 2 ? base64_chars[(triple >> 6) & 0x3F] : '=');
            encoded.push_back('=');
        }

        return encoded;
    }

    cv::Mat decodeImage(std::string image_base64) {
        // Remove data URL prefix if present
        size_t comma_pos = image_base64.find(',');
        if (comma_pos != std::string::npos) {
            image_base64 = image_base64.substr(comma_pos + 1);
        }

        std::vector<unsigned char> image_data = base64_decode(image_base64);
        if (image_data.empty()) {
            throw std::invalid_argument("Failed to decode base64 image");
        }

        cv::Mat image = cv::imdecode(image_data, cv::IMREAD_COLOR);
        if (image.empty()) {
            throw std::invalid_argument("Failed to decode image data");
        }
        return image;
    }

    int positiveInt(const json& body, const char* key) {
        if (!body.at(key).is_number_integer() || body.at(key).get<int>() <= 0) {
            throw std::invalid_argument(std::string("'") + key + "' must be a positive integer");
        }
        return body.at(key).get<int>();
    }
}

namespace ppeAI {

// Shared, read-only state handed to every session
struct ServiceContext {
    ServiceContext(const AppConfig& config)
        : pipeline(config.compliance),
          configJson(config.toJson()),
          jpegQuality(config.server.jpegQuality) {}

    CompliancePipeline pipeline;
    json configJson;
    int jpegQuality;
};

class RESTServer::Impl {
public:
    Impl(const AppConfig& config)
        : host_(config.server.host), port_(config.server.port),
          context_(std::make_shared<const ServiceContext>(config)),
          ioc_(), acceptor_(ioc_) {
        config.server.validate();
    }

    void start() {
        try {
            auto const address = net::ip::make_address(host_);
            tcp::endpoint endpoint{address, static_cast<unsigned short>(port_)};

            acceptor_.open(endpoint.protocol());
            acceptor_.set_option(net::socket_base::reuse_address(true));
            acceptor_.bind(endpoint);
            acceptor_.listen(net::socket_base::max_listen_connections);

            std::cout << "Starting server on http://" << host_ << ":" << port_ << std::endl;
            std::cout << "Available endpoints:" << std::endl;
            std::cout << "  GET/HEAD /health" << std::endl;
            std::cout << "    Returns: 200 OK if server is healthy" << std::endl;
            std::cout << "  GET /config" << std::endl;
            std::cout << "    Returns: JSON with the active matching configuration" << std::endl;
            std::cout << "  POST /analyze" << std::endl;
            std::cout << "    Request body: {" << std::endl;
            std::cout << "      \"detections\": [{\"class_name\", \"confidence\", \"bbox\": {\"x1\",\"y1\",\"x2\",\"y2\"}}]," << std::endl;
            std::cout << "      \"image_width\"/\"image_height\": optional bounds check," << std::endl;
            std::cout << "      \"image\": \"<optional base64_encoded_image>\"" << std::endl;
            std::cout << "    }" << std::endl;

            accept();
            ioc_.run();
        }
        catch(const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
        }
    }

    void stop() {
        ioc_.stop();
    }

private:
    void accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if(!ec) {
                    std::make_shared<Session>(std::move(socket), context_)->start();
                }
                accept();
            });
    }

    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(tcp::socket socket, std::shared_ptr<const ServiceContext> context)
            : socket_(std::move(socket)), context_(std::move(context)) {}

        void start() {
            read_request();
        }

    private:
        void read_request() {
            auto self = shared_from_this();

            http::async_read(
                socket_,
                buffer_,
                request_,
                [self](beast::error_code ec, std::size_t) {
                    if(!ec) {
                        self->process_request();
                    }
                });
        }

        void process_request() {
            response_.version(request_.version());
            response_.keep_alive(false);

            // Handle health endpoint for both HEAD and GET methods
            if(request_.target() == "/health") {
                response_.result(http::status::ok);
                response_.set(http::field::content_type, "application/json");
                if(request_.method() == http::verb::get) {
                    response_.body() = "{\"status\":\"ok\",\"service\":\"ppeAI\"}";
                }
            }
            else if(request_.target() == "/config") {
                if(request_.method() == http::verb::get) {
                    response_.result(http::status::ok);
                    response_.set(http::field::content_type, "application/json");
                    response_.body() = context_->configJson.dump();
                } else {
                    set_error(http::status::method_not_allowed, "Use GET for /config");
                }
            }
            else if(request_.target() == "/analyze") {
                if(request_.method() == http::verb::post) {
                    handle_analyze();
                } else {
                    set_error(http::status::method_not_allowed, "Use POST for /analyze");
                }
            }
            else {
                set_error(http::status::not_found, "Endpoint not found");
            }

            write_response();
        }

        void handle_analyze() {
            try {
                json req_body;
                try {
                    req_body = json::parse(request_.body());
                }
                catch(const json::parse_error& e) {
                    throw std::invalid_argument(std::string("Invalid JSON body: ") + e.what());
                }

                if(!req_body.is_object() || !req_body.contains("detections")) {
                    throw std::invalid_argument("Detections not provided");
                }
                std::vector<Detection> detections = detectionsFromJson(req_body["detections"]);

                cv::Mat image;
                cv::Size imageSize;
                if(req_body.contains("image")) {
                    if(!req_body["image"].is_string()) {
                        throw std::invalid_argument("'image' must be a base64 string");
                    }
                    image = decodeImage(req_body["image"].get<std::string>());
                    imageSize = image.size();
                }
                else if(req_body.contains("image_width") && req_body.contains("image_height")) {
                    imageSize = cv::Size(positiveInt(req_body, "image_width"),
                                         positiveInt(req_body, "image_height"));
                }

                ComplianceReport report = context_->pipeline.analyze(detections, imageSize);
                json response_json = reportToJson(report);

                if(!image.empty()) {
                    cv::Mat annotated = annotateImage(image, report.persons);
                    std::vector<unsigned char> encoded;
                    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, context_->jpegQuality};
                    if(!cv::imencode(".jpg", annotated, encoded, params)) {
                        throw std::runtime_error("Failed to encode annotated image");
                    }
                    response_json["annotated_image"] = base64_encode(encoded);
                }

                std::cout << "Analyzed " << detections.size() << " detection(s): "
                          << report.summary.total << " person(s), compliance "
                          << report.summary.complianceScore << "% ("
                          << toString(report.summary.risk) << ")" << std::endl;

                response_.result(http::status::ok);
                response_.set(http::field::content_type, "application/json");
                response_.body() = response_json.dump();
            }
            catch(const std::invalid_argument& e) {
                std::cerr << "Rejected analyze request: " << e.what() << std::endl;
                set_error(http::status::bad_request, std::string("Error: ") + e.what());
            }
            catch(const std::exception& e) {
                std::cerr << "Error processing analyze request: " << e.what() << std::endl;
                set_error(http::status::internal_server_error, std::string("Error: ") + e.what());
            }
        }

        void set_error(http::status status, const std::string& message) {
            response_.result(status);
            response_.set(http::field::content_type, "text/plain");
            response_.body() = message;
        }

        void write_response() {
            auto self = shared_from_this();

            response_.set(http::field::content_length, std::to_string(response_.body().size()));

            http::async_write(
                socket_,
                response_,
                [self](beast::error_code ec, std::size_t) {
                    self->socket_.shutdown(tcp::socket::shutdown_send, ec);
                });
        }

        tcp::socket socket_;
        std::shared_ptr<const ServiceContext> context_;
        beast::flat_buffer buffer_;
        http::request<http::string_body> request_;
        http::response<http::string_body> response_;
    };

    std::string host_;
    int port_;
    std::shared_ptr<const ServiceContext> context_;
    net::io_context ioc_;
    tcp::acceptor acceptor_;
};

RESTServer::RESTServer(const AppConfig& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

RESTServer::~RESTServer() = default;

void RESTServer::start() {
    pImpl_->start();
}

void RESTServer::stop() {
    pImpl_->stop();
}

} // namespace ppeAI
