#include "RESTServer.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

using namespace ppeAI;

namespace {

constexpr int kTestPort = 18573;

// Runs the server on a background thread for the lifetime of the fixture
class RESTServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        AppConfig config;
        config.server.host = "127.0.0.1";
        config.server.port = kTestPort;
        server_ = std::make_unique<RESTServer>(config);
        thread_ = std::thread([this] { server_->start(); });
    }

    void TearDown() override {
        server_->stop();
        thread_.join();
    }

    http::response<http::string_body> send(http::verb method, const std::string& target,
                                           const std::string& body = "") {
        net::io_context ioc;
        tcp::socket socket(ioc);
        tcp::endpoint endpoint(net::ip::make_address("127.0.0.1"), kTestPort);

        // The listener comes up asynchronously
        beast::error_code ec;
        for (int attempt = 0; attempt < 100; ++attempt) {
            socket.connect(endpoint, ec);
            if (!ec) {
                break;
            }
            socket.close();
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (ec) {
            throw beast::system_error(ec);
        }

        http::request<http::string_body> request(method, target, 11);
        request.set(http::field::host, "127.0.0.1");
        request.set(http::field::content_type, "application/json");
        request.body() = body;
        request.prepare_payload();
        http::write(socket, request);

        beast::flat_buffer buffer;
        http::response<http::string_body> response;
        http::read(socket, buffer, response);
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    std::unique_ptr<RESTServer> server_;
    std::thread thread_;
};

} // namespace

TEST_F(RESTServerTest, HealthReportsOk) {
    auto response = send(http::verb::get, "/health");
    EXPECT_EQ(response.result(), http::status::ok);
}

TEST_F(RESTServerTest, ConfigOnlyAcceptsGet) {
    EXPECT_EQ(send(http::verb::get, "/config").result(), http::status::ok);
    EXPECT_EQ(send(http::verb::post, "/config", "{}").result(), http::status::method_not_allowed);
    EXPECT_EQ(send(http::verb::delete_, "/config").result(), http::status::method_not_allowed);
}

TEST_F(RESTServerTest, AnalyzeOnlyAcceptsPost) {
    EXPECT_EQ(send(http::verb::get, "/analyze").result(), http::status::method_not_allowed);
}

TEST_F(RESTServerTest, UnknownPathIsNotFound) {
    EXPECT_EQ(send(http::verb::get, "/nothing-here").result(), http::status::not_found);
}

TEST_F(RESTServerTest, AnalyzeRejectsOutOfRangeCoordinates) {
    std::string body = R"({"detections": [{"class_name": "person", "confidence": 0.9,
        "bbox": {"x1": 0, "y1": 0, "x2": 1e12, "y2": 10}}]})";

    EXPECT_EQ(send(http::verb::post, "/analyze", body).result(), http::status::bad_request);
}

TEST_F(RESTServerTest, AnalyzeReturnsSummaryForLargeBoxes) {
    std::string body = R"({"detections": [
        {"class_name": "person", "confidence": 0.9, "bbox": {"x1": 0, "y1": 0, "x2": 100000, "y2": 100000}},
        {"class_name": "vest", "confidence": 0.9, "bbox": {"x1": 0, "y1": 0, "x2": 100000, "y2": 60000}}
    ]})";

    auto response = send(http::verb::post, "/analyze", body);

    ASSERT_EQ(response.result(), http::status::ok);
    nlohmann::json report = nlohmann::json::parse(response.body());
    EXPECT_EQ(report["summary"]["vest"]["wearing"], 1);
}
