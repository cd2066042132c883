#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "fightcast/app.hpp"

namespace {

constexpr const char* kRecords = R"({
  "competitors": [
    {"id": "a", "name": "Alpha", "homeRegion": "Korea"},
    {"id": "b", "name": "Bravo"},
    {"id": "c", "name": "Charlie"},
    {"id": "rookie", "name": "Rookie"}
  ],
  "bouts": [
    {"id": "e1", "date": "2022-01-15", "competitorA": "a", "competitorB": "b", "weightClass": "Lightweight",
     "outcome": "win_a", "method": "KO/TKO", "finishRound": 1},
    {"id": "e2", "date": "2022-08-20", "competitorA": "b", "competitorB": "c", "weightClass": "Lightweight",
     "outcome": "win_a", "method": "Decision - Unanimous"},
    {"id": "e3", "date": "2023-03-04", "competitorA": "c", "competitorB": "a", "weightClass": "Lightweight",
     "outcome": "win_b", "method": "KO/TKO", "finishRound": 2},
    {"id": "e4", "date": "2023-05-01", "competitorA": "a", "competitorB": "ghost", "outcome": "win_a",
     "method": "Decision"}
  ]
})";

fightcast::AppConfig TestConfig(unsigned short port, const std::string& record_path) {
  fightcast::AppConfig cfg{};
  cfg.port = port;
  cfg.db_host = "localhost";
  cfg.db_port = 3306;
  cfg.db_user = "app";
  cfg.db_password = "app_pass";
  cfg.db_name = "fightcast";
  cfg.log_level = "warn";
  cfg.record_source = "json";
  cfg.record_path = record_path;
  cfg.persist_ratings = false;
  return cfg;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

void ExpectSuccessEnvelope(const nlohmann::json& body) {
  ASSERT_TRUE(body.is_object());
  EXPECT_TRUE(body["success"].get<bool>());
  ASSERT_TRUE(body.contains("data"));
  EXPECT_TRUE(body["data"].is_object());
  EXPECT_TRUE(body["error"].is_null());
  EXPECT_TRUE(body["meta"].is_object());
}

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  EXPECT_TRUE(body["data"].is_null());
  ASSERT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
}

class PredictionApiFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    record_path_ = std::filesystem::temp_directory_path() / "fightcast_e2e_records.json";
    std::ofstream(record_path_) << kRecords;
    config_ = TestConfig(18091, record_path_.string());
    app_ = std::make_unique<fightcast::ServerApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
    std::error_code ec;
    std::filesystem::remove(record_path_, ec);
  }

  SimpleHttpResponse Send(boost::beast::http::verb verb, const std::string& target, const std::string& body = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!body.empty()) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body;
      req.prepare_payload();
    }
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  SimpleHttpResponse Get(const std::string& target) { return Send(boost::beast::http::verb::get, target); }
  SimpleHttpResponse Post(const std::string& target, const std::string& body) {
    return Send(boost::beast::http::verb::post, target, body);
  }

  std::filesystem::path record_path_;
  fightcast::AppConfig config_;
  std::unique_ptr<fightcast::ServerApp> app_;
  std::thread server_thread_;
};

}  // namespace

TEST_F(PredictionApiFixture, HealthReportsRatedCompetitorsAfterStartupReplay) {
  auto health = Get("/api/health");
  ASSERT_EQ(health.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(health.body);
  EXPECT_EQ(health.body["data"]["status"], "ok");
  EXPECT_EQ(health.body["data"]["ratedCompetitors"], 3);
}

TEST_F(PredictionApiFixture, PredictReturnsResultAndNarrative) {
  auto res = Post("/api/predict", R"({"competitorA": "a", "competitorB": "c", "asOf": "2023-06-01"})");
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(res.body);
  const auto& data = res.body["data"];
  EXPECT_FALSE(data["refused"].get<bool>());
  EXPECT_EQ(data["winner"], "a");
  EXPECT_TRUE(data["method"].is_string());
  ASSERT_TRUE(data["narrative"].is_array());
  ASSERT_FALSE(data["narrative"].empty());
  EXPECT_EQ(data["narrative"][0].get<std::string>().rfind("Alpha", 0), 0u);
  EXPECT_TRUE(data["factors"].is_array());
}

TEST_F(PredictionApiFixture, CardPredictsAllBoutsAtEventDate) {
  auto res = Post("/api/card", R"({"eventName": "Fight Night", "eventDate": "2023-06-01",
                                   "bouts": [{"competitorA": "a", "competitorB": "c"},
                                             {"competitorA": "rookie", "competitorB": "b"}]})");
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(res.body);
  const auto& data = res.body["data"];
  EXPECT_EQ(data["eventName"], "Fight Night");
  EXPECT_EQ(data["eventDate"], "2023-06-01");
  EXPECT_EQ(data["refused"], 1);
  ASSERT_EQ(data["predictions"].size(), 2u);
  EXPECT_EQ(data["predictions"][0]["winner"], "a");
  EXPECT_TRUE(data["predictions"][0]["keyDimensions"].is_array());
  EXPECT_TRUE(data["predictions"][0]["methodConfidence"].is_string());
  EXPECT_EQ(data["predictions"][0]["narrative"][0].get<std::string>().rfind("Alpha", 0), 0u);
  EXPECT_EQ(data["predictions"][1]["refusal"]["kind"], "insufficient_history");

  auto empty = Post("/api/card", R"({"eventName": "Empty", "bouts": []})");
  EXPECT_EQ(empty.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(empty.body, "bad_request");

  auto bad_bout = Post("/api/card", R"({"bouts": [{"competitorA": "a", "competitorB": "c"}, {"competitorA": "a"}]})");
  EXPECT_EQ(bad_bout.status, boost::beast::http::status::bad_request);
  EXPECT_EQ(bad_bout.body["error"]["detail"]["index"], 1);
}

TEST_F(PredictionApiFixture, DebutAndUnknownCompetitorsAreRefused) {
  auto debut = Post("/api/predict", R"({"competitorA": "rookie", "competitorB": "a", "asOf": "2023-06-01"})");
  ASSERT_EQ(debut.status, boost::beast::http::status::ok);
  EXPECT_TRUE(debut.body["data"]["refused"].get<bool>());
  EXPECT_EQ(debut.body["data"]["refusal"]["kind"], "insufficient_history");
  EXPECT_TRUE(debut.body["data"]["winner"].is_null());

  auto unknown = Post("/api/predict", R"({"competitorA": "a", "competitorB": "ghost", "asOf": "2023-06-01"})");
  ASSERT_EQ(unknown.status, boost::beast::http::status::ok);
  EXPECT_EQ(unknown.body["data"]["refusal"]["kind"], "unknown_competitor");
}

TEST_F(PredictionApiFixture, BadRequestsAreRejected) {
  auto broken = Post("/api/predict", "{not json");
  EXPECT_EQ(broken.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(broken.body, "bad_request");

  auto missing = Post("/api/predict", R"({"competitorA": "a"})");
  EXPECT_EQ(missing.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(missing.body, "bad_request");

  auto no_competitor = Get("/api/ratings");
  EXPECT_EQ(no_competitor.status, boost::beast::http::status::bad_request);

  auto range = Get("/api/backtest?cutoff=2023-01-01&count=0");
  EXPECT_EQ(range.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(range.body, "backtest_range");

  auto unknown_path = Get("/api/unknown");
  EXPECT_EQ(unknown_path.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(unknown_path.body, "not_found");
}

TEST_F(PredictionApiFixture, RatingsEndpointDecaysAtRequestedDate) {
  auto stored = Get("/api/ratings?competitor=a");
  ASSERT_EQ(stored.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(stored.body);
  EXPECT_EQ(stored.body["data"]["competitorId"], "a");
  auto stored_value = stored.body["data"]["knockout_power.value"].get<double>();

  auto later = Get("/api/ratings?competitor=a&asOf=2028-01-01");
  ASSERT_EQ(later.status, boost::beast::http::status::ok);
  EXPECT_LT(later.body["data"]["knockout_power.value"].get<double>(), stored_value);

  auto missing = Get("/api/ratings?competitor=rookie");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(missing.body, "competitor_not_rated");
}

TEST_F(PredictionApiFixture, ReplayBacktestAndMetrics) {
  auto replay = Post("/api/replay", "");
  ASSERT_EQ(replay.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(replay.body);
  EXPECT_EQ(replay.body["data"]["source"], "json");
  EXPECT_EQ(replay.body["data"]["warnings"].size(), 1u);
  EXPECT_FALSE(replay.body["data"]["persisted"].get<bool>());

  auto backtest = Get("/api/backtest?cutoff=2023-01-01&count=10");
  ASSERT_EQ(backtest.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(backtest.body);
  EXPECT_EQ(backtest.body["data"]["evaluated"], 1);
  EXPECT_EQ(backtest.body["data"]["skipped"], 1);

  Post("/api/predict", R"({"competitorA": "rookie", "competitorB": "a"})");
  auto metrics = Get("/metrics");
  ASSERT_EQ(metrics.status, boost::beast::http::status::ok);
  ExpectSuccessEnvelope(metrics.body);
  EXPECT_GE(metrics.body["data"]["replays_total"].get<std::uint64_t>(), 2u);
  EXPECT_GE(metrics.body["data"]["refusals_total"].get<std::uint64_t>(), 1u);
  EXPECT_GE(metrics.body["data"]["request_total"].get<std::uint64_t>(), 3u);
}
