#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "edgetrp/core/error.hpp"
#include "edgetrp/core/logging.hpp"
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include "edgetrp/core/share_evaluator.hpp"
#include "test_utils.hpp"

using namespace edgetrp::core;
using namespace edgetrp::core::test;

namespace {
// Routes the library logger into a string for the lifetime of the object.
class CapturedLog {
public:
  CapturedLog() {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
    auto lg = std::make_shared<spdlog::logger>(kLoggerName, sink);
    lg->set_pattern("%l %v");
    lg->set_level(spdlog::level::debug);
    set_logger(lg);
  }
  ~CapturedLog() { set_logger(nullptr); }

  [[nodiscard]] std::string text() const { return out_.str(); }

private:
  std::ostringstream out_;
};
} // namespace

TEST(ErrorHandling, ModelErrorCarriesItsKey) {
  const FleetIntegrityError e("cohort quantity is NaN", "EUR", "Car|BEV", 2030);
  EXPECT_EQ(e.region(), "EUR");
  EXPECT_EQ(e.node(), "Car|BEV");
  EXPECT_EQ(e.year(), 2030);
  EXPECT_EQ(std::string(e.what()), "cohort quantity is NaN [region=EUR, node=Car|BEV, year=2030]");

  const CalibrationDataGapError gap("nothing observed", "", "", 0);
  EXPECT_EQ(std::string(gap.what()), "nothing observed [region=-]");
}

TEST(ErrorHandling, HierarchyAllowsCatchingByBase) {
  EXPECT_THROW(throw DegenerateNestError("x", "EUR", "root", 2010), ModelError);
  EXPECT_THROW(throw ClusteringIndicatorMissingError("x", "EUR", "", 0), std::runtime_error);
  EXPECT_THROW(throw ConfigError("bad"), ValueError);
}

TEST(ErrorHandling, DroppedSubNestIsLogged) {
  auto t = make_passenger_nest();
  PriceTable prices;
  ValueOfTimeTable vot;
  insert_passenger_prices(prices, vot, "EUR", 2010);
  PriceTable no_bus;
  ValueOfTimeTable no_bus_vot;
  no_bus.insert("EUR", "Walk", "Walk", 2010, PriceRecord{0.0, 0.0, 0.0});
  no_bus.insert("EUR", "Large Car", "Liquids", 2010, PriceRecord{0.25, 0.02, 2.0});
  no_bus_vot.insert("EUR", "Walk", 2010, 1.2);
  no_bus_vot.insert("EUR", "Large Car", 2010, 0.1);
  std::vector<double> pref(static_cast<std::size_t>(t.num_nodes()), 1.0);

  CapturedLog log;
  auto ev = evaluate_shares(t, no_bus, no_bus_vot, pref, "EUR", 2010);
  EXPECT_EQ(ev.share[static_cast<std::size_t>(node(t, "Bus"))], 0.0);
  const auto text = log.text();
  EXPECT_NE(text.find("warning dropping 'Bus' in EUR (2010)"), std::string::npos) << text;

  auto full = evaluate_shares(t, prices, vot, pref, "EUR", 2010);
  EXPECT_TRUE(full.excluded.empty());
}

TEST(ErrorHandling, SetLoggerNullRestoresDefault) {
  {
    CapturedLog log;
    EXPECT_NE(logger(), nullptr);
  }
  ASSERT_NE(logger(), nullptr);
  EXPECT_EQ(logger()->name(), kLoggerName);
}

TEST(ErrorHandling, LoggingWhileLoggerIsReplaced) {
  std::vector<std::thread> writers;
  for (int i = 0; i < 4; ++i) {
    writers.emplace_back([i] {
      for (int k = 0; k < 2000; ++k) logger()->debug("writer {} message {}", i, k);
    });
  }
  // Null sinks: a writer may still hold the previous logger after the swap.
  for (int k = 0; k < 200; ++k) {
    auto lg = std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::null_sink_mt>());
    lg->set_level(spdlog::level::debug);
    set_logger(lg);
    EXPECT_TRUE(logger() != nullptr);
  }
  for (auto& w : writers) w.join();
  set_logger(nullptr);
  EXPECT_EQ(logger()->name(), kLoggerName);
}
