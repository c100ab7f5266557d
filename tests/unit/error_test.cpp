#include <catch2/catch_all.hpp>
#include <gleaner/error.hpp>
#include <gleaner/logging.hpp>
#include <tests/support/test_models.hpp>

#include <fstream>
#include <sstream>

using namespace gleaner;

TEST_CASE("error codes have stable names", "[error]") {
  using core::error_code;
  REQUIRE(core::to_string(error_code::embedding_unavailable) == "embedding_unavailable");
  REQUIRE(core::to_string(error_code::dimension_mismatch) == "dimension_mismatch");
  REQUIRE(core::to_string(error_code::ingestion_failed) == "ingestion_failed");
  REQUIRE(core::to_string(error_code::config_invalid) == "config_invalid");
}

TEST_CASE("only embedding outages and timeouts are transient", "[error]") {
  using core::error_code;
  REQUIRE(core::is_transient(core::error{error_code::embedding_unavailable, "", ""}));
  REQUIRE(core::is_transient(core::error{error_code::timeout, "", ""}));
  REQUIRE_FALSE(core::is_transient(core::error{error_code::dimension_mismatch, "", ""}));
  REQUIRE_FALSE(core::is_transient(core::error{error_code::io_failed, "", ""}));

  std::expected<int, core::error> e = core::make_unexpected(error_code::not_found, "gone", "index");
  REQUIRE_FALSE(e.has_value());
  REQUIRE(e.error().component == "index");
}

TEST_CASE("logging rejects unknown levels and writes to a file", "[logging]") {
  auto bad = log::configure(log::logging_settings{"chatty", ""});
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == core::error_code::config_invalid);

  test_support::temp_dir tmp("logging");
  const auto file = tmp / "gleaner.log";
  REQUIRE(log::configure(log::logging_settings{"debug", file.string()}).has_value());
  log::get()->debug("[test] hello {}", 42);
  log::get()->flush();
  std::ifstream in(file);
  std::stringstream body;
  body << in.rdbuf();
  REQUIRE_THAT(body.str(), Catch::Matchers::ContainsSubstring("[test] hello 42"));

  REQUIRE(log::configure(log::logging_settings{}).has_value());
}
