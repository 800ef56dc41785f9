#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <sstream>
#include <string>

#include <lapcmp/report.hpp>

using namespace lapcmp;

static Comparison small_comparison() {
  Comparison c{};
  c.circuit.x = {0.0, 1.5};
  c.circuit.y = {2.0, -3.0};
  c.circuit.colors = {"#0600EF", "#DC0000"};

  c.pilot1.name = "VER";
  c.pilot1.lap = 10;
  c.pilot1.color = "#0600EF";
  c.pilot1.distance = {0.0, 10.0};
  c.pilot1.x = c.circuit.x;
  c.pilot1.y = c.circuit.y;
  c.pilot1.speed = {200.0, 210.0};
  c.pilot1.throttle = {100.0, 100.0};
  c.pilot1.brake = {0.0, 0.0};

  c.pilot2 = c.pilot1;
  c.pilot2.name = "LEC";
  c.pilot2.color = "#DC0000";
  c.pilot2.speed = {205.0, 190.0};
  c.pilot2.throttle.clear();
  c.pilot2.brake.clear();

  c.delta = {0.0, -0.25};
  c.metadata.rotation_deg = 40;
  c.metadata.aspect_ratio = 2.5;
  return c;
}

TEST_CASE("write_comparison_json emits every section") {
  std::ostringstream os;
  write_comparison_json(os, small_comparison());
  const std::string s = os.str();

  REQUIRE(s.find("\"circuit\": {\"x\":[0,1.5],\"y\":[2,-3],\"colors\":[\"#0600EF\",\"#DC0000\"]}") != std::string::npos);
  REQUIRE(s.find("\"pilot1\": {\"name\":\"VER\",\"lap\":10,\"color\":\"#0600EF\"") != std::string::npos);
  REQUIRE(s.find("\"pilot2\": {\"name\":\"LEC\"") != std::string::npos);
  REQUIRE(s.find("\"throttle\":[]") != std::string::npos);
  REQUIRE(s.find("\"delta\": [0,-0.25]") != std::string::npos);
  REQUIRE(s.find("\"metadata\": {\"rotation\":40,\"aspect_ratio\":2.5}") != std::string::npos);
}

TEST_CASE("non-finite numbers are written as null") {
  auto c = small_comparison();
  c.metadata.aspect_ratio = std::numeric_limits<double>::infinity();
  std::ostringstream os;
  write_comparison_json(os, c);
  REQUIRE(os.str().find("\"aspect_ratio\":null") != std::string::npos);
}

TEST_CASE("driver names are escaped") {
  auto c = small_comparison();
  c.pilot1.name = "A\"B";
  std::ostringstream os;
  write_comparison_json(os, c);
  REQUIRE(os.str().find("\"name\":\"A\\\"B\"") != std::string::npos);
}

TEST_CASE("write_dominance_json lists drivers and segment colors") {
  Dominance d{};
  d.x = {0.0, 1.0, 2.0};
  d.y = {0.0, 0.0, 1.0};
  d.colors = {"#A259F7", "#00B4D8"};
  d.drivers = {{"VER", "#A259F7"}, {"NOR", "#00B4D8"}};
  d.metadata.rotation_deg = 0;
  d.metadata.aspect_ratio = 2.0;

  std::ostringstream os;
  write_dominance_json(os, d);
  const std::string s = os.str();
  REQUIRE(s.find("\"colors\": [\"#A259F7\",\"#00B4D8\"]") != std::string::npos);
  REQUIRE(s.find("\"drivers\": [{\"driver\":\"VER\",\"color\":\"#A259F7\"},{\"driver\":\"NOR\",\"color\":\"#00B4D8\"}]") != std::string::npos);
  REQUIRE(s.find("\"metadata\": {\"rotation\":0,\"aspect_ratio\":2}") != std::string::npos);
}

TEST_CASE("write_comparison_csv writes one row per checkpoint") {
  std::ostringstream os;
  write_comparison_csv(os, small_comparison());
  std::istringstream in(os.str());
  std::string header, row1, row2, extra;
  REQUIRE(std::getline(in, header));
  REQUIRE(std::getline(in, row1));
  REQUIRE(std::getline(in, row2));
  REQUIRE_FALSE(std::getline(in, extra));

  REQUIRE(header == "distance,x,y,color,VER_speed,VER_throttle,VER_brake,LEC_speed,LEC_throttle,LEC_brake,delta");
  REQUIRE(row1 == "0,0,2,#0600EF,200,100,0,205,,,0");
  REQUIRE(row2 == "10,1.5,-3,#DC0000,210,100,0,190,,,-0.25");
}

TEST_CASE("save functions fail on an unwritable path") {
  const auto c = small_comparison();
  REQUIRE_FALSE(save_comparison_json("/nonexistent-dir/out.json", c));
  REQUIRE_FALSE(save_comparison_csv("/nonexistent-dir/out.csv", c));
  REQUIRE_FALSE(save_dominance_json("/nonexistent-dir/out.json", Dominance{}));
}
