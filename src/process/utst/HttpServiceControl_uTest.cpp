/**
 * @file HttpServiceControl_uTest.cpp
 * @brief Unit tests for arbiter::process::HttpServiceControl.
 *
 * Notes:
 *  - Body parsing is tested directly; endpoint wiring against a loopback server.
 */

#include "src/process/inc/HttpServiceControl.hpp"
#include "src/process/utst/LoopbackHttpServer.hpp"

#include <gtest/gtest.h>

#include <string>

using arbiter::process::ControlPlaneConfig;
using arbiter::process::ControlPlaneStatus;
using arbiter::process::HttpServiceControl;
using arbiter::process::parseControlPlaneStatus;
using arbiter::process::parseSwitchResponse;
using arbiter::process::ServiceType;
using arbiter::process::test::LoopbackHttpServer;

using namespace std::chrono_literals;

/* ----------------------------- Parsing Tests ----------------------------- */

/** @test Status body maps wire names to service types. */
TEST(ControlPlaneParseTest, Status) {
  const ControlPlaneConfig CFG{};
  const ControlPlaneStatus STATUS = parseControlPlaneStatus(
      R"({"ollama": {"running": true, "pid": 321}, "comfyui": {"running": false, "pid": null},
          "current_service": "ollama"})",
      CFG);
  EXPECT_TRUE(STATUS.reachable);
  EXPECT_TRUE(STATUS.primary.running);
  EXPECT_EQ(STATUS.primary.pid, 321);
  EXPECT_FALSE(STATUS.secondary.running);
  EXPECT_FALSE(STATUS.secondary.pid.has_value());
  EXPECT_EQ(STATUS.currentService, ServiceType::Primary);
}

/** @test Unknown or null current service is empty. */
TEST(ControlPlaneParseTest, NoCurrentService) {
  const ControlPlaneConfig CFG{};
  EXPECT_FALSE(parseControlPlaneStatus(R"({"current_service": null})", CFG)
                   .currentService.has_value());
  EXPECT_FALSE(parseControlPlaneStatus(R"({"current_service": "whisper"})", CFG)
                   .currentService.has_value());
}

/** @test Custom wire names are honoured. */
TEST(ControlPlaneParseTest, CustomNames) {
  ControlPlaneConfig cfg{};
  cfg.serviceNames[1] = "sdxl";
  const auto STATUS =
      parseControlPlaneStatus(R"({"sdxl": {"running": true}, "current_service": "sdxl"})", cfg);
  EXPECT_TRUE(STATUS.secondary.running);
  EXPECT_EQ(STATUS.currentService, ServiceType::Secondary);
}

/** @test switch_time is reported in seconds and converted. */
TEST(ControlPlaneParseTest, SwitchResponse) {
  const auto OK = parseSwitchResponse(R"({"success": true, "switch_time": 4.25})");
  EXPECT_TRUE(OK.success);
  EXPECT_DOUBLE_EQ(OK.switchTimeMs, 4250.0);

  const auto FAILED = parseSwitchResponse(R"({"success": false, "message": "busy"})");
  EXPECT_FALSE(FAILED.success);
  EXPECT_EQ(FAILED.message, "busy");
  EXPECT_NE(FAILED.toString().find("busy"), std::string::npos);

  EXPECT_TRUE(parseSwitchResponse("{}").success);
}

/** @test JSON rendering of the status. */
TEST(ControlPlaneParseTest, StatusToJson) {
  ControlPlaneStatus status{};
  status.reachable = true;
  status.primary.running = true;
  status.primary.pid = 7;
  status.currentService = ServiceType::Primary;
  const std::string JSON = status.toJson();
  EXPECT_NE(JSON.find("\"primary\":{\"running\":true,\"pid\":7}"), std::string::npos);
  EXPECT_NE(JSON.find("\"current_service\":\"primary\""), std::string::npos);
  EXPECT_NE(JSON.find("\"secondary\":{\"running\":false,\"pid\":null}"), std::string::npos);
}

/* ----------------------------- Endpoint Tests ----------------------------- */

/** @test Calls hit the documented endpoints with encoded service names. */
TEST(HttpServiceControlTest, Endpoints) {
  LoopbackHttpServer server([](const std::string& line) {
    if (line == "GET /process/status") {
      return LoopbackHttpServer::respond(
          200, R"({"ollama":{"running":false},"comfyui":{"running":true,"pid":9},)"
               R"("current_service":"comfyui"})");
    }
    if (line.rfind("POST /process/switch", 0) == 0) {
      return LoopbackHttpServer::respond(200, R"({"success":true,"switch_time":1.5})");
    }
    return LoopbackHttpServer::respond(200, R"({"success":true})");
  });

  ControlPlaneConfig cfg{};
  cfg.controlPlaneUrl = server.url("/");
  HttpServiceControl control(cfg);

  EXPECT_TRUE(control.apiAvailable());
  const auto SWITCHED = control.switchService(ServiceType::Secondary);
  EXPECT_TRUE(SWITCHED.success);
  EXPECT_DOUBLE_EQ(SWITCHED.switchTimeMs, 1500.0);
  EXPECT_TRUE(control.stopService(ServiceType::Primary));
  EXPECT_TRUE(control.startService(ServiceType::Primary));

  const auto STATUS = control.status();
  EXPECT_TRUE(STATUS.reachable);
  EXPECT_EQ(STATUS.currentService, ServiceType::Secondary);
  EXPECT_EQ(STATUS.secondary.pid, 9);

  const auto REQUESTS = server.requests();
  ASSERT_EQ(REQUESTS.size(), 5U);
  EXPECT_EQ(REQUESTS[0], "GET /");
  EXPECT_EQ(REQUESTS[1], "POST /process/switch?service=comfyui");
  EXPECT_EQ(REQUESTS[2], "POST /process/stop?service=ollama");
  EXPECT_EQ(REQUESTS[3], "POST /process/start?service=ollama");
  EXPECT_EQ(REQUESTS[4], "GET /process/status");
}

/** @test HTTP errors from the control plane become failed results. */
TEST(HttpServiceControlTest, ServerErrors) {
  LoopbackHttpServer server(
      [](const std::string&) { return LoopbackHttpServer::respond(500, "down"); });
  ControlPlaneConfig cfg{};
  cfg.controlPlaneUrl = server.url();
  HttpServiceControl control(cfg);

  EXPECT_FALSE(control.apiAvailable());
  const auto SWITCHED = control.switchService(ServiceType::Primary);
  EXPECT_FALSE(SWITCHED.success);
  EXPECT_NE(SWITCHED.message.find("500"), std::string::npos);
  EXPECT_FALSE(control.stopService(ServiceType::Primary));
  EXPECT_FALSE(control.status().reachable);
}

/** @test Empty control-plane URL disables every mutation. */
TEST(HttpServiceControlTest, Disabled) {
  HttpServiceControl control(ControlPlaneConfig{});
  EXPECT_FALSE(control.apiAvailable());
  EXPECT_FALSE(control.switchService(ServiceType::Primary).success);
  EXPECT_FALSE(control.startService(ServiceType::Primary));
  EXPECT_FALSE(control.status().reachable);
}

/** @test Health probes go straight to the service. */
TEST(HttpServiceControlTest, HealthProbe) {
  LoopbackHttpServer server([](const std::string& line) {
    return LoopbackHttpServer::respond(line == "GET /api/tags" ? 200 : 404, "{}");
  });
  ControlPlaneConfig cfg{};
  cfg.healthUrls[0] = server.url("/api/tags");
  cfg.healthUrls[1] = server.url("/system_stats");
  cfg.healthTimeout = 1s;
  HttpServiceControl control(cfg);

  EXPECT_TRUE(control.serviceHealthy(ServiceType::Primary));
  EXPECT_FALSE(control.serviceHealthy(ServiceType::Secondary));
  EXPECT_TRUE(control.serviceHealthy(ServiceType::Other));
}
