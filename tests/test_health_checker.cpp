#include <gtest/gtest.h>
#include "meshgate/health_checker.hpp"
#include "fake_http_client.hpp"
#include <atomic>
#include <thread>

using namespace meshgate;
using namespace std::chrono_literals;
using json = nlohmann::json;

class HealthCheckerTest : public ::testing::Test {
protected:
    void SetUp() override {
        client = std::make_shared<test::FakeHttpClient>();
        config.interval = 50ms;
        config.timeout = 500ms;
    }

    ServiceInstance make_instance(const std::string& name, const std::string& id, uint16_t port) {
        ServiceInstance instance;
        instance.id = id;
        instance.name = name;
        instance.host = "localhost";
        instance.port = port;
        instance.health_endpoint = "/status";
        return instance;
    }

    ServiceRegistry registry;
    CircuitBreakerRegistry breakers;
    std::shared_ptr<test::FakeHttpClient> client;
    HealthCheckConfig config;
};

TEST_F(HealthCheckerTest, DetermineHealthExplicitStatus) {
    EXPECT_EQ(HealthChecker::determine_health(json{{"status", "healthy"}}), HealthState::Healthy);
    EXPECT_EQ(HealthChecker::determine_health(json{{"status", "degraded"}}), HealthState::Degraded);
    EXPECT_EQ(HealthChecker::determine_health(json{{"status", "unhealthy"}}), HealthState::Unhealthy);
    // Explicit status wins over resource pressure
    EXPECT_EQ(HealthChecker::determine_health(
        json{{"status", "healthy"}, {"memory", {{"percentage", 99.0}}}}), HealthState::Healthy);
}

TEST_F(HealthCheckerTest, DetermineHealthResourcePressure) {
    EXPECT_EQ(HealthChecker::determine_health(json{{"memory", {{"percentage", 95.0}}}}),
              HealthState::Degraded);
    EXPECT_EQ(HealthChecker::determine_health(json{{"memory", {{"percentage", 90.0}}}}),
              HealthState::Healthy);
    EXPECT_EQ(HealthChecker::determine_health(json{{"cpu", {{"usage", 91.5}}}}),
              HealthState::Degraded);
}

TEST_F(HealthCheckerTest, DetermineHealthDependencies) {
    EXPECT_EQ(HealthChecker::determine_health(json{{"dependencies", {{"db", true}, {"cache", true}}}}),
              HealthState::Healthy);
    EXPECT_EQ(HealthChecker::determine_health(json{{"dependencies", {{"db", true}, {"cache", false}}}}),
              HealthState::Degraded);
    EXPECT_EQ(HealthChecker::determine_health(json{{"dependencies", {{"db", false}, {"cache", false}}}}),
              HealthState::Unhealthy);
    EXPECT_EQ(HealthChecker::determine_health(json{{"dependencies", {{"db", false}}}}),
              HealthState::Unhealthy);
}

TEST_F(HealthCheckerTest, DetermineHealthNonObjectBody) {
    EXPECT_EQ(HealthChecker::determine_health(json("OK")), HealthState::Healthy);
    EXPECT_EQ(HealthChecker::determine_health(json::object()), HealthState::Healthy);
}

TEST_F(HealthCheckerTest, RegistrationTriggersImmediateCheck) {
    HealthChecker checker(registry, breakers, client, config);

    registry.register_instance(make_instance("users", "users-1", 8080));

    EXPECT_EQ(client->calls("/status"), 1);
    EXPECT_EQ(registry.find("users", "users-1")->status, InstanceStatus::Healthy);
    auto stored = checker.result("users-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, HealthState::Healthy);

    auto request = client->last_request();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->method, "GET");
    EXPECT_EQ(request->base_url, "http://localhost:8080");
}

TEST_F(HealthCheckerTest, FailedProbeMarksUnhealthy) {
    client->respond_with(500, R"({"status": "unhealthy"})");
    HealthChecker checker(registry, breakers, client, config);

    registry.register_instance(make_instance("users", "users-1", 8080));

    EXPECT_EQ(registry.find("users", "users-1")->status, InstanceStatus::Unhealthy);
    auto stored = checker.result("users-1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, HealthState::Unhealthy);
    ASSERT_TRUE(stored->error.has_value());
    EXPECT_EQ(*stored->error, "HTTP 500");
}

TEST_F(HealthCheckerTest, DegradedInstanceStaysRoutable) {
    client->respond_with(200, R"({"status": "ok", "dependencies": {"db": true, "cache": false}})");
    HealthChecker checker(registry, breakers, client, config);
    registry.register_instance(make_instance("users", "users-1", 8080));

    // "ok" is an explicit healthy status
    EXPECT_EQ(checker.result("users-1")->status, HealthState::Healthy);

    client->respond_with(200, R"({"dependencies": {"db": true, "cache": false}})");
    auto result = checker.check_instance(*registry.find("users", "users-1"));
    EXPECT_EQ(result.status, HealthState::Degraded);
    EXPECT_EQ(registry.discover("users").size(), 1);
    ASSERT_TRUE(result.details.has_value());
    EXPECT_FALSE(result.details->dependencies.at("cache"));
}

TEST_F(HealthCheckerTest, ProbeParsesReport) {
    client->respond_with(200, R"({
        "status": "healthy",
        "version": "2.1.0",
        "uptime": 12.5,
        "memory": {"used": 100, "total": 400, "percentage": 25},
        "cpu": {"usage": 10},
        "customMetrics": {"queue": 3}
    })");
    HealthChecker checker(registry, breakers, client, config);

    auto report = checker.probe(make_instance("users", "users-1", 8080));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->version, "2.1.0");
    EXPECT_DOUBLE_EQ(report->uptime.value(), 12.5);
    EXPECT_DOUBLE_EQ(report->memory->percentage, 25.0);
    EXPECT_DOUBLE_EQ(report->cpu_usage.value(), 10.0);
    EXPECT_EQ(report->custom_metrics["queue"], 3);
    // probe() leaves the registry alone
    EXPECT_TRUE(registry.all_services().empty());
}

TEST_F(HealthCheckerTest, BreakerShortCircuitsRepeatedFailures) {
    client->fail_with(ErrorCode::Upstream, "connection refused");
    HealthChecker checker(registry, breakers, client, config);
    auto instance = make_instance("users", "users-1", 8080);
    registry.register_instance(instance);

    checker.check_instance(instance);
    checker.check_instance(instance);
    EXPECT_EQ(client->calls("/status"), 3);

    auto result = checker.check_instance(instance);
    EXPECT_EQ(client->calls("/status"), 3);
    EXPECT_EQ(result.status, HealthState::Unhealthy);
    EXPECT_EQ(breakers.find("health-check-users-users-1")->state(), CircuitState::Open);
    EXPECT_EQ(registry.find("users", "users-1")->status, InstanceStatus::Unhealthy);
}

TEST_F(HealthCheckerTest, DeadSiblingsDoNotShortCircuitLiveInstance) {
    client->set_handler([](const HttpRequest& request) -> std::expected<HttpResponse, Error> {
        if (request.base_url == "http://localhost:9004") {
            HttpResponse response;
            response.status = 200;
            response.body = R"({"status": "healthy"})";
            return response;
        }
        return std::unexpected(Error{ErrorCode::Upstream, "connection refused"});
    });
    HealthChecker checker(registry, breakers, client, config);
    for (uint16_t port = 9001; port <= 9003; ++port) {
        auto dead = make_instance("svc", "svc-" + std::to_string(port), port);
        registry.register_instance(dead);
        checker.check_instance(dead);
        checker.check_instance(dead);
    }
    auto alive = make_instance("svc", "svc-9004", 9004);
    registry.register_instance(alive);

    auto result = checker.check_instance(alive);
    EXPECT_EQ(result.status, HealthState::Healthy);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(client->calls("/status"), 11);

    auto routable = registry.discover("svc");
    ASSERT_EQ(routable.size(), 1);
    EXPECT_EQ(routable[0].id, "svc-9004");
    EXPECT_EQ(breakers.find("health-check-svc-svc-9001")->state(), CircuitState::Open);
    EXPECT_EQ(breakers.find("health-check-svc-svc-9004")->state(), CircuitState::Closed);
}

TEST_F(HealthCheckerTest, DeregisterRemovesInstanceBreaker) {
    HealthChecker checker(registry, breakers, client, config);
    registry.register_instance(make_instance("users", "users-1", 8080));
    ASSERT_NE(breakers.find("health-check-users-users-1"), nullptr);

    registry.deregister("users", "users-1");
    EXPECT_EQ(breakers.find("health-check-users-users-1"), nullptr);
}

TEST_F(HealthCheckerTest, DeregisterDropsResult) {
    HealthChecker checker(registry, breakers, client, config);
    registry.register_instance(make_instance("users", "users-1", 8080));
    ASSERT_TRUE(checker.result("users-1").has_value());

    registry.deregister("users", "users-1");
    EXPECT_FALSE(checker.result("users-1").has_value());
}

TEST_F(HealthCheckerTest, SystemHealthAggregation) {
    HealthChecker checker(registry, breakers, client, config);
    registry.register_instance(make_instance("users", "users-1", 8080));
    registry.register_instance(make_instance("orders", "orders-1", 8081));

    auto health = checker.system_health();
    EXPECT_EQ(health.overall, HealthState::Healthy);
    EXPECT_EQ(health.total, 2);
    EXPECT_EQ(health.healthy, 2);

    client->respond_with(503, "");
    checker.check_instance(*registry.find("orders", "orders-1"));
    health = checker.system_health();
    EXPECT_EQ(health.overall, HealthState::Degraded);
    EXPECT_EQ(health.unhealthy, 1);

    checker.check_instance(*registry.find("users", "users-1"));
    EXPECT_EQ(checker.system_health().overall, HealthState::Unhealthy);

    checker.clear_results();
    EXPECT_EQ(checker.system_health().total, 0);
}

TEST_F(HealthCheckerTest, ObserversSeeEveryResult) {
    HealthChecker checker(registry, breakers, client, config);
    std::atomic<int> seen{0};
    auto id = checker.subscribe([&seen](const HealthCheckResult&) { ++seen; });

    registry.register_instance(make_instance("users", "users-1", 8080));
    checker.run_cycle();
    EXPECT_EQ(seen.load(), 2);

    checker.unsubscribe(id);
    checker.run_cycle();
    EXPECT_EQ(seen.load(), 2);
}

TEST_F(HealthCheckerTest, BackgroundLoopDetectsRecovery) {
    client->respond_with(500, "");
    HealthChecker checker(registry, breakers, client, config);
    registry.register_instance(make_instance("users", "users-1", 8080));
    ASSERT_EQ(registry.find("users", "users-1")->status, InstanceStatus::Unhealthy);

    client->respond_with(200, R"({"status": "healthy"})");
    checker.start();
    for (int i = 0; i < 100 && registry.discover("users").empty(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    checker.stop();

    EXPECT_EQ(registry.discover("users").size(), 1);
}
