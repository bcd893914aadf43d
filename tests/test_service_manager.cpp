#include <gtest/gtest.h>
#include "meshgate/service_manager.hpp"
#include "fake_http_client.hpp"
#include <set>
#include <thread>

using namespace meshgate;
using namespace std::chrono_literals;

class ServiceManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        client = std::make_shared<test::FakeHttpClient>();
        health_checker = std::make_unique<HealthChecker>(registry, breakers, client);
        load_balancer = std::make_unique<LoadBalancer>(registry);
        gateway = std::make_unique<Gateway>(*load_balancer, breakers, rate_limiter, client);
        ServiceManagerConfig config;
        config.poll_interval = 20ms;
        manager = std::make_unique<ServiceManager>(registry, *health_checker, *gateway, config);
    }

    ServiceDefinition define(const std::string& name, uint16_t port,
                             std::vector<std::string> dependencies = {}) {
        ServiceDefinition definition;
        definition.name = name;
        definition.version = "1.0.0";
        definition.host = "localhost";
        definition.port = port;
        definition.dependencies = std::move(dependencies);
        definition.startup_timeout = 200ms;
        definition.shutdown_timeout = 200ms;
        return definition;
    }

    // Health endpoint on the given port answers 500, everything else stays healthy
    void fail_port(uint16_t port) {
        std::string failing_url = "http://localhost:" + std::to_string(port);
        client->set_handler([failing_url](const HttpRequest& request) -> std::expected<HttpResponse, Error> {
            HttpResponse response;
            response.headers["Content-Type"] = "application/json";
            if (request.base_url == failing_url) {
                response.status = 500;
                response.body = R"({"status": "unhealthy"})";
            } else {
                response.status = 200;
                response.body = R"({"status": "healthy"})";
            }
            return response;
        });
    }

    ServiceRegistry registry;
    CircuitBreakerRegistry breakers;
    RateLimiter rate_limiter;
    std::shared_ptr<test::FakeHttpClient> client;
    std::unique_ptr<HealthChecker> health_checker;
    std::unique_ptr<LoadBalancer> load_balancer;
    std::unique_ptr<Gateway> gateway;
    std::unique_ptr<ServiceManager> manager;
};

TEST_F(ServiceManagerTest, StartupOrderPutsDependenciesFirst) {
    manager->register_service(define("a", 9001, {"b"}));
    manager->register_service(define("b", 9002, {"c"}));
    manager->register_service(define("c", 9003));

    auto order = manager->calculate_startup_order();
    ASSERT_TRUE(order.has_value());
    std::vector<std::string> expected = {"c", "b", "a"};
    EXPECT_EQ(*order, expected);
}

TEST_F(ServiceManagerTest, IndependentServicesKeepRegistrationOrder) {
    manager->register_service(define("orders", 9001, {"external-db"}));
    manager->register_service(define("users", 9002));
    manager->register_service(define("billing", 9003, {"users"}));

    auto order = manager->calculate_startup_order();
    ASSERT_TRUE(order.has_value());
    std::vector<std::string> expected = {"orders", "users", "billing"};
    EXPECT_EQ(*order, expected);
}

TEST_F(ServiceManagerTest, CycleIsConfigurationError) {
    manager->register_service(define("a", 9001, {"b"}));
    manager->register_service(define("b", 9002, {"a"}));

    auto order = manager->calculate_startup_order();
    ASSERT_FALSE(order.has_value());
    EXPECT_EQ(order.error().code, ErrorCode::Configuration);
    EXPECT_TRUE(order.error().message.starts_with("Circular dependency detected involving: "));

    auto started = manager->start_all_services();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::Configuration);
}

TEST_F(ServiceManagerTest, StartServiceRegistersHealthyInstance) {
    manager->register_service(define("users", 9001));

    auto started = manager->start_service("users");
    ASSERT_TRUE(started.has_value());

    auto instances = registry.discover("users");
    ASSERT_EQ(instances.size(), 1);
    EXPECT_EQ(instances[0].id, "users-localhost-9001");
    EXPECT_EQ(instances[0].port, 9001);

    auto status = manager->status("users");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->lifecycle, Lifecycle::Running);
    EXPECT_TRUE(status->started_at.has_value());
    EXPECT_EQ(status->health, HealthState::Healthy);

    // Starting again is a no-op
    EXPECT_TRUE(manager->start_service("users").has_value());
    EXPECT_EQ(registry.instances("users").size(), 1);
}

TEST_F(ServiceManagerTest, UnknownServiceIsRejected) {
    auto started = manager->start_service("ghost");
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::Configuration);
    EXPECT_EQ(started.error().message, "Service not found: ghost");
    EXPECT_FALSE(manager->stop_service("ghost").has_value());
}

TEST_F(ServiceManagerTest, MissingDependencyFailsStart) {
    manager->register_service(define("orders", 9001, {"db"}));

    auto started = manager->start_service("orders");
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::Unavailable);
    EXPECT_EQ(started.error().message, "Dependency not available: db");

    auto status = manager->status("orders");
    EXPECT_EQ(status->lifecycle, Lifecycle::Failed);
    EXPECT_EQ(status->error, "Dependency not available: db");
    EXPECT_FALSE(status->dependencies.at("db"));
    EXPECT_TRUE(registry.instances("orders").empty());
}

TEST_F(ServiceManagerTest, StartupTimesOutWhenNeverHealthy) {
    fail_port(9001);
    manager->register_service(define("users", 9001));

    auto start = std::chrono::steady_clock::now();
    auto started = manager->start_service("users");
    auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::Timeout);
    EXPECT_EQ(started.error().message, "Service health check timeout: users");
    EXPECT_GE(waited, 200ms);
    EXPECT_EQ(manager->status("users")->lifecycle, Lifecycle::Failed);
}

TEST_F(ServiceManagerTest, RetriedStartReusesInstance) {
    fail_port(9001);
    manager->register_service(define("users", 9001));

    ASSERT_FALSE(manager->start_service("users").has_value());
    ASSERT_FALSE(manager->start_service("users").has_value());
    EXPECT_EQ(registry.instances("users").size(), 1);

    client->respond_with(200, R"({"status": "healthy"})");
    ASSERT_TRUE(manager->start_service("users").has_value());
    auto instances = registry.instances("users");
    ASSERT_EQ(instances.size(), 1);
    EXPECT_EQ(instances[0].id, "users-localhost-9001");
    EXPECT_EQ(registry.discover("users").size(), 1);
}

TEST_F(ServiceManagerTest, StartAllContinuesPastNonCriticalFailure) {
    fail_port(9001);
    manager->register_service(define("reports", 9001));
    manager->register_service(define("users", 9002));

    EXPECT_TRUE(manager->start_all_services().has_value());
    EXPECT_EQ(manager->status("reports")->lifecycle, Lifecycle::Failed);
    EXPECT_EQ(manager->status("users")->lifecycle, Lifecycle::Running);

    auto stats = manager->stats();
    EXPECT_EQ(stats.total_services, 2);
    EXPECT_EQ(stats.running_services, 1);
    EXPECT_EQ(stats.failed_services, 1);
}

TEST_F(ServiceManagerTest, CriticalFailureAbortsStartup) {
    fail_port(9001);
    auto payments = define("payments", 9001);
    payments.tags = {"critical"};
    manager->register_service(payments);
    manager->register_service(define("users", 9002));

    auto started = manager->start_all_services();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::Timeout);
    EXPECT_EQ(manager->status("users")->lifecycle, Lifecycle::Stopped);
    EXPECT_TRUE(registry.instances("users").empty());
}

TEST_F(ServiceManagerTest, DependentStartsAfterDependency) {
    manager->register_service(define("orders", 9001, {"users"}));
    manager->register_service(define("users", 9002));

    ASSERT_TRUE(manager->start_all_services().has_value());
    EXPECT_EQ(manager->status("orders")->lifecycle, Lifecycle::Running);
    EXPECT_TRUE(manager->status("orders")->dependencies.at("users"));
}

TEST_F(ServiceManagerTest, StopServiceDeregisters) {
    manager->register_service(define("users", 9001));
    ASSERT_TRUE(manager->start_service("users").has_value());

    ASSERT_TRUE(manager->stop_service("users").has_value());
    EXPECT_TRUE(registry.instances("users").empty());
    auto status = manager->status("users");
    EXPECT_EQ(status->lifecycle, Lifecycle::Stopped);
    EXPECT_TRUE(status->stopped_at.has_value());
}

TEST_F(ServiceManagerTest, StopAllRunsInReverseOrder) {
    manager->register_service(define("orders", 9001, {"users"}));
    manager->register_service(define("users", 9002));
    ASSERT_TRUE(manager->start_all_services().has_value());

    std::vector<std::string> removed;
    auto subscription = registry.subscribe([&removed](const RegistryEvent& event) {
        if (event.kind == RegistryEvent::Kind::Deregistered) {
            removed.push_back(event.service_name);
        }
    });

    manager->stop_all_services();
    registry.unsubscribe(subscription);
    EXPECT_TRUE(manager->shutting_down());
    std::vector<std::string> expected = {"orders", "users"};
    EXPECT_EQ(removed, expected);
    EXPECT_TRUE(registry.all_services().empty());
}

TEST_F(ServiceManagerTest, RoutesAreRegisteredWithGateway) {
    auto users = define("users", 9001);
    RouteConfig route;
    route.path = "/api/users";
    route.service_name = "ignored";
    users.routes.push_back(route);
    manager->register_service(users);

    auto routes = gateway->routes();
    ASSERT_EQ(routes.size(), 1);
    EXPECT_EQ(routes[0].service_name, "users");

    ASSERT_TRUE(manager->start_service("users").has_value());
    GatewayRequest request;
    request.path = "/api/users";
    auto response = gateway->handle(request);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, 200);
}
