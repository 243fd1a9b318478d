#include <gtest/gtest.h>

#include <algorithm>

#include "pipeline.hpp"
#include "report.hpp"
#include "test_helpers.hpp"

using namespace lempctl_test;
using Lempctl::Pipeline;
using Lempctl::Report;
using Lempctl::Step;

namespace {

/**
 * A host where everything is installed and healthy.
 */
class PipelineFixture : public ::testing::Test
{
protected:
    PipelineFixture()
        : report(nullptr, false)
    {
        config.nginxConfDir = dir.makeDir("conf.d").string();
        config.webRoot = dir.makeDir("html").string();
        config.webUser = "";
        config.publicIpUrl = "http://ip.test";

        runner.onPrefix("systemctl is-active", ok("active\n"));
        runner.onExact("mariadb -e SELECT plugin FROM mysql.user WHERE User='root'", ok("unix_socket\n"));
        runner.onExact("ss -tlnH", ok("LISTEN 0 511 0.0.0.0:80 0.0.0.0:*\n"
                                      "LISTEN 0 80 127.0.0.1:3306 0.0.0.0:*\n"
                                      "LISTEN 0 511 127.0.0.1:9000 0.0.0.0:*\n"));
        runner.onPrefix("ufw", notFound());

        http.on("http://localhost/", httpBody("<h1>Welcome to nginx!</h1>"));
        http.on("http://localhost/test-php.php", httpBody("PHP-FPM is working"));
        http.on("http://localhost/test-db.php", httpBody("DB OK"));
    }

    bool said(const std::string& message) const
    {
        for (const auto& event : report.events()) {
            if (event.message == message) {
                return true;
            }
        }
        return false;
    }

    TempDir dir;
    Lempctl::Config config;
    FakeCommandRunner runner;
    FakeHttpClient http;
    Report report;
};

} // namespace

TEST(StepTest, NamesRoundTrip)
{
    for (Step step : Lempctl::allSteps()) {
        auto parsed = Lempctl::parseStep(Lempctl::stepName(step));
        ASSERT_TRUE(parsed.has_value()) << Lempctl::stepName(step);
        EXPECT_EQ(*parsed, step);
    }
    EXPECT_EQ(Lempctl::allSteps().size(), 10u);
}

TEST(StepTest, UnknownNameIsRejected)
{
    EXPECT_FALSE(Lempctl::parseStep("install").has_value());
    EXPECT_FALSE(Lempctl::parseStep("").has_value());
    EXPECT_FALSE(Lempctl::parseStep("CHECK-PORTS").has_value());
}

TEST_F(PipelineFixture, HealthyHostFinishesClean)
{
    Pipeline pipeline(config, runner, http, report);

    EXPECT_TRUE(pipeline.run());
    EXPECT_EQ(report.errorCount(), 0u);
    EXPECT_TRUE(said("Your LEMP stack is ready !!"));
}

TEST_F(PipelineFixture, StepsRunInPipelineOrder)
{
    Pipeline pipeline(config, runner, http, report);
    pipeline.run();

    std::vector<int> order = {
        runner.indexOf("apt-get update"),
        runner.indexOf("apt-get upgrade"),
        runner.indexOf("apt-get install"),
        runner.indexOf("systemctl is-active nginx"),
        runner.indexOf("mariadb -e SELECT plugin"),
        runner.indexOf("ss -tlnH"),
        runner.indexOf("ufw status"),
        runner.indexOf("nginx -t"),
    };
    for (int index : order) {
        EXPECT_GE(index, 0);
    }
    EXPECT_TRUE(std::is_sorted(order.begin(), order.end()));
}

TEST_F(PipelineFixture, UpstreamUsesRuntimeSocket)
{
    config.phpVersion = "8.1";
    Pipeline pipeline(config, runner, http, report);
    pipeline.runStep(Step::ConfigureUpstream);

    const std::string content = readFile(config.nginxConfDir + "/php-fpm.conf");
    EXPECT_NE(content.find("upstream php-fpm {"), std::string::npos);
    EXPECT_NE(content.find("server unix:/run/php/php8.1-fpm.sock;"), std::string::npos);
}

TEST_F(PipelineFixture, UpstreamFallsBackToTcp)
{
    config.phpUseSocket = false;
    Pipeline pipeline(config, runner, http, report);
    pipeline.runStep(Step::ConfigureUpstream);

    const std::string content = readFile(config.nginxConfDir + "/php-fpm.conf");
    EXPECT_NE(content.find("server 127.0.0.1:9000;"), std::string::npos);
}

TEST_F(PipelineFixture, HardeningCanBeSkipped)
{
    config.secureDatabase = false;
    Pipeline pipeline(config, runner, http, report);
    pipeline.run();

    EXPECT_EQ(runner.count("mariadb -e DELETE"), 0u);
    EXPECT_EQ(runner.count("mariadb -e SELECT plugin"), 0u);
    EXPECT_TRUE(said("Not securing mariadb installation."));
}

TEST_F(PipelineFixture, DebugStepRunsInIsolation)
{
    Pipeline pipeline(config, runner, http, report);
    pipeline.runStep(Step::CheckPorts);

    EXPECT_EQ(runner.lines(), std::vector<std::string>{"ss -tlnH"});
    EXPECT_TRUE(http.requests.empty());
}

TEST_F(PipelineFixture, DebugInstallResolvesFirstWithoutRefreshing)
{
    config.phpModules = "curl";
    Pipeline pipeline(config, runner, http, report);
    pipeline.runStep(Step::InstallPackages);

    EXPECT_EQ(runner.count("apt-get update"), 0u);
    EXPECT_LT(runner.indexOf("apt-cache search"), runner.indexOf("apt-get install"));
    EXPECT_EQ(pipeline.packageSet().invalidModules, std::vector<std::string>{"php7.4-curl"});
}

TEST_F(PipelineFixture, ErrorsAreSummarized)
{
    runner.onPrefix("systemctl", failed(3, "failed\n"));
    Pipeline pipeline(config, runner, http, report);

    EXPECT_FALSE(pipeline.run());
    EXPECT_EQ(report.errorCount(), 3u);
    EXPECT_TRUE(said("LEMP stack installation is finished with errors. Need manual configuration. (3 error(s))"));
}

TEST_F(PipelineFixture, ExpectationsCoverConfiguredPortsAndRuntime)
{
    Pipeline pipeline(config, runner, http, report);
    auto expectations = pipeline.portExpectations();

    ASSERT_EQ(expectations.size(), 3u);
    EXPECT_EQ(expectations[0].port, 80);
    EXPECT_EQ(expectations[1].port, 3306);
    EXPECT_EQ(expectations[2].port, 9000);
    EXPECT_EQ(expectations[2].socketFallback, "/run/php/php7.4-fpm.sock");
    EXPECT_EQ(pipeline.services(), (std::vector<std::string>{"nginx", "mariadb", "php7.4-fpm"}));
}
