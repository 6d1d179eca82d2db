#include <gtest/gtest.h>
#include "../src/collectors/DockerCollector.h"
#include "../src/core/Errors.h"
#include "TestSupport.h"
#include <set>

namespace port_census {

namespace {

const char* kPsJson = "docker ps -a --format \"{{json .}}\"";
const char* kPsPorts = "docker ps --format \"{{.Names}}:::{{.Ports}}:::{{.ID}}\"";
const char* kPsRunning = "docker ps --format \"{{.ID}}:::{{.Names}}:::{{.Image}}\"";

std::string inspect_cmd(const std::string& id) {
    return "docker inspect " + id + " --format \"{{.HostConfig.NetworkMode}}:::{{json .Config.ExposedPorts}}\"";
}

}

class DockerCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.host_root = "/nonexistent-port-census-root";
    }

    void script_two_containers() {
        runner->on(kPsJson,
            "{\"ID\":\"aaa111\",\"Names\":\"web\",\"State\":\"running\",\"Image\":\"nginx:1.25\",\"Command\":\"nginx\","
            "\"CreatedAt\":\"2024-05-01 10:00:00 +0000 UTC\",\"Ports\":\"0.0.0.0:8080->80/tcp\"}\n"
            "{\"ID\":\"bbb222\",\"Names\":\"monitor\",\"State\":\"running\",\"Image\":\"netdata\",\"Command\":\"run\","
            "\"CreatedAt\":\"2024-05-02 10:00:00 +0000 UTC\",\"Ports\":\"\"}\n"
            "not json\n");
        runner->on(kPsPorts, "web:::0.0.0.0:8080->80/tcp:::aaa111\nmonitor::::::bbb222\n");
        runner->on(kPsRunning, "aaa111:::web:::nginx:1.25\nbbb222:::monitor:::netdata\n");
        runner->on(inspect_cmd("aaa111"), "bridge:::{\"80/tcp\":{}}\n");
        runner->on(inspect_cmd("bbb222"), "host:::null\n");
        runner->on("docker top aaa111 -o pid", "PID\n300\n");
        runner->on("docker top bbb222 -o pid", "PID\n500\n501\n");
        runner->on("ss -tulnp",
            "Netid State Recv-Q Send-Q Local Address:Port Peer Address:Port Process\n"
            "tcp LISTEN 0 511 0.0.0.0:8080 0.0.0.0:* users:((\"docker-proxy\",pid=290,fd=4))\n"
            "tcp LISTEN 0 511 0.0.0.0:19999 0.0.0.0:* users:((\"netdata\",pid=500,fd=4))\n"
            "tcp LISTEN 0 128 0.0.0.0:22 0.0.0.0:* users:((\"sshd\",pid=812,fd=3))\n");
    }

    Config cfg;
    std::shared_ptr<ScriptedCommandRunner> runner = std::make_shared<ScriptedCommandRunner>();
};

TEST_F(DockerCollectorTest, CompatibilityFromCli) {
    DockerCollector c(cfg, runner, HostFamily::Linux);
    EXPECT_EQ(c.is_compatible(), 0);
    runner->on("docker version", "Client:\n Version: 24.0.7\n");
    EXPECT_EQ(c.is_compatible(), 40);
}

TEST_F(DockerCollectorTest, ApplicationsSkipUnparsableLines) {
    script_two_containers();
    DockerCollector c(cfg, runner, HostFamily::Linux);
    auto apps = c.get_applications();
    ASSERT_EQ(apps.size(), 2u);
    EXPECT_EQ(apps[0].name, "web");
    EXPECT_EQ(apps[0].status, "running");
    EXPECT_EQ(apps[0].platform, "docker");
    ASSERT_EQ(apps[0].platform_data["ports"].size(), 1u);
    EXPECT_EQ(apps[0].platform_data["ports"][0]["host_port"], 8080);
    EXPECT_TRUE(apps[1].platform_data["ports"].empty());
}

TEST_F(DockerCollectorTest, ApplicationsThrowWhenCliFails) {
    DockerCollector c(cfg, runner, HostFamily::Linux);
    EXPECT_THROW(c.get_applications(), CollectorError);
}

TEST_F(DockerCollectorTest, InspectRunningContainers) {
    script_two_containers();
    DockerCollector c(cfg, runner, HostFamily::Linux);
    std::vector<ContainerRef> listing;
    auto running = c.inspect_running_containers(&listing);
    ASSERT_EQ(running.size(), 2u);
    EXPECT_EQ(listing.size(), 2u);
    EXPECT_EQ(running[1].network_mode, "host");
    EXPECT_TRUE(running[1].exposed_ports.is_null());
    EXPECT_EQ(running[1].pids, (std::vector<int>{500, 501}));
    EXPECT_TRUE(running[0].exposed_ports.contains("80/tcp"));
}

TEST_F(DockerCollectorTest, PortsDeduplicatedAndAttributed) {
    script_two_containers();
    DockerCollector c(cfg, runner, HostFamily::Linux);
    auto ports = c.get_ports();

    std::set<std::string> keys;
    for (const auto& p : ports) EXPECT_TRUE(keys.insert(p.key()).second) << "duplicate " << p.key();
    ASSERT_EQ(ports.size(), 3u);

    // declared mapping wins over the docker-proxy listener
    EXPECT_EQ(ports[0].key(), "0.0.0.0:8080");
    EXPECT_EQ(ports[0].owner, "web");
    EXPECT_EQ(ports[0].source, "docker");
    EXPECT_EQ(ports[0].created, std::optional<std::string>("2024-05-01 10:00:00 +0000 UTC"));

    // host network listener owned by a container PID
    EXPECT_EQ(ports[1].host_port, 19999);
    EXPECT_EQ(ports[1].source, "docker");
    EXPECT_EQ(ports[1].owner, "monitor");
    EXPECT_EQ(ports[1].container_id, std::optional<std::string>("bbb222"));
    EXPECT_EQ(ports[1].target, std::optional<std::string>("bbb222:internal(host-net)"));

    EXPECT_EQ(ports[2].host_port, 22);
    EXPECT_EQ(ports[2].source, "system");
    EXPECT_EQ(ports[2].owner, "sshd");
}

TEST_F(DockerCollectorTest, PublishFilterAttribution) {
    runner->on("ss -tulnp",
        "Netid State Recv-Q Send-Q Local Address:Port Peer Address:Port Process\n"
        "tcp LISTEN 0 511 0.0.0.0:9443 0.0.0.0:* users:((\"docker-proxy\",pid=700,fd=4))\n");
    runner->on("docker ps --filter \"publish=9443\" --format \"{{.Names}}:::{{.ID}}\"", "portainer:::0123456789abcdef\n");
    DockerCollector c(cfg, runner, HostFamily::Linux);
    auto ports = c.get_ports();
    ASSERT_EQ(ports.size(), 1u);
    EXPECT_EQ(ports[0].owner, "portainer");
    EXPECT_EQ(ports[0].target, std::optional<std::string>("0123456789ab:9443"));
}

TEST_F(DockerCollectorTest, ProcessNameHeuristic) {
    DockerCollector c(cfg, runner, HostFamily::Linux);
    std::vector<ContainerRef> containers = {{"cafe00000000ff", "home-assistant", "ghcr.io/home-assistant/home-assistant"},
                                            {"beef00000000ff", "jellyfin", "jellyfin/jellyfin"}};
    auto attr = c.match_container_by_process("jellyfin", 8096, containers);
    ASSERT_TRUE(attr.has_value());
    EXPECT_EQ(attr->container_name, "jellyfin");
    EXPECT_EQ(attr->target, "beef00000000:8096");
    EXPECT_TRUE(c.match_container_by_process("homeassistant-core", 8123, containers).has_value());
    EXPECT_FALSE(c.match_container_by_process("unknown", 1, containers).has_value());
    EXPECT_FALSE(c.match_container_by_process("sshd", 22, containers).has_value());
}

TEST_F(DockerCollectorTest, SystemInfoFromCli) {
    runner->on("docker version", "Server: Docker Engine\n Version: 25.0.3\n");
    runner->on("docker info", "Name: dockerhost\nContainers: 3\n Running: 2\nImages: 9\nCPUs: 4\nTotal Memory: 8GiB\n");
    DockerCollector c(cfg, runner, HostFamily::Linux);
    auto si = c.get_system_info();
    EXPECT_EQ(si.hostname, "dockerhost");
    EXPECT_EQ(si.version, "25.0.3");
    EXPECT_EQ(si.cpu_cores, 4);
    EXPECT_EQ(si.details["containers_running"], 2);
    EXPECT_EQ(si.platform_data["description"], "Docker 25.0.3");
}

}
