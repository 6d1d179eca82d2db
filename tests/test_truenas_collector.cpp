#include <gtest/gtest.h>
#include "../src/collectors/TrueNASCollector.h"
#include "../src/core/Errors.h"
#include "TestSupport.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <unistd.h>

namespace port_census {

using nlohmann::json;
using std::chrono::milliseconds;

namespace {

const char* kPipePorts = "docker ps -a --no-trunc --format \"{{.Names}}|{{.Ports}}|{{.ID}}\"";
const char* kPidMap = "docker ps -q | xargs docker inspect --format '{{.State.Pid}}::{{.Id}}::{{.Name}}'";
const char* kHostNet = "docker ps --filter network=host --format '{{.ID}}'";
const char* kSelf = "docker ps --filter \"name=port-census\" --format \"{{.ID}}|{{.Names}}\"";
const char* kInspectAll = "docker inspect aaa111full bbb222full ccc333full ddd444full";

json container(const std::string& id, const std::string& name, const std::string& image, const std::string& created) {
    return json{{"Id", id}, {"Name", "/" + name}, {"Created", created}, {"Path", "/init"}, {"Args", json::array({"--run"})},
                {"State", {{"Status", "running"}}}, {"Config", {{"Image", image}}},
                {"NetworkSettings", {{"Networks", {{"bridge", json::object()}}}}},
                {"HostConfig", {{"PortBindings", json::object()}}}};
}

class ScriptedBackend : public RpcBackend {
public:
    std::map<std::string, json> answers;
    std::set<std::string> failing;
    std::vector<std::string> calls;
    json call(const std::string& method, const json&) override {
        calls.push_back(method);
        if (failing.count(method)) throw CollectorError(ErrorKind::Timeout, "Request timeout for method " + method);
        auto it = answers.find(method);
        return it == answers.end() ? json() : it->second;
    }
    void close() override {}
};

}

class TrueNASCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("TRUENAS_API_KEY");
        cfg.host_root = "/nonexistent-port-census-root";
        client = std::make_shared<TrueNasClient>("", [this](const std::string&) -> RpcBackendPtr {
            ++connects;
            throw CollectorError(ErrorKind::Connection, "WebSocket connection failed for all endpoints");
        });
    }

    void script_host() {
        runner->on("docker version", "Server: Docker Engine - Community\n Engine:\n  Version: 24.0.7\n");
        runner->on("docker info", "Name: nas01\nContainers: 4\n Running: 4\nImages: 6\nKernel Version: 6.6.20-truenas-24.10.1\n"
                                  "OSType: linux\nArchitecture: x86_64\nCPUs: 8\nTotal Memory: 31GiB\n");
        runner->on("docker ps -aq", "aaa111full\nbbb222full\nccc333full\nddd444full\n");
        json plex = container("aaa111full", "plex", "plexinc/pms-docker", "2024-01-01T00:00:00Z");
        plex["HostConfig"]["PortBindings"] = {{"32400/tcp", json::array({{{"HostIp", ""}, {"HostPort", "32400"}}})}};
        json inspect = json::array({plex,
                                    container("bbb222full", "wg-easy", "ghcr.io/wg-easy/wg-easy", "2024-02-02T00:00:00Z"),
                                    container("ccc333full", "port-census", "port-census:latest", "2024-03-03T00:00:00Z"),
                                    container("ddd444full", "homebridge", "homebridge/homebridge", "2024-04-04T00:00:00Z")});
        runner->on(kInspectAll, inspect.dump());
        runner->on(kPipePorts, "plex|0.0.0.0:32400->32400/tcp|aaa111full\nwg-easy||bbb222full\n");
        runner->on("ss -tulpn",
            "Netid State Recv-Q Send-Q Local Address:Port Peer Address:Port Process\n"
            "tcp LISTEN 0 511 0.0.0.0:32400 0.0.0.0:* users:((\"Plex Media Serv\",pid=900,fd=4))\n"
            "tcp LISTEN 0 511 0.0.0.0:8581 0.0.0.0:* users:((\"homebridge\",pid=1500,fd=4))\n"
            "tcp LISTEN 0 511 0.0.0.0:4999 0.0.0.0:*\n"
            "tcp LISTEN 0 511 0.0.0.0:51821 0.0.0.0:*\n"
            "tcp LISTEN 0 511 127.0.0.1:5432 0.0.0.0:* users:((\"postgres\",pid=2000,fd=4))\n"
            "tcp LISTEN 0 128 0.0.0.0:22 0.0.0.0:* users:((\"sshd\",pid=812,fd=3))\n"
            "udp UNCONN 0 0 0.0.0.0:51820 0.0.0.0:*\n"
            "udp UNCONN 0 0 0.0.0.0:5353 0.0.0.0:* users:((\"avahi-daemon\",pid=700,fd=12))\n");
        runner->on(kPidMap, "2000::eee555full::/db\n0::fff666full::/stopped\n");
        runner->on(kHostNet, "ddd444\n");
        runner->on("docker top ddd444 -eo pid,comm", "PID COMMAND\n1499 sh\n1500 homebridge\n");
        runner->on(kSelf, "ccc333|port-census\n");
        runner->on("ps -o pid,lstart --no-headers -p 812", "  812 Mon Jun 10 12:00:00 2024\n");
    }

    std::unique_ptr<TrueNASCollector> make(TtlCache::NowFn now = TtlCache::NowFn()) {
        return std::make_unique<TrueNASCollector>(cfg, runner, client, now);
    }

    static const PortEntry* find(const std::vector<PortEntry>& ports, int port) {
        for (const auto& p : ports) if (p.host_port == port) return &p;
        return nullptr;
    }

    Config cfg;
    std::shared_ptr<ScriptedCommandRunner> runner = std::make_shared<ScriptedCommandRunner>();
    std::shared_ptr<TrueNasClient> client;
    int connects = 0;
};

TEST_F(TrueNASCollectorTest, ReconciliationPipeline) {
    script_host();
    auto c = make();
    auto r = c->collect_all();
    ASSERT_FALSE(r.error.has_value());
    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(r.platform, "truenas");
    EXPECT_FALSE(r.enhanced_features_enabled);

    std::set<std::string> keys;
    for (const auto& p : r.ports) EXPECT_TRUE(keys.insert(p.key()).second) << "duplicate " << p.key();
    ASSERT_EQ(r.ports.size(), 6u);

    // declared mapping wins and picks up the listener PID
    const PortEntry* plex = find(r.ports, 32400);
    ASSERT_NE(plex, nullptr);
    EXPECT_EQ(plex->source, "docker");
    EXPECT_EQ(plex->owner, "plex");
    EXPECT_EQ(plex->pids, std::vector<int>{900});
    EXPECT_EQ(plex->created, std::optional<std::string>("2024-01-01T00:00:00Z"));

    const PortEntry* homebridge = find(r.ports, 8581);
    ASSERT_NE(homebridge, nullptr);
    EXPECT_EQ(homebridge->source, "docker");
    EXPECT_EQ(homebridge->owner, "homebridge");
    EXPECT_EQ(homebridge->container_id, std::optional<std::string>("ddd444full"));
    EXPECT_EQ(homebridge->target, std::optional<std::string>("8581"));

    const PortEntry* self = find(r.ports, 4999);
    ASSERT_NE(self, nullptr);
    EXPECT_EQ(self->source, "docker");
    EXPECT_EQ(self->owner, "port-census");
    EXPECT_EQ(self->container_id, std::optional<std::string>("ccc333"));
    EXPECT_EQ(self->created, std::optional<std::string>("2024-03-03T00:00:00Z"));

    const PortEntry* wg_ui = find(r.ports, 51821);
    ASSERT_NE(wg_ui, nullptr);
    EXPECT_EQ(wg_ui->owner, "wg-easy");
    EXPECT_EQ(wg_ui->container_id, std::optional<std::string>("bbb222full"));

    const PortEntry* db = find(r.ports, 5432);
    ASSERT_NE(db, nullptr);
    EXPECT_EQ(db->host_ip, "127.0.0.1");
    EXPECT_EQ(db->owner, "db");
    EXPECT_EQ(db->container_id, std::optional<std::string>("eee555full"));

    const PortEntry* ssh = find(r.ports, 22);
    ASSERT_NE(ssh, nullptr);
    EXPECT_EQ(ssh->source, "system");
    EXPECT_EQ(ssh->owner, "sshd");
    ASSERT_TRUE(ssh->created.has_value());
    EXPECT_EQ(ssh->created->substr(0, 4), "2024");

    // UDP is dropped without include_udp
    EXPECT_EQ(find(r.ports, 51820), nullptr);
    EXPECT_EQ(find(r.ports, 5353), nullptr);
    EXPECT_EQ(runner->count(kSelf), 1);
    EXPECT_EQ(connects, 0);
}

TEST_F(TrueNASCollectorTest, IncludeUdpEnablesKnownPortEnhancement) {
    cfg.include_udp = true;
    script_host();
    auto c = make();
    auto r = c->collect_all();
    const PortEntry* wg = find(r.ports, 51820);
    ASSERT_NE(wg, nullptr);
    EXPECT_EQ(wg->protocol, "udp");
    EXPECT_EQ(wg->source, "docker");
    EXPECT_EQ(wg->owner, "wg-easy");
    const PortEntry* mdns = find(r.ports, 5353);
    ASSERT_NE(mdns, nullptr);
    EXPECT_EQ(mdns->source, "system");
    EXPECT_EQ(mdns->owner, "avahi-daemon");
}

TEST_F(TrueNASCollectorTest, SystemInfoFromDockerHost) {
    script_host();
    auto c = make();
    auto si = c->get_system_info();
    EXPECT_EQ(si.hostname, "nas01");
    EXPECT_EQ(si.platform, "truenas");
    EXPECT_EQ(si.version, "24.10.1");
    EXPECT_EQ(si.cpu_cores, 8);
    EXPECT_EQ(si.details["docker_version"], "24.0.7");
    EXPECT_EQ(si.details["system_product"], "TrueNAS SCALE");
    EXPECT_EQ(si.platform_data["source"], "docker-host-info");
}

TEST_F(TrueNASCollectorTest, SystemInfoFallsBackWhenDockerMissing) {
    auto c = make();
    auto r = c->collect_all();
    ASSERT_TRUE(r.system_info.has_value());
    EXPECT_EQ(r.system_info->hostname, "truenas-system");
    EXPECT_EQ(r.system_info->version, "unknown");
    EXPECT_EQ(r.system_info->platform_data["source"], "fallback");
    EXPECT_TRUE(r.applications.empty());
    EXPECT_TRUE(r.ports.empty());
    EXPECT_FALSE(r.error.has_value());
}

TEST_F(TrueNASCollectorTest, InspectFailureFallsBackToDockerPs) {
    runner->on("docker ps -aq", "aaa111full\n");
    runner->fail("docker inspect aaa111full");
    runner->on("docker ps -a --format \"{{json .}}\"",
               "{\"ID\":\"aaa111\",\"Names\":\"plex\",\"State\":\"exited\",\"Image\":\"plexinc/pms-docker\",\"Ports\":\"\"}\n");
    auto c = make();
    auto apps = c->get_applications();
    ASSERT_EQ(apps.size(), 1u);
    EXPECT_EQ(apps[0].name, "plex");
    EXPECT_EQ(apps[0].status, "stopped");
}

TEST_F(TrueNASCollectorTest, CacheServesRepeatCollections) {
    script_host();
    auto now = TtlCache::Clock::time_point() + std::chrono::hours(1);
    auto c = make([&now]{ return now; });
    c->collect_all();
    c->collect_all();
    EXPECT_EQ(runner->count("docker version"), 1);
    EXPECT_EQ(runner->count("docker ps -aq"), 1);
    EXPECT_EQ(runner->count("ss -tulpn"), 1);
    EXPECT_EQ(runner->count(kHostNet), 1);
    EXPECT_EQ(runner->count(kPidMap), 2);
    EXPECT_TRUE(c->cache().contains("systemPorts"));

    now += milliseconds(31000);
    c->collect_all();
    EXPECT_EQ(runner->count("ss -tulpn"), 2);
    EXPECT_EQ(runner->count("docker version"), 2);
    EXPECT_EQ(runner->count("docker ps -aq"), 1);

    c->clear_all_cache();
    c->collect_all();
    EXPECT_EQ(runner->count("docker ps -aq"), 2);
    EXPECT_EQ(runner->count(kHostNet), 2);

    c->clear_cache("systemPorts");
    EXPECT_FALSE(c->cache().contains("systemPorts"));
}

TEST_F(TrueNASCollectorTest, DisabledCacheRunsEveryFetch) {
    cfg.disable_cache = true;
    script_host();
    auto c = make();
    c->collect_all();
    c->collect_all();
    EXPECT_EQ(runner->count("ss -tulpn"), 2);
    EXPECT_EQ(c->cache().size(), 0u);
}

TEST_F(TrueNASCollectorTest, EnhancedTierMergesApiData) {
    cfg.truenas_api_key = "1-secret";
    auto backend = new ScriptedBackend();
    backend->answers["system.info"] = {{"hostname", "nas-api"}, {"version", "TrueNAS-SCALE-24.10.2"}, {"cores", 12},
                                       {"physmem", 68719476736LL}, {"model", "AMD EPYC"}};
    backend->answers["app.query"] = json::array({{{"id", "immich"}, {"name", "immich"}, {"state", "RUNNING"}, {"version", "1.2"},
                                                  {"catalog", "TRUENAS"},
                                                  {"port_mappings", json::array({{{"host_port", 2283}, {"container_port", 2283}}})}}});
    backend->failing.insert("virt.instance.query");
    client = std::make_shared<TrueNasClient>("1-secret", [backend](const std::string&) { return RpcBackendPtr(backend); });
    script_host();
    auto c = make();
    auto r = c->collect_all();
    EXPECT_TRUE(r.enhanced_features_enabled);
    ASSERT_TRUE(r.system_info.has_value());
    EXPECT_TRUE(r.system_info->enhanced);
    EXPECT_EQ(r.system_info->hostname, "nas-api");
    EXPECT_EQ(r.system_info->version, "TrueNAS-SCALE-24.10.2");
    EXPECT_EQ(r.system_info->cpu_cores, 12);
    EXPECT_EQ(r.system_info->cpu_model, "AMD EPYC");
    ASSERT_EQ(r.applications.size(), 5u);
    EXPECT_EQ(r.applications.back().platform, "truenas");
    EXPECT_EQ(r.applications.back().status, "running");
    EXPECT_EQ(r.applications.back().platform_data["ports"][0]["host_port"], 2283);
    EXPECT_TRUE(r.vms.empty());
    EXPECT_FALSE(r.error.has_value());
    EXPECT_EQ(backend->calls, (std::vector<std::string>{"system.info", "app.query", "virt.instance.query"}));
}

TEST_F(TrueNASCollectorTest, VmsRequireApiKey) {
    auto c = make();
    EXPECT_TRUE(c->get_vms().empty());
    EXPECT_EQ(connects, 0);
}

TEST_F(TrueNASCollectorTest, CompatibilityScoring) {
    char tmpl[] = "/tmp/port_census_truenas_XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    std::filesystem::path root(tmpl);
    std::filesystem::create_directories(root / "etc");
    std::filesystem::create_directories(root / "usr/local/etc/ix");
    { std::ofstream(root / "etc/os-release") << "NAME=\"TrueNAS SCALE\"\n"; }
    cfg.host_root = root.string();
    cfg.truenas_api_key = "1-secret";

    auto c = make();
    EXPECT_EQ(c->is_compatible(), 70);
    EXPECT_EQ(c->detection_reasons().size(), 3u);

    // every signal present: the sum is reported as is
    runner->on("uname -a", "Linux nas01 6.6.20-production+truenas #1 SMP x86_64 GNU/Linux\n");
    EXPECT_EQ(c->is_compatible(), 130);
    EXPECT_EQ(c->detection_reasons().size(), 4u);

    std::filesystem::remove_all(root);
}

TEST_F(TrueNASCollectorTest, IncompatibleHostScoresZero) {
    auto c = make();
    EXPECT_EQ(c->is_compatible(), 0);
    EXPECT_TRUE(c->detection_reasons().empty());
}

TEST(TrueNASMappingTest, ContainersFromInspect) {
    json plex = container("aaa111full", "plex", "plexinc/pms-docker", "2024-01-01T00:00:00Z");
    plex["HostConfig"]["PortBindings"] = {{"32400/tcp", json::array({{{"HostIp", "0.0.0.0"}, {"HostPort", "32400"}}})},
                                          {"1900/udp", nullptr}};
    auto apps = containers_from_inspect(json::array({plex, {{"Name", "/no-id"}}, 5}));
    ASSERT_EQ(apps.size(), 1u);
    EXPECT_EQ(apps[0].name, "plex");
    EXPECT_EQ(apps[0].command, "/init --run");
    EXPECT_EQ(apps[0].status, "running");
    EXPECT_EQ(apps[0].platform_data["networks"], "bridge");
    ASSERT_EQ(apps[0].platform_data["ports"].size(), 1u);
    EXPECT_EQ(apps[0].platform_data["ports"][0]["host_ip"], "*");
    EXPECT_EQ(apps[0].platform_data["ports"][0]["host_port"], 32400);
    EXPECT_TRUE(containers_from_inspect(json::object()).empty());
}

TEST(TrueNASMappingTest, AppsAndVmsFromQuery) {
    auto apps = apps_from_query(json::array({{{"id", "nextcloud"}, {"status", "DEPLOYING"},
                                              {"config", {{"port_mappings", json::array({{{"host_port", 9001}}})}}}}}));
    ASSERT_EQ(apps.size(), 1u);
    EXPECT_EQ(apps[0].name, "nextcloud");
    EXPECT_EQ(apps[0].status, "running");
    EXPECT_EQ(apps[0].version, "N/A");
    EXPECT_EQ(apps[0].platform_data["type"], "truenas_app");
    EXPECT_EQ(apps[0].platform_data["ports"][0]["host_ip"], "*");
    EXPECT_EQ(apps[0].platform_data["ports"][0]["protocol"], "tcp");

    auto vms = vms_from_query(json::array({{{"id", 3}, {"name", "win11"}, {"status", "RUNNING"}, {"cpu", 4},
                                            {"memory", 8589934592LL}, {"autostart", true}, {"image", {{"os", "windows"}}}}}));
    ASSERT_EQ(vms.size(), 1u);
    EXPECT_EQ(vms[0].id, "3");
    EXPECT_EQ(vms[0].status, "running");
    EXPECT_EQ(vms[0].vcpus, 4);
    EXPECT_TRUE(vms[0].autostart);
    EXPECT_EQ(vms[0].platform_data["os"], "windows");
    EXPECT_TRUE(vms_from_query(json()).empty());
}

TEST(TrueNASMappingTest, KnownPorts) {
    EXPECT_TRUE(is_important_udp_port(51820));
    EXPECT_TRUE(is_important_udp_port(53));
    EXPECT_FALSE(is_important_udp_port(51821));
    EXPECT_FALSE(is_important_udp_port(5353));
    EXPECT_EQ(std::string(known_ports().at(1194).service), "OpenVPN");
}

}
