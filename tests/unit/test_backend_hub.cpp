/*
 * Unit tests for the backend hub
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "BackendHub.hpp"
#include "KeyValueStore.hpp"
#include "Settings.hpp"
#include "TestHelpers.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

namespace {

const std::string kCloud = "http://cloud:1";
const std::string kLocal = "http://local:1";
const std::string kQuota = "http://cloud:1/quota";

class RecordingObserver : public HubObserver {
public:
    void on_health_changed(const Backend& backend) override { health.push_back(backend.address); }
    void on_catalog_changed(const ModelList& models) override { catalogs.push_back(models); }
    void on_connectivity_changed(ConnectivityStatus status) override { connectivity.push_back(status); }
    void on_quota_changed(const std::optional<QuotaSnapshot>& snapshot) override { quotas.push_back(snapshot); }
    void on_quota_threshold_crossed(const QuotaSnapshot&) override { ++threshold_signals; }
    void on_session_expired() override { ++expired_signals; }
    void on_empty_local_catalog(const std::string& address) override { empty_local.push_back(address); }

    std::vector<std::string> health;
    std::vector<ModelList> catalogs;
    std::vector<ConnectivityStatus> connectivity;
    std::vector<std::optional<QuotaSnapshot>> quotas;
    int threshold_signals = 0;
    int expired_signals = 0;
    std::vector<std::string> empty_local;
};

struct HubFixture {
    TempDir temp_dir;
    EnvVarGuard cloud_guard{"INFERENCE_HUB_CLOUD_ADDRESS", std::nullopt};
    EnvVarGuard local_guard{"INFERENCE_HUB_LOCAL_ADDRESS", std::nullopt};
    Settings settings{(temp_dir.path() / "config.ini").string()};
    FakeHttpServer server;
    std::shared_ptr<InMemoryStore> store = std::make_shared<InMemoryStore>();
    std::shared_ptr<RecordingObserver> observer = std::make_shared<RecordingObserver>();
    std::unique_ptr<BackendHub> hub;

    HubFixture()
    {
        settings.set_cloud_address(kCloud);
        settings.set_local_address(kLocal);
        settings.set_quota_url(kQuota);
        hub = std::make_unique<BackendHub>(settings, store, server.client());
        hub->add_observer(observer);
    }
};

std::vector<std::string> names_of(const ModelList& models)
{
    std::vector<std::string> names;
    for (const auto& model : models) {
        names.push_back(model.name);
    }
    return names;
}

Json::Value stored_custom_servers(const IKeyValueStore& store)
{
    Json::Value root;
    const auto stored = store.get(BackendHub::kCustomServersKey);
    if (!stored) {
        return root;
    }
    Json::CharReaderBuilder reader_builder;
    std::istringstream stream(*stored);
    std::string errors;
    Json::parseFromStream(reader_builder, stream, &root, &errors);
    return root;
}

} // namespace

// =============================================================================
// Custom backends and persistence
// =============================================================================

TEST_CASE("Custom backends are persisted after every change") {
    HubFixture fixture;

    REQUIRE(fixture.hub->add_custom_backend("http://a:1", std::string("key-a")));
    REQUIRE(fixture.hub->add_custom_backend("http://b:1"));
    REQUIRE_FALSE(fixture.hub->add_custom_backend("http://a:1"));

    Json::Value records = stored_custom_servers(*fixture.store);
    REQUIRE(records.isArray());
    REQUIRE(records.size() == 2);
    REQUIRE(records[0]["address"].asString() == "http://a:1");
    REQUIRE(records[0]["enabled"].asBool());
    REQUIRE(records[0]["status"].asString() == "unchecked");
    REQUIRE(records[0]["apiKey"].asString() == "key-a");
    REQUIRE_FALSE(records[1].isMember("apiKey"));

    fixture.hub->toggle_backend("http://b:1");
    records = stored_custom_servers(*fixture.store);
    REQUIRE_FALSE(records[1]["enabled"].asBool());

    fixture.hub->remove_custom_backend("http://a:1");
    records = stored_custom_servers(*fixture.store);
    REQUIRE(records.size() == 1);
    REQUIRE(records[0]["address"].asString() == "http://b:1");
}

TEST_CASE("Persisted custom backends are restored, skipping bad records") {
    HubFixture fixture;
    fixture.store->set(BackendHub::kCustomServersKey,
                       "[{\"address\":\"http://a:1\",\"enabled\":true,\"status\":\"online\",\"apiKey\":\"k\"},"
                       "{\"address\":\"http://b:1\",\"enabled\":false,\"status\":\"offline\"},"
                       "{\"address\":\"http://a:1\",\"enabled\":false},"
                       "{\"enabled\":true},"
                       "42]");

    REQUIRE(fixture.hub->load_persisted() == 2);

    const auto custom = fixture.hub->registry().custom_backends();
    REQUIRE(custom.size() == 2);
    REQUIRE(custom[0].address == "http://a:1");
    REQUIRE(custom[0].enabled);
    REQUIRE(custom[0].credential == std::optional<std::string>("k"));
    REQUIRE(custom[0].health == HealthStatus::Unchecked);
    REQUIRE(custom[1].address == "http://b:1");
    REQUIRE_FALSE(custom[1].enabled);
}

TEST_CASE("Unreadable persisted state restores nothing") {
    HubFixture fixture;
    fixture.store->set(BackendHub::kCustomServersKey, "{broken");

    REQUIRE(fixture.hub->load_persisted() == 0);
    REQUIRE(fixture.hub->registry().custom_backends().empty());
}

// =============================================================================
// Health and catalog
// =============================================================================

TEST_CASE("A successful check activates the backend and refreshes the catalog") {
    HubFixture fixture;
    fixture.server.on_get("http://a:1/v1/models", 200, models_body({"m1", "m2"}));
    fixture.hub->add_custom_backend("http://a:1");

    const auto result = fixture.hub->check_backend("http://a:1");

    REQUIRE(result.online());
    REQUIRE(fixture.hub->registry().is_active("http://a:1"));
    REQUIRE(names_of(fixture.hub->catalog().current()) == std::vector<std::string>{"m1", "m2"});
    REQUIRE(fixture.observer->health == std::vector<std::string>{"http://a:1"});
    REQUIRE(fixture.observer->catalogs.size() == 1);
    REQUIRE(stored_custom_servers(*fixture.store)[0]["status"].asString() == "online");
}

TEST_CASE("Removing an active backend drops its models") {
    HubFixture fixture;
    fixture.server.on_get("http://a:1/v1/models", 200, models_body({"m1"}));
    fixture.hub->add_custom_backend("http://a:1");
    fixture.hub->check_backend("http://a:1");
    REQUIRE(fixture.hub->catalog().current().size() == 1);

    REQUIRE(fixture.hub->remove_custom_backend("http://a:1"));

    REQUIRE(fixture.hub->catalog().current().empty());
    REQUIRE(fixture.observer->catalogs.size() == 2);
}

TEST_CASE("A health sweep refreshes the catalog once") {
    HubFixture fixture;
    fixture.server.on_get(kLocal + "/v1/models", 200, models_body({"local-model"}));
    fixture.server.on_get(kLocal + "/api/tags", 200, "{\"models\":[{\"name\":\"local-model\"}]}");
    fixture.server.on_get("http://a:1/v1/models", 200, models_body({"m1"}));
    fixture.server.on_get("http://c:1/v1/models", 200, models_body({"m3"}));
    fixture.hub->add_custom_backend("http://a:1");
    fixture.hub->add_custom_backend("http://b:1");
    fixture.hub->add_custom_backend("http://c:1");

    const auto results = fixture.hub->check_all_backends();

    REQUIRE(results.size() == 4);
    REQUIRE(results[0].address == kLocal);
    REQUIRE_FALSE(results[2].online());
    REQUIRE(fixture.observer->catalogs.size() == 1);
    REQUIRE(names_of(fixture.hub->catalog().current()) ==
            std::vector<std::string>{"local-model", "m1", "m3"});
    REQUIRE(fixture.server.count("GET", kCloud + "/v1/models") == 0);
    REQUIRE(fixture.observer->empty_local.empty());
}

TEST_CASE("An online local daemon without models is reported") {
    HubFixture fixture;
    fixture.server.on_get(kLocal + "/v1/models", 200, models_body({}));
    fixture.server.on_get(kLocal + "/api/tags", 200, "{\"models\":[]}");

    const auto result = fixture.hub->check_backend(kLocal);

    REQUIRE(result.online());
    REQUIRE(fixture.observer->empty_local == std::vector<std::string>{kLocal});
}

TEST_CASE("Checking an unknown address reports offline") {
    HubFixture fixture;

    const auto result = fixture.hub->check_backend("http://nobody:1");

    REQUIRE_FALSE(result.online());
    REQUIRE(fixture.server.requests().empty());
}

// =============================================================================
// Cloud session and quota
// =============================================================================

TEST_CASE("The cloud backend cannot be enabled without a session") {
    HubFixture fixture;

    REQUIRE_FALSE(fixture.hub->set_cloud_enabled(true));
    REQUIRE_FALSE(fixture.hub->registry().find(kCloud)->enabled);
}

TEST_CASE("A session makes the enabled cloud backend active") {
    HubFixture fixture;
    fixture.server.on_get(kCloud + "/v1/models", 200, models_body({"gpt-oss"}));

    fixture.hub->set_session_token(std::string("session-1"));
    REQUIRE(fixture.hub->set_cloud_enabled(true));

    REQUIRE(fixture.hub->registry().is_active(kCloud));
    REQUIRE(fixture.hub->catalog().find("gpt-oss").has_value());
    const auto listing = fixture.server.last("GET", kCloud + "/v1/models");
    REQUIRE(header_value(*listing, "Authorization") == std::optional<std::string>("Bearer session-1"));
    REQUIRE(fixture.hub->connectivity() == ConnectivityStatus::Online);

    fixture.hub->set_session_token(std::nullopt);
    REQUIRE_FALSE(fixture.hub->registry().is_active(kCloud));
    REQUIRE(fixture.hub->catalog().current().empty());
}

TEST_CASE("Quota refresh only runs while the cloud backend is in use") {
    HubFixture fixture;
    fixture.server.on_get(kQuota, 200, "{\"used\":6,\"remaining\":4,\"limit\":10,\"tier\":\"free\"}");

    const auto idle = fixture.hub->refresh_quota();
    REQUIRE(idle.status == QuotaRefreshStatus::Unavailable);
    REQUIRE(fixture.server.count("GET", kQuota) == 0);

    fixture.hub->set_session_token(std::string("session-1"));
    fixture.hub->set_cloud_enabled(true);
    const auto active = fixture.hub->refresh_quota();

    REQUIRE(active.status == QuotaRefreshStatus::Ok);
    REQUIRE(fixture.hub->usage_tracker().snapshot()->remaining == 4);
    REQUIRE(fixture.observer->threshold_signals == 1);
    REQUIRE_FALSE(fixture.observer->quotas.empty());

    fixture.hub->set_cloud_enabled(false);
    REQUIRE_FALSE(fixture.hub->usage_tracker().snapshot().has_value());
    REQUIRE_FALSE(fixture.observer->quotas.back().has_value());
}

TEST_CASE("Turning the cloud backend on fetches the quota") {
    HubFixture fixture;
    fixture.server.on_get(kCloud + "/v1/models", 200, models_body({"gpt-oss"}));
    fixture.server.on_get(kQuota, 200, "{\"used\":1,\"remaining\":9,\"limit\":10,\"tier\":\"free\"}");
    fixture.server.on_post(kCloud + "/v1/chat/completions", 200,
                           "{\"choices\":[{\"message\":{\"content\":\"hi\"}}]}");

    fixture.hub->set_session_token(std::string("session-1"));
    REQUIRE(fixture.server.count("GET", kQuota) == 0);

    REQUIRE(fixture.hub->set_cloud_enabled(true));
    REQUIRE(fixture.server.count("GET", kQuota) == 1);
    REQUIRE(fixture.hub->usage_tracker().snapshot()->remaining == 9);
    REQUIRE(fixture.hub->usage_tracker().cached_remaining() == std::optional<int>(9));

    CompletionRequest request;
    request.model = "gpt-oss";
    request.prompt = "hello";
    REQUIRE(fixture.hub->send(request).success);
    REQUIRE(fixture.hub->usage_tracker().cached_remaining() == std::optional<int>(8));

    SECTION("a new session while enabled fetches it again") {
        fixture.hub->set_session_token(std::string("session-2"));
        REQUIRE(fixture.server.count("GET", kQuota) == 2);
        const auto request_sent = fixture.server.last("GET", kQuota);
        REQUIRE(header_value(*request_sent, "Authorization") == std::optional<std::string>("Bearer session-2"));
        REQUIRE(fixture.hub->usage_tracker().snapshot().has_value());
    }
}

TEST_CASE("A cloud 401 on completion expires the session") {
    HubFixture fixture;
    fixture.server.on_get(kCloud + "/v1/models", 200, models_body({"gpt-oss"}));
    fixture.server.on_post(kCloud + "/v1/chat/completions", 401, "{\"detail\":\"Token expired\"}");
    fixture.hub->set_session_token(std::string("session-1"));
    fixture.hub->set_cloud_enabled(true);

    CompletionRequest request;
    request.model = "gpt-oss";
    request.prompt = "hello";
    const auto response = fixture.hub->send(request);

    REQUIRE(response.error == CompletionError::Unauthorized);
    REQUIRE(fixture.hub->usage_tracker().session_expired());
    REQUIRE(fixture.observer->expired_signals == 1);

    const auto sent = fixture.server.last("POST", kCloud + "/v1/chat/completions");
    REQUIRE(header_value(*sent, "Authorization") == std::optional<std::string>("Bearer session-1"));
}

TEST_CASE("A custom backend 401 leaves the session alone") {
    HubFixture fixture;
    fixture.server.on_get("http://a:1/v1/models", 200, models_body({"m1"}));
    fixture.server.on_post("http://a:1/v1/chat/completions", 401, "");
    fixture.hub->add_custom_backend("http://a:1");
    fixture.hub->check_backend("http://a:1");

    CompletionRequest request;
    request.model = "m1";
    request.prompt = "hello";
    const auto response = fixture.hub->send(request);

    REQUIRE(response.error == CompletionError::Unauthorized);
    REQUIRE_FALSE(fixture.hub->usage_tracker().session_expired());
}

// =============================================================================
// Connectivity
// =============================================================================

TEST_CASE("Connectivity is offline with nothing online and no custom backends") {
    HubFixture fixture;

    REQUIRE(fixture.hub->connectivity() == ConnectivityStatus::Offline);
}

TEST_CASE("Connectivity stays unchecked while custom backends are unchecked") {
    HubFixture fixture;
    fixture.hub->add_custom_backend("http://a:1");

    REQUIRE(fixture.hub->connectivity() == ConnectivityStatus::Unchecked);

    fixture.hub->check_backend("http://a:1");
    REQUIRE(fixture.hub->connectivity() == ConnectivityStatus::Offline);
}

TEST_CASE("Connectivity goes online with any online backend and is signalled once") {
    HubFixture fixture;
    fixture.server.on_get(kLocal + "/v1/models", 200, models_body({"m"}));
    fixture.server.on_get(kLocal + "/api/tags", 200, "{\"models\":[{\"name\":\"m\"}]}");

    fixture.hub->check_backend(kLocal);
    fixture.hub->check_backend(kLocal);

    REQUIRE(fixture.hub->connectivity() == ConnectivityStatus::Online);
    REQUIRE(fixture.observer->connectivity == std::vector<ConnectivityStatus>{ConnectivityStatus::Online});

    fixture.hub->set_local_enabled(false);
    REQUIRE(fixture.hub->connectivity() == ConnectivityStatus::Offline);
    REQUIRE(fixture.observer->connectivity.back() == ConnectivityStatus::Offline);
}
