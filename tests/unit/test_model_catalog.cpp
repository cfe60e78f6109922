/*
 * Unit tests for model catalog aggregation
 * Part of Inference Hub - one front door for many OpenAI-compatible backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <catch2/catch_test_macros.hpp>
#include "BackendRegistry.hpp"
#include "ModelCatalog.hpp"
#include "TestHelpers.hpp"

#include <future>
#include <string>
#include <thread>
#include <vector>

namespace {

std::vector<std::string> names_of(const ModelList& models)
{
    std::vector<std::string> names;
    for (const auto& model : models) {
        names.push_back(model.name);
    }
    return names;
}

} // namespace

// =============================================================================
// Listing parser
// =============================================================================

TEST_CASE("Model listings map id, parameter_size and flags") {
    const std::string body =
        "{\"data\":["
        "{\"id\":\"gemma3:4b\",\"parameter_size\":\"4.3B\",\"multimodal\":true},"
        "{\"id\":\"gpt-oss\",\"pro\":true}"
        "]}";

    const auto models = ModelCatalog::parse_models_response(body, "http://a:1");

    REQUIRE(models.has_value());
    REQUIRE(models->size() == 2);
    REQUIRE((*models)[0].name == "gemma3:4b");
    REQUIRE((*models)[0].server == "http://a:1");
    REQUIRE((*models)[0].parameter_size == std::optional<std::string>("4.3B"));
    REQUIRE((*models)[0].multimodal);
    REQUIRE_FALSE((*models)[0].pro);
    REQUIRE((*models)[1].pro);
    REQUIRE_FALSE((*models)[1].parameter_size.has_value());
}

TEST_CASE("Invalid JSON is reported, odd shapes yield nothing") {
    REQUIRE_FALSE(ModelCatalog::parse_models_response("not json", "http://a:1").has_value());

    const auto no_data = ModelCatalog::parse_models_response("{\"models\":[]}", "http://a:1");
    REQUIRE(no_data.has_value());
    REQUIRE(no_data->empty());

    const auto bad_items = ModelCatalog::parse_models_response(
        "{\"data\":[{\"name\":\"x\"},{\"id\":\"\"},{\"id\":42},\"str\",{\"id\":\"ok\"}]}", "http://a:1");
    REQUIRE(bad_items.has_value());
    REQUIRE(names_of(*bad_items) == std::vector<std::string>{"ok"});
}

// =============================================================================
// Aggregation
// =============================================================================

TEST_CASE("An offline backend contributes nothing and never blanks the others") {
    FakeHttpServer server;
    server.on_get("http://a:1/v1/models", 200, models_body({"m1", "m2"}));
    server.on_get("http://c:1/v1/models", 200, models_body({"m3"}));

    BackendRegistry registry("http://cloud:1", "http://local:1");
    ModelCatalog catalog(server.client());

    const auto models = catalog.refresh({"http://a:1", "http://b:1", "http://c:1"}, registry);

    REQUIRE(names_of(models) == std::vector<std::string>{"m1", "m2", "m3"});
    REQUIRE(models[2].server == "http://c:1");
    REQUIRE(catalog.current() == models);
    REQUIRE(catalog.generation() == 1);
}

TEST_CASE("A malformed payload from one backend is skipped") {
    FakeHttpServer server;
    server.on_get("http://a:1/v1/models", 200, "<html>gateway</html>");
    server.on_get("http://b:1/v1/models", 200, models_body({"m1"}));

    BackendRegistry registry("http://cloud:1", "http://local:1");
    ModelCatalog catalog(server.client());

    const auto models = catalog.refresh({"http://a:1", "http://b:1"}, registry);
    REQUIRE(names_of(models) == std::vector<std::string>{"m1"});
}

TEST_CASE("Lookup by name returns the first backend in order") {
    FakeHttpServer server;
    server.on_get("http://a:1/v1/models", 200, models_body({"llama3"}));
    server.on_get("http://b:1/v1/models", 200, models_body({"llama3", "phi"}));

    BackendRegistry registry("http://cloud:1", "http://local:1");
    ModelCatalog catalog(server.client());
    catalog.refresh({"http://a:1", "http://b:1"}, registry);

    REQUIRE(catalog.find("llama3")->server == "http://a:1");
    REQUIRE(catalog.find("llama3", "http://b:1")->server == "http://b:1");
    REQUIRE(catalog.find("phi")->server == "http://b:1");
    REQUIRE_FALSE(catalog.find("missing").has_value());
}

TEST_CASE("Each backend is queried with its own credential") {
    FakeHttpServer server;
    server.on_get("http://a:1/v1/models", 200, models_body({"m1"}));
    server.on_get("http://b:1/v1/models", 200, models_body({"m2"}));

    BackendRegistry registry("http://cloud:1", "http://local:1");
    registry.add("http://a:1", std::string("key-a"));
    registry.add("http://b:1");

    ModelCatalog catalog(server.client(), 1234);
    catalog.refresh({"http://a:1", "http://b:1"}, registry);

    const auto request_a = server.last("GET", "http://a:1/v1/models");
    const auto request_b = server.last("GET", "http://b:1/v1/models");
    REQUIRE(header_value(*request_a, "Authorization") == std::optional<std::string>("Bearer key-a"));
    REQUIRE_FALSE(header_value(*request_b, "Authorization").has_value());
    REQUIRE(request_a->timeout_ms == 1234);
}

TEST_CASE("An empty active set empties the catalog") {
    FakeHttpServer server;
    server.on_get("http://a:1/v1/models", 200, models_body({"m1"}));

    BackendRegistry registry("http://cloud:1", "http://local:1");
    ModelCatalog catalog(server.client());
    catalog.refresh({"http://a:1"}, registry);
    REQUIRE(catalog.current().size() == 1);

    REQUIRE(catalog.refresh({}, registry).empty());
    REQUIRE(catalog.current().empty());
    REQUIRE(catalog.generation() == 2);
}

TEST_CASE("A refresh that finishes after a newer one is discarded") {
    std::promise<void> slow_started;
    std::promise<void> release_slow;
    std::shared_future<void> release = release_slow.get_future().share();

    HttpClient client = [&slow_started, release](const HttpRequest& request) {
        HttpResponse response;
        response.status_code = 200;
        if (request.url == "http://slow:1/v1/models") {
            slow_started.set_value();
            release.wait();
            response.body = models_body({"stale"});
        } else {
            response.body = models_body({"fresh"});
        }
        return response;
    };

    BackendRegistry registry("http://cloud:1", "http://local:1");
    ModelCatalog catalog(client);

    auto older = std::async(std::launch::async, [&] {
        return catalog.refresh({"http://slow:1"}, registry);
    });
    slow_started.get_future().wait();

    const auto newer = catalog.refresh({"http://fast:1"}, registry);
    REQUIRE(names_of(newer) == std::vector<std::string>{"fresh"});

    release_slow.set_value();
    const auto older_result = older.get();

    REQUIRE(names_of(older_result) == std::vector<std::string>{"fresh"});
    REQUIRE(names_of(catalog.current()) == std::vector<std::string>{"fresh"});
    REQUIRE(catalog.generation() == 1);
}

TEST_CASE("Refreshing from the registry queries only its active set") {
    FakeHttpServer server;
    server.on_get("http://a:1/v1/models", 200, models_body({"m1"}));
    server.on_get("http://b:1/v1/models", 200, models_body({"m2"}));

    BackendRegistry registry("http://cloud:1", "http://local:1");
    registry.add("http://a:1");
    registry.add("http://b:1");
    registry.set_health("http://a:1", HealthStatus::Online);

    ModelCatalog catalog(server.client());
    const auto models = catalog.refresh(registry);

    REQUIRE(names_of(models) == std::vector<std::string>{"m1"});
    REQUIRE(server.count("GET", "http://b:1/v1/models") == 0);
    REQUIRE(server.count("GET", "http://local:1/v1/models") == 0);
}

TEST_CASE("A removed backend never returns through an older registry refresh") {
    std::promise<void> slow_started;
    std::promise<void> release_slow;
    std::shared_future<void> release = release_slow.get_future().share();

    HttpClient client = [&slow_started, release](const HttpRequest& request) {
        HttpResponse response;
        response.status_code = 200;
        if (request.url == "http://old:1/v1/models") {
            slow_started.set_value();
            release.wait();
            response.body = models_body({"removed-model"});
        } else {
            response.body = models_body({"kept-model"});
        }
        return response;
    };

    BackendRegistry registry("http://cloud:1", "http://local:1");
    registry.add("http://old:1");
    registry.set_health("http://old:1", HealthStatus::Online);
    ModelCatalog catalog(client);

    auto older = std::async(std::launch::async, [&] { return catalog.refresh(registry); });
    slow_started.get_future().wait();

    registry.remove("http://old:1");
    registry.add("http://new:1");
    registry.set_health("http://new:1", HealthStatus::Online);
    const auto newer = catalog.refresh(registry);
    REQUIRE(names_of(newer) == std::vector<std::string>{"kept-model"});

    release_slow.set_value();
    older.get();

    REQUIRE(names_of(catalog.current()) == std::vector<std::string>{"kept-model"});
    REQUIRE_FALSE(catalog.find("removed-model").has_value());
}
