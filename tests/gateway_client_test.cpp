#include "services/llm/gateway_client.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <thread>

using namespace vigil::services::llm;
using namespace vigil::testing;
using json = nlohmann::json;

namespace {

constexpr const char* kModelsBody = R"({"data":[{"id":"qwen2.5-coder"},{"id":"llama-3.1"}]})";

std::string chat_body(const std::string& content) {
    return json{{"choices", {{{"message", {{"role", "assistant"}, {"content", content}}}}}}}.dump();
}

std::string stream_frame(const std::string& content) {
    return "data: " + json{{"choices", {{{"delta", {{"content", content}}}}}}}.dump() + "\n\n";
}

class GatewayClientTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    ManualClock clock;

    GatewayConfig config() {
        GatewayConfig c;
        c.base_url = "http://127.0.0.1:1234/v1";
        c.api_key = "secret";
        c.models_ttl = std::chrono::seconds(15);
        return c;
    }

    std::unique_ptr<GatewayClient> make(GatewayConfig c) {
        return std::make_unique<GatewayClient>(c, transport, clock.fn());
    }

    std::unique_ptr<GatewayClient> make() { return make(config()); }
};

} // namespace

TEST_F(GatewayClientTest, RefreshParsesModelsAndPinsCandidate) {
    transport->set_handler([](const Call& call) {
        return call.url == "http://127.0.0.1:1234/v1/models" ? ok(kModelsBody) : connect_error();
    });
    auto client = make();

    auto models = client->refresh_models(true);

    EXPECT_EQ(models, (std::vector<std::string>{"qwen2.5-coder", "llama-3.1"}));
    EXPECT_TRUE(client->connected());
    EXPECT_FALSE(client->last_error().has_value());
    EXPECT_EQ(client->sticky_base_url(), "http://127.0.0.1:1234/v1");
}

TEST_F(GatewayClientTest, FallsThroughCandidatesUntilOneAnswers) {
    transport->set_handler([](const Call& call) {
        return call.url == "http://localhost:1234/api/v0/models" ? ok(kModelsBody) : connect_error();
    });
    auto client = make();

    EXPECT_EQ(client->refresh_models(true).size(), 2u);
    EXPECT_EQ(client->sticky_base_url(), "http://localhost:1234/api/v0");
    EXPECT_EQ(client->base_url(), "http://localhost:1234/api/v0");

    // The pinned root is probed first from now on
    clock.advance(std::chrono::seconds(20));
    size_t before = transport->calls().size();
    client->refresh_models();
    auto calls = transport->calls();
    ASSERT_EQ(calls.size(), before + 1);
    EXPECT_EQ(calls.back().url, "http://localhost:1234/api/v0/models");
}

TEST_F(GatewayClientTest, ToleratesHeterogeneousModelShapes) {
    EXPECT_EQ(parse_model_list(R"([{"name":"a"},{"model":"b"},{"id":"c","name":"x"}])"),
              (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(parse_model_list(R"({"data":[{"id":""},{"id":5},"str",{"name":"ok"}]})"),
              (std::vector<std::string>{"ok"}));
    // Empty or null keys fall through; a non-string id drops the entry
    EXPECT_EQ(parse_model_list(R"([{"id":null,"name":"n"},{"id":"","model":"m"},{"id":7,"name":"x"},{"id":0,"name":"z"}])"),
              (std::vector<std::string>{"n", "m", "z"}));
    EXPECT_TRUE(parse_model_list(R"({"object":"list"})").empty());
    EXPECT_THROW(parse_model_list("<html>"), json::exception);
}

TEST_F(GatewayClientTest, CachedCatalogWithinTtlSkipsNetwork) {
    transport->set_handler([](const Call&) { return ok(kModelsBody); });
    auto client = make();

    client->refresh_models(true);
    EXPECT_EQ(transport->count("GET", "/models"), 1u);

    clock.advance(std::chrono::seconds(10));
    EXPECT_EQ(client->refresh_models().size(), 2u);
    EXPECT_EQ(transport->count("GET", "/models"), 1u);

    clock.advance(std::chrono::seconds(6));
    client->refresh_models();
    EXPECT_EQ(transport->count("GET", "/models"), 2u);
}

TEST_F(GatewayClientTest, ForceBypassesTtl) {
    transport->set_handler([](const Call&) { return ok(kModelsBody); });
    auto client = make();

    client->refresh_models(true);
    client->refresh_models(true);
    EXPECT_EQ(transport->count("GET", "/models"), 2u);
}

TEST_F(GatewayClientTest, ConcurrentStaleRefreshesShareOneRoundTrip) {
    transport->set_handler([](const Call&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return ok(kModelsBody);
    });
    auto client = make();

    std::vector<std::string> first;
    std::vector<std::string> second;
    std::thread a([&] { first = client->refresh_models(); });
    std::thread b([&] { second = client->refresh_models(); });
    a.join();
    b.join();

    EXPECT_EQ(transport->count("GET", "/models"), 1u);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.size(), 2u);
}

TEST_F(GatewayClientTest, RetriesSameCandidateWithBearerTokenOnAuthChallenge) {
    transport->set_handler([](const Call& call) {
        if (call.headers.count("Authorization") == 0) {
            return status(401, "Unauthorized");
        }
        return ok(kModelsBody);
    });
    auto client = make();

    client->refresh_models(true);

    auto calls = transport->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].url, calls[1].url);
    EXPECT_EQ(calls[1].headers.at("Authorization"), "Bearer secret");
    EXPECT_TRUE(client->connected());
}

TEST_F(GatewayClientTest, FallbackTokenWhenNoneConfigured) {
    transport->set_handler([](const Call& call) {
        return call.headers.count("Authorization") ? ok(kModelsBody) : status(403, "Forbidden");
    });
    auto c = config();
    c.api_key.clear();
    ::unsetenv("LMSTUDIO_API_KEY");
    auto client = make(c);

    client->refresh_models(true);
    EXPECT_EQ(transport->calls().back().headers.at("Authorization"), "Bearer lm-studio");
}

TEST_F(GatewayClientTest, UnreachableServerClearsCatalogWithConnectMessage) {
    auto client = make();

    auto models = client->refresh_models(true);

    EXPECT_TRUE(models.empty());
    EXPECT_FALSE(client->connected());
    EXPECT_EQ(client->last_error(), "Can't connect to LM Studio. Is it running?");
    EXPECT_EQ(transport->count("GET", "/models"), client->candidates().size());
}

TEST_F(GatewayClientTest, HttpFailureReportsStatusOfLastCandidate) {
    transport->set_handler([](const Call&) { return status(404, "Not Found"); });
    auto client = make();

    client->refresh_models(true);

    EXPECT_FALSE(client->connected());
    EXPECT_EQ(client->last_error(), "404 Not Found");
}

TEST_F(GatewayClientTest, MalformedBodyStopsProbing) {
    transport->set_handler([](const Call&) { return ok("not json"); });
    auto client = make();

    client->refresh_models(true);

    EXPECT_EQ(transport->calls().size(), 1u);
    EXPECT_FALSE(client->connected());
    ASSERT_TRUE(client->last_error().has_value());
    EXPECT_NE(client->last_error()->find("invalid models response"), std::string::npos);
}

TEST_F(GatewayClientTest, EmptyCatalogIsConnectedWithNotice) {
    transport->set_handler([](const Call&) { return ok(R"({"data":[]})"); });
    auto client = make();

    EXPECT_TRUE(client->refresh_models(true).empty());
    EXPECT_TRUE(client->connected());
    EXPECT_EQ(client->last_error(), "No models returned.");
}

TEST_F(GatewayClientTest, DisconnectAfterSuccessClearsModels) {
    transport->set_handler([](const Call&) { return ok(kModelsBody); });
    auto client = make();
    client->refresh_models(true);
    ASSERT_TRUE(client->connected());

    transport->set_handler([](const Call&) { return connect_error(); });
    client->refresh_models(true);

    EXPECT_FALSE(client->connected());
    EXPECT_TRUE(client->models().empty());
    // Sticky root survives and is still tried first
    EXPECT_EQ(client->candidates().front(), "http://127.0.0.1:1234/v1");
}

TEST_F(GatewayClientTest, ChatSendsPayloadAndReturnsContent) {
    transport->set_handler([](const Call& call) {
        return call.method == "POST" ? ok(chat_body("pong")) : connect_error();
    });
    auto client = make();

    ChatRequest request;
    request.prompt = "Reply with exactly: pong";
    request.context = "ctx";
    request.model = "qwen2.5-coder";
    auto result = client->chat(request);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.text(), "pong");

    auto calls = transport->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].url, "http://127.0.0.1:1234/v1/chat/completions");
    EXPECT_TRUE(calls[0].headers.empty());

    auto payload = json::parse(calls[0].body);
    EXPECT_EQ(payload["model"], "qwen2.5-coder");
    EXPECT_EQ(payload["stream"], false);
    EXPECT_EQ(payload["max_tokens"], 500);
    EXPECT_NEAR(payload["temperature"].get<double>(), 0.3, 1e-6);
    ASSERT_EQ(payload["messages"].size(), 2u);
    EXPECT_EQ(payload["messages"][0]["role"], "system");
    EXPECT_EQ(payload["messages"][1]["content"], "Reply with exactly: pong\n\n```\nctx\n```");
    EXPECT_EQ(client->sticky_base_url(), "http://127.0.0.1:1234/v1");
}

TEST_F(GatewayClientTest, ChatOmitsModelWhenUnset) {
    transport->set_handler([](const Call&) { return ok(chat_body("x")); });
    auto client = make();

    client->chat(ChatRequest{"p", "c", std::nullopt});
    EXPECT_FALSE(json::parse(transport->calls()[0].body).contains("model"));
}

TEST_F(GatewayClientTest, ChatFailuresAreErrorStrings) {
    auto client = make();
    EXPECT_EQ(client->chat(ChatRequest{"p", "c", std::nullopt}).text(),
              "Error: Can't connect to LM Studio. Is it running?");

    transport->set_handler([](const Call&) { return status(500, "Internal Server Error"); });
    EXPECT_EQ(client->chat(ChatRequest{"p", "c", std::nullopt}).text(),
              "Error: 500 Internal Server Error");

    transport->set_handler([](const Call&) { return other_error("Read timeout"); });
    EXPECT_EQ(client->chat(ChatRequest{"p", "c", std::nullopt}).text(), "Error: Read timeout");
    EXPECT_EQ(transport->count("POST", "/chat/completions"),
              2 * client->candidates().size() + 1);
}

TEST_F(GatewayClientTest, ChatWithMissingChoicesIsAnError) {
    transport->set_handler([](const Call&) { return ok(R"({"choices":[]})"); });
    auto client = make();

    auto result = client->chat(ChatRequest{"p", "c", std::nullopt});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.text().rfind("Error: invalid chat response", 0), 0u);
}

TEST_F(GatewayClientTest, ChatRetriesWithCredentials) {
    transport->set_handler([](const Call& call) {
        return call.headers.count("Authorization") ? ok(chat_body("fine")) : status(401, "Unauthorized");
    });
    auto client = make();

    EXPECT_EQ(client->chat(ChatRequest{"p", "c", std::nullopt}).text(), "fine");
    EXPECT_EQ(transport->calls().size(), 2u);
}

TEST_F(GatewayClientTest, StreamYieldsFragmentsUntilDone) {
    transport->set_handler([](const Call&) {
        return ok(": keepalive\n\n" + stream_frame("Hel") + "data: {broken\n\n" +
                  stream_frame("lo") + "data: [DONE]\n\n" + stream_frame("ignored"));
    });
    auto client = make();

    std::vector<std::string> fragments;
    auto result = client->chat_stream(ChatRequest{"p", "c", std::nullopt},
        [&](const std::string& f) { fragments.push_back(f); });

    EXPECT_TRUE(result.success);
    EXPECT_EQ(fragments, (std::vector<std::string>{"Hel", "lo"}));
    EXPECT_EQ(result.content, "Hello");

    auto calls = transport->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].headers.at("Authorization"), "Bearer secret");
    EXPECT_EQ(json::parse(calls[0].body)["stream"], true);
}

TEST_F(GatewayClientTest, StreamSkipsCandidateOnAuthFailure) {
    transport->set_handler([](const Call& call) {
        if (call.url == "http://127.0.0.1:1234/v1/chat/completions") {
            return status(403, "Forbidden");
        }
        return ok(stream_frame("ok") + "data: [DONE]\n");
    });
    auto client = make();

    std::vector<std::string> fragments;
    client->chat_stream(ChatRequest{"p", "c", std::nullopt},
        [&](const std::string& f) { fragments.push_back(f); });

    EXPECT_EQ(fragments, std::vector<std::string>{"ok"});
    EXPECT_EQ(transport->calls().size(), 2u);
    EXPECT_EQ(client->sticky_base_url(), "http://127.0.0.1:1234/api/v0");
}

TEST_F(GatewayClientTest, StreamExhaustionYieldsSingleErrorFragment) {
    auto client = make();

    std::vector<std::string> fragments;
    auto result = client->chat_stream(ChatRequest{"p", "c", std::nullopt},
        [&](const std::string& f) { fragments.push_back(f); });

    EXPECT_FALSE(result.success);
    EXPECT_EQ(fragments, std::vector<std::string>{"Error: Can't connect to LM Studio. Is it running?"});
}

TEST_F(GatewayClientTest, StickyRootIsTriedFirstButNotExclusively) {
    transport->set_handler([](const Call& call) {
        return call.url == "http://localhost:1234/v1/chat/completions" ? ok(chat_body("a")) : connect_error();
    });
    auto client = make();
    ASSERT_TRUE(client->chat(ChatRequest{"p", "c", std::nullopt}).success);
    EXPECT_EQ(client->candidates().front(), "http://localhost:1234/v1");

    transport->set_handler([](const Call& call) {
        return call.url == "http://127.0.0.1:1234/api/v0/chat/completions" ? ok(chat_body("b")) : connect_error();
    });
    EXPECT_EQ(client->chat(ChatRequest{"p", "c", std::nullopt}).text(), "b");
    EXPECT_EQ(client->sticky_base_url(), "http://127.0.0.1:1234/api/v0");
}

TEST_F(GatewayClientTest, NonUtf8ContextIsSentWithReplacementCharacters) {
    transport->set_handler([](const Call&) { return ok(chat_body("noted")); });
    auto client = make();

    ChatRequest request{"Explain", "+caf\xe9 = 1\n", std::nullopt};
    ChatResult result;
    ASSERT_NO_THROW(result = client->chat(request));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.content, "noted");

    auto payload = json::parse(transport->calls().back().body);
    EXPECT_NE(payload["messages"][1]["content"].get<std::string>().find("+caf\xEF\xBF\xBD = 1"),
              std::string::npos);
}

TEST_F(GatewayClientTest, NonUtf8ContextStreams) {
    transport->set_handler([](const Call&) {
        return ok(stream_frame("ok") + "data: [DONE]\n\n");
    });
    auto client = make();

    std::vector<std::string> fragments;
    ChatResult result;
    ASSERT_NO_THROW(result = client->chat_stream({"Explain", "\xff\xfe binary", std::nullopt},
        [&fragments](const std::string& f) { fragments.push_back(f); }));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(fragments, std::vector<std::string>{"ok"});
}

TEST_F(GatewayClientTest, StreamWithoutCallbackCollectsText) {
    transport->set_handler([](const Call&) {
        return ok(stream_frame("a") + stream_frame("b") + "data: [DONE]\n\n");
    });
    auto client = make();

    ChatResult result;
    ASSERT_NO_THROW(result = client->chat_stream({"p", "c", std::nullopt}, nullptr));
    EXPECT_EQ(result.content, "ab");

    transport->set_handler([](const Call&) { return connect_error(); });
    ASSERT_NO_THROW(result = client->chat_stream({"p", "c", std::nullopt}, StreamCallback{}));
    EXPECT_FALSE(result.success);
}
