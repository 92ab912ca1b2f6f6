#include <gtest/gtest.h>

#include "embedding_config.hpp"
#include "server.hpp"

#include <string>

#include <nlohmann/json.hpp>

using nlohmann::json;

class ServerDispatchTest : public ::testing::Test {
protected:
    static EmbeddingConfig small_config() {
        EmbeddingConfig config;
        config.embedding_size = 128;
        return config;
    }

    json store(const std::string& id, const std::string& database, const std::string& text) {
        return server.dispatch({
            {"action", "store"}, {"schema_id", id}, {"database", database}, {"schema_text", text}
        });
    }

    Server server{"localhost", 0, small_config()};
};

TEST_F(ServerDispatchTest, EmbedReturnsUnitVector) {
    json response = server.dispatch({
        {"action", "embed"},
        {"schema_text", "create table users (id int primary key, name varchar(50))"},
        {"entities", {"users", "id", "name"}},
        {"primary_key", "id"}
    });

    ASSERT_EQ(response["status"], "ok");
    EXPECT_EQ(response["dimensions"], 128);
    ASSERT_EQ(response["embedding"].size(), 128u);
    double sum = 0.0;
    for (const auto& v : response["embedding"]) {
        sum += v.get<double>() * v.get<double>();
    }
    EXPECT_NEAR(sum, 1.0, 1e-4);
}

TEST_F(ServerDispatchTest, EmbedCanReturnGeneratorOutputs) {
    json response = server.dispatch({
        {"action", "embed"}, {"schema_text", "create table logs (message text)"}, {"generators", true}
    });

    ASSERT_EQ(response["status"], "ok");
    EXPECT_TRUE(response["generators"].contains("enhanced"));
    EXPECT_TRUE(response["generators"].contains("primary_key_aware"));
    EXPECT_TRUE(response["generators"].contains("foreign_key_aware"));
    EXPECT_FALSE(response["generators"].contains("learned"));
}

TEST_F(ServerDispatchTest, StoreThenSearchFindsIdenticalSchemaFirst) {
    ASSERT_EQ(store("shop.users", "shop", "create table users (id int primary key, email varchar(80))")["status"], "ok");
    ASSERT_EQ(store("shop.orders", "shop", "create table orders (order_id int, customer_id int, total decimal)")["status"], "ok");
    ASSERT_EQ(store("crm.notes", "crm", "create table notes (body text, created_at timestamp)")["status"], "ok");

    json response = server.dispatch({
        {"action", "search"},
        {"query", {{"schema_text", "create table orders (order_id int, customer_id int, total decimal)"}}},
        {"top_k", 2}
    });

    ASSERT_EQ(response["status"], "ok");
    ASSERT_EQ(response["results"].size(), 2u);
    EXPECT_EQ(response["results"][0]["schema_id"], "shop.orders");
    EXPECT_NEAR(response["results"][0]["score"].get<double>(), 1.0, 1e-4);
}

TEST_F(ServerDispatchTest, SearchHonoursDatabaseFilter) {
    store("shop.users", "shop", "create table users (id int primary key)");
    store("crm.notes", "crm", "create table notes (body text)");

    json response = server.dispatch({
        {"action", "search"}, {"schema_text", "create table users (id int primary key)"}, {"database", "crm"}
    });

    ASSERT_EQ(response["results"].size(), 1u);
    EXPECT_EQ(response["results"][0]["schema_id"], "crm.notes");
}

TEST_F(ServerDispatchTest, StoreAcceptsColumnRecords) {
    json response = server.dispatch({
        {"action", "store"},
        {"schema_id", "shop.customers"},
        {"schema_text", "create table customers (id int primary key)"},
        {"columns", json::array({
            {{"table", "customers"}, {"column", "id"}, {"data_type", "int"}, {"is_primary_key", true}}
        })}
    });
    ASSERT_EQ(response["status"], "ok");

    json results = server.dispatch({
        {"action", "search"}, {"schema_text", "create table customers (id int primary key)"}
    })["results"];
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0]["metadata"]["primary_key"], "id");
}

TEST_F(ServerDispatchTest, RemoveAndStats) {
    store("shop.users", "shop", "create table users (id int)");
    store("crm.notes", "crm", "create table notes (body text)");

    json stats = server.dispatch({{"action", "stats"}});
    EXPECT_EQ(stats["schemas"], 2);
    EXPECT_EQ(stats["databases"], 2);
    EXPECT_EQ(stats["dimensions"], 128);
    EXPECT_GT(stats["vocabulary"].get<int>(), 0);

    EXPECT_EQ(server.dispatch({{"action", "remove"}, {"schema_id", "crm.notes"}})["removed"], true);
    EXPECT_EQ(server.dispatch({{"action", "remove"}, {"schema_id", "crm.notes"}})["removed"], false);
    EXPECT_EQ(server.dispatch({{"action", "stats"}})["schemas"], 1);
}

TEST_F(ServerDispatchTest, MalformedRequestsGetErrorResponses) {
    EXPECT_EQ(server.dispatch({{"schema_text", "x"}})["status"], "error");
    EXPECT_EQ(server.dispatch({{"action", "rebuild"}})["status"], "error");
    EXPECT_EQ(server.dispatch({{"action", "embed"}})["status"], "error");
    EXPECT_EQ(server.dispatch({{"action", "store"}, {"schema_text", "x"}})["status"], "error");
    EXPECT_EQ(server.dispatch({{"action", "embed"}, {"schema_text", 42}})["status"], "error");
    EXPECT_EQ(server.dispatch(json::array())["status"], "error");
}

TEST_F(ServerDispatchTest, EmbedDoesNotDependOnEarlierRequests) {
    json x = {{"action", "embed"}, {"schema_text", "create table users (id int primary key, name varchar(50))"},
              {"primary_key", "id"}};

    Server fresh{"localhost", 0, small_config()};
    json first = fresh.dispatch(x);

    server.dispatch({{"action", "embed"}, {"schema_text", "alter view reports refresh materialized now"}});
    store("shop.orders", "shop", "create table orders (order_id int, total decimal)");
    json second = server.dispatch(x);

    ASSERT_EQ(first["status"], "ok");
    EXPECT_EQ(first["embedding"], second["embedding"]);
}

TEST_F(ServerDispatchTest, SearchLeavesVocabularyUnchanged) {
    store("shop.users", "shop", "create table users (id int primary key)");
    json before = server.dispatch({{"action", "stats"}})["vocabulary"];
    ASSERT_GT(before.get<int>(), 0);

    for (const char* text : {"alter view reports refresh", "create table notes (body text)", "drop sequence s1"}) {
        json response = server.dispatch({{"action", "search"}, {"schema_text", text}});
        ASSERT_EQ(response["status"], "ok");
    }
    server.dispatch({{"action", "embed"}, {"schema_text", "create table audit (actor varchar)"}});

    EXPECT_EQ(server.dispatch({{"action", "stats"}})["vocabulary"], before);
}

TEST(ServerConfigTest, InvalidConfigFailsAtConstruction) {
    EmbeddingConfig config;
    config.generator_weights = {{"enhanced", 0.0f}};
    EXPECT_THROW(Server("localhost", 0, config), std::runtime_error);
}
