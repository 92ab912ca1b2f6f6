#pragma once

#include <atomic>
#include <string>

#include <nlohmann/json.hpp>

#include "embedding_config.hpp"
#include "schema_embedder.hpp"
#include "vector_db.hpp"
#include "word_index.hpp"

class Server {
public:
    // Throws ConfigurationError if config is invalid.
    Server(const std::string& host, int port, const EmbeddingConfig& config = EmbeddingConfig());
    ~Server();

    // Main accept loop. Blocks until shutdown.
    void run();

    // Routes one decoded request to its action handler. Never throws;
    // failures come back as {"status": "error", "message": ...}.
    nlohmann::json dispatch(const nlohmann::json& request);

    // Signal handler sets this to trigger clean shutdown.
    static std::atomic<bool> shutdown_requested;

private:
    std::string host_;
    int port_;
    int listen_fd_ = -1;
    SchemaEmbedder embedder_;
    // Vocabulary of the stored embeddings. Only store writes to it; search
    // queries are embedded against a copy and embed uses its own.
    WordIndex vocabulary_;
    VectorDB db_;

    void setup_socket();
    void handle_connection(int client_fd);

    nlohmann::json route(const nlohmann::json& request);
    nlohmann::json handle_embed(const nlohmann::json& request);
    nlohmann::json handle_store(const nlohmann::json& request);
    nlohmann::json handle_search(const nlohmann::json& request);
    nlohmann::json handle_remove(const nlohmann::json& request);
    nlohmann::json handle_stats(const nlohmann::json& request);
};
