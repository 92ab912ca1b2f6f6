#include "server.hpp"
#include "combiner.hpp"
#include "embedder.hpp"
#include "framing.hpp"
#include "schema_metadata.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <netdb.h>
#include <stdexcept>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

std::atomic<bool> Server::shutdown_requested{false};

static void signal_handler(int) {
    Server::shutdown_requested.store(true);
}

namespace {

struct SchemaPayload {
    std::string schema_text;
    SchemaMetadata metadata;
};

// schema_text plus either "columns" or entities / primary_key / foreign_keys.
SchemaPayload parse_schema_payload(const nlohmann::json& obj) {
    if (!obj.is_object() || !obj.contains("schema_text") || !obj["schema_text"].is_string()) {
        throw std::invalid_argument("schema requires a string 'schema_text'");
    }
    return {obj["schema_text"].get<std::string>(), parse_schema_metadata(obj)};
}

}  // namespace

Server::Server(const std::string& host, int port, const EmbeddingConfig& config)
    : host_(host),
      port_(port),
      embedder_(config,
                std::make_unique<HashingTextEmbedder>(std::max(DEFAULT_TEXT_MODEL_DIM, config.embedding_size))) {}

Server::~Server() {
    if (listen_fd_ >= 0) {
        close(listen_fd_);
    }
}

void Server::setup_socket() {
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        throw std::runtime_error("Failed to create socket: " + std::string(strerror(errno)));
    }

    int opt = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct addrinfo hints{}, *res;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    int rc = getaddrinfo(host_.c_str(), std::to_string(port_).c_str(), &hints, &res);
    if (rc != 0) {
        close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("getaddrinfo failed: " + std::string(gai_strerror(rc)));
    }

    if (bind(listen_fd_, res->ai_addr, res->ai_addrlen) < 0) {
        freeaddrinfo(res);
        close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Failed to bind: " + std::string(strerror(errno)));
    }
    freeaddrinfo(res);

    if (listen(listen_fd_, 8) < 0) {
        close(listen_fd_);
        listen_fd_ = -1;
        throw std::runtime_error("Failed to listen: " + std::string(strerror(errno)));
    }
}

void Server::run() {
    // Install signal handler
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    setup_socket();
    std::cout << "[schemavec] Listening on " << host_ << ":" << port_
              << " (" << embedder_.dimensions() << " dimensions)" << std::endl;

    while (!shutdown_requested.load()) {
        // Use select with timeout so we can check shutdown flag
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(listen_fd_, &fds);

        struct timeval tv;
        tv.tv_sec = 1;
        tv.tv_usec = 0;

        int ready = select(listen_fd_ + 1, &fds, nullptr, nullptr, &tv);
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[schemavec] select failed: " << strerror(errno) << std::endl;
            break;
        }
        if (ready == 0) continue; // timeout, check shutdown flag

        int client_fd = accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[schemavec] Accept error: " << strerror(errno) << std::endl;
            continue;
        }

        handle_connection(client_fd);
        close(client_fd);
    }

    std::cout << "\n[schemavec] Shutting down with " << db_.size() << " schemas stored." << std::endl;
}

void Server::handle_connection(int client_fd) {
    nlohmann::json response;
    try {
        std::string msg = read_message(client_fd);
        response = dispatch(nlohmann::json::parse(msg));
    } catch (const nlohmann::json::parse_error& e) {
        response = {{"status", "error"}, {"message", std::string("JSON parse error: ") + e.what()}};
    } catch (const std::exception& e) {
        std::cerr << "[schemavec] Bad request: " << e.what() << std::endl;
        response = {{"status", "error"}, {"message", e.what()}};
    }

    try {
        write_message(client_fd, response.dump());
    } catch (const std::exception& e) {
        std::cerr << "[schemavec] Failed to send response: " << e.what() << std::endl;
    }
}

nlohmann::json Server::dispatch(const nlohmann::json& request) {
    try {
        return route(request);
    } catch (const std::exception& e) {
        return {{"status", "error"}, {"message", e.what()}};
    }
}

nlohmann::json Server::route(const nlohmann::json& request) {
    if (!request.is_object() || !request.contains("action") || !request["action"].is_string()) {
        return {{"status", "error"}, {"message", "Missing or invalid 'action' field"}};
    }

    const std::string& action = request["action"].get_ref<const std::string&>();

    if (action == "embed") {
        return handle_embed(request);
    } else if (action == "store") {
        return handle_store(request);
    } else if (action == "search") {
        return handle_search(request);
    } else if (action == "remove") {
        return handle_remove(request);
    } else if (action == "stats") {
        return handle_stats(request);
    } else {
        return {{"status", "error"}, {"message", "Unknown action: " + action}};
    }
}

nlohmann::json Server::handle_embed(const nlohmann::json& request) {
    SchemaPayload schema = parse_schema_payload(request);

    nlohmann::json response = {{"status", "ok"}, {"dimensions", embedder_.dimensions()}};
    // Call-scoped vocabulary: the result depends only on this schema and the config.
    WordIndex vocabulary;
    if (request.value("generators", false)) {
        auto outputs = embedder_.generate_all(schema.schema_text, schema.metadata, vocabulary);
        response["embedding"] = combine(outputs, embedder_.config().generator_weights);
        response["generators"] = outputs;
    } else {
        response["embedding"] = embedder_.embed(schema.schema_text, schema.metadata, vocabulary);
    }
    return response;
}

nlohmann::json Server::handle_store(const nlohmann::json& request) {
    if (!request.contains("schema_id") || !request["schema_id"].is_string()) {
        return {{"status", "error"}, {"message", "store requires schema_id and schema_text"}};
    }

    const std::string& schema_id = request["schema_id"].get_ref<const std::string&>();
    std::string database = request.value("database", std::string(""));
    SchemaPayload schema = parse_schema_payload(request);
    nlohmann::json metadata = request.value("metadata", metadata_to_json(schema.metadata));

    std::vector<float> embedding = embedder_.embed(schema.schema_text, schema.metadata, vocabulary_);
    db_.store(schema_id, database, schema.schema_text, metadata, embedding);

    return {{"status", "ok"}};
}

nlohmann::json Server::handle_search(const nlohmann::json& request) {
    // Query schema may be nested under "query" or given inline.
    const nlohmann::json& query = request.contains("query") ? request["query"] : request;
    SchemaPayload schema = parse_schema_payload(query);
    int top_k = request.value("top_k", 5);
    std::string database_filter = request.value("database", std::string(""));

    // Query words outside the store vocabulary are indexed on a copy, so
    // searches leave the store untouched.
    WordIndex query_vocabulary = vocabulary_;
    std::vector<float> query_embedding = embedder_.embed(schema.schema_text, schema.metadata, query_vocabulary);
    auto results = db_.search(query_embedding, top_k, database_filter);

    nlohmann::json result_array = nlohmann::json::array();
    for (const auto& r : results) {
        result_array.push_back({
            {"schema_id", r.schema_id},
            {"database", r.database},
            {"score", r.score},
            {"metadata", r.metadata}
        });
    }

    return {{"status", "ok"}, {"results", result_array}};
}

nlohmann::json Server::handle_remove(const nlohmann::json& request) {
    if (!request.contains("schema_id") || !request["schema_id"].is_string()) {
        return {{"status", "error"}, {"message", "remove requires schema_id"}};
    }
    bool removed = db_.remove(request["schema_id"].get<std::string>());
    return {{"status", "ok"}, {"removed", removed}};
}

nlohmann::json Server::handle_stats(const nlohmann::json&) {
    return {
        {"status", "ok"},
        {"schemas", db_.size()},
        {"vocabulary", vocabulary_.count()},
        {"databases", db_.database_count()},
        {"dimensions", embedder_.dimensions()}
    };
}
