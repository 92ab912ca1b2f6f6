#include "embedding_config.hpp"
#include "server.hpp"

#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    std::string host = "localhost";
    int port = 50051;
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = std::stoi(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Usage: schemavec_server [--host HOST] [--port PORT] [--config FILE]" << std::endl;
            return 1;
        }
    }

    try {
        EmbeddingConfig config;
        if (!config_path.empty()) {
            config = load_config(config_path);
            std::cout << "[schemavec] Loaded config " << config_path << std::endl;
        }

        Server server(host, port, config);
        server.run();
    } catch (const std::exception& e) {
        std::cerr << "[schemavec] Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
