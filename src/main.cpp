#include "hubagent/agent/agent.hpp"
#include "hubagent/crypto/signature_verifier.hpp"
#include "hubagent/system/signals.hpp"
#include "hubagent/update/binary_verifier.hpp"
#include "hubagent/util/agent_config.hpp"
#include "hubagent/util/logger.hpp"
#include "hubagent/util/proxy.hpp"
#include "hubagent/util/version.hpp"

#include <cstdio>
#include <cstring>
#include <curl/curl.h>
#include <fstream>
#include <getopt.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-l <level>] <command>\n"
        "\n"
        "Commands:\n"
        "  start                     Run the agent until SIGINT/SIGTERM\n"
        "  update                    Replace this binary with the hub's current agent\n"
        "  verify <file> <metadata>  Check a file against a metadata JSON document\n"
        "  version                   Print the agent version\n"
        "\n"
        "Options:\n"
        "  -c, --config    Agent config (default %s)\n"
        "  -l, --log-level debug|info|warn|error|none\n"
        "  -h, --help      Show this help\n",
        argv, hubagent::kDefaultConfigPath);
}

int RunVerify(const hubagent::AgentConfig &cfg, const char *file, const char *metadata_path) {
    std::ifstream is(metadata_path);
    if (!is.good()) {
        LogError("cannot open metadata: %s", metadata_path);
        return 1;
    }

    hubagent::UpdateMetadata metadata;
    try {
        metadata = nlohmann::json::parse(is).get<hubagent::UpdateMetadata>();
    } catch (const nlohmann::json::exception &e) {
        LogError("invalid metadata %s: %s", metadata_path, e.what());
        return 1;
    }

    hubagent::SignatureVerifier verifier(cfg.update_public_key);
    auto res = hubagent::VerifyBinary(file, metadata, verifier);
    if (!res) {
        LogError("%s %s: %s", file, hubagent::ToString(res.error().outcome),
                 res.error().message.c_str());
        return 1;
    }
    std::printf("%s: OK (version %s)\n", file, metadata.version.c_str());
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    hubagent::InstallSignalHandlers();

    std::string config_path = hubagent::kDefaultConfigPath;
    const char *level_cli = nullptr;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"log-level", required_argument, nullptr, 'l'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:l:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'l':
                level_cli = optarg;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string command = argv[optind];

    if (command == "version") {
        std::printf("%s\n", hubagent::kAgentVersion);
        return 0;
    }

    if (level_cli) {
        auto lvl = hubagent::ParseLogLevel(level_cli);
        if (!lvl) {
            std::fprintf(stderr, "Invalid --log-level: %s\n", level_cli);
            return 2;
        }
        hubagent::Logger::Instance().SetLevel(*lvl);
    }

    hubagent::AgentConfig cfg;
    if (auto r = hubagent::AgentConfig::LoadFromFile(config_path, cfg); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }
    if (!level_cli && !cfg.log_level.empty()) {
        hubagent::Logger::Instance().SetLevel(*hubagent::ParseLogLevel(cfg.log_level));
    }

    try {
        if (command == "verify") {
            if (argc - optind != 3) {
                PrintUsage(argv[0]);
                return 2;
            }
            return RunVerify(cfg, argv[optind + 1], argv[optind + 2]);
        }

        if (command != "start" && command != "update") {
            PrintUsage(argv[0]);
            return 2;
        }

        if (auto r = hubagent::UseProxy(cfg.proxy); !r.ok) {
            LogError("%s", r.msg.c_str());
            return 1;
        }

        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            LogError("curl_global_init failed");
            return 1;
        }

        int rc = 0;
        {
            auto agent = hubagent::Agent::Create(cfg, hubagent::g_cancel);
            if (command == "update") {
                auto res = agent->UpdateSelf();
                if (!res) {
                    rc = 1;
                } else {
                    std::printf("updated to %s\n", res->version.c_str());
                }
            } else {
                agent->Run();
            }
        }
        curl_global_cleanup();
        return rc;
    } catch (const std::exception &e) {
        LogError("%s", e.what());
        return 1;
    }
}
