#include "config.hpp"
#include "engine.hpp"
#include "pii.hpp"
#include "session.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <vector>

static void print_usage() {
    std::cout << "Usage: memora [--config PATH] COMMAND [ARGS...]\n"
              << "\n"
              << "Sessions:\n"
              << "  create USER [CONTEXT]               Start a session, print its id\n"
              << "  append SESSION USER ROLE TEXT       Add a message (role: system|user|assistant|tool)\n"
              << "  history SESSION USER [LIMIT]        Print the most recent messages\n"
              << "  end SESSION USER                    Mark a session inactive\n"
              << "  sweep                               Archive sessions idle past ttl_days\n"
              << "\n"
              << "Memories:\n"
              << "  remember USER TEXT [TOPIC...]       Generate a memory from text\n"
              << "  recall USER QUERY [TOP_K]           Print memories for prompt context\n"
              << "  consolidate USER                    Merge duplicates, prune stale memories\n"
              << "  forget MEMORY_ID                    Delete a memory\n"
              << "\n"
              << "PII:\n"
              << "  redact TEXT                         Print TEXT with PII replaced\n"
              << "  detect TEXT                         List PII found in TEXT\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: $MEMORA_CONFIG or ~/.memora/config.json)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  MEMORA_CONFIG        Config file path\n"
              << "  MEMORA_STORE_PATH    Override store.path\n"
              << "  MEMORA_MAX_TOKENS    Override session.max_token_limit\n"
              << "  MEMORA_TTL_DAYS      Override session.ttl_days\n";
}

static int report(memora::Status status) {
    if (status == memora::Status::Ok) {
        std::cout << "ok\n";
        return 0;
    }
    std::cerr << "Error: " << memora::status_to_string(status) << "\n";
    return 1;
}

static bool parse_count(const std::string& s, unsigned long& out) {
    try {
        size_t pos = 0;
        out = std::stoul(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

static int run_pii(const std::string& command, const std::vector<std::string>& args,
                   const memora::Config& config) {
    if (args.size() != 1) {
        print_usage();
        return 1;
    }
    memora::PiiRedactor redactor(config.pii.extended);
    if (command == "redact") {
        std::cout << redactor.redact(args[0]) << "\n";
        return 0;
    }

    auto matches = redactor.detect(args[0]);
    for (const auto& m : matches) {
        std::cout << m.type << "\t" << m.start << "-" << m.end << "\t"
                  << m.value << " -> " << m.replacement << "\n";
    }
    if (redactor.validate_sensitive_context(args[0])) {
        std::cout << "warning: text contains secret-like key/value pairs\n";
    }
    return 0;
}

static int run_command(const std::string& command, const std::vector<std::string>& args,
                       memora::Engine& engine) {
    if (command == "create" && (args.size() == 1 || args.size() == 2)) {
        auto session = engine.create_session(args[0], args.size() == 2 ? args[1] : "");
        std::cout << session.id << "\n";
        return 0;
    }

    if (command == "append" && args.size() == 4) {
        auto role = memora::role_from_string(args[2]);
        if (!role) {
            std::cerr << "Error: unknown role '" << args[2] << "'\n";
            return 1;
        }
        return report(engine.append(args[0], args[1], *role, args[3]));
    }

    if (command == "history" && (args.size() == 2 || args.size() == 3)) {
        unsigned long limit = 0;
        if (args.size() == 3 && !parse_count(args[2], limit)) {
            std::cerr << "Error: LIMIT must be a number\n";
            return 1;
        }
        auto messages = engine.history(args[0], args[1], limit);
        for (const auto& msg : messages) {
            std::cout << memora::format_timestamp(msg.timestamp) << " "
                      << memora::role_to_string(msg.role) << ": " << msg.content << "\n";
        }
        return 0;
    }

    if (command == "end" && args.size() == 2) {
        return report(engine.end_session(args[0], args[1]));
    }

    if (command == "sweep" && args.empty()) {
        size_t archived = engine.sessions().sweep_expired(memora::epoch_millis(),
                                                          engine.config().session.ttl_days);
        std::cout << archived << " sessions archived\n";
        return 0;
    }

    if (command == "remember" && args.size() >= 2) {
        std::vector<std::string> topics(args.begin() + 2, args.end());
        auto id = engine.from_transcript(args[0], args[1], topics);
        if (!id) {
            std::cout << "nothing to remember\n";
            return 0;
        }
        std::cout << *id << "\n";
        return 0;
    }

    if (command == "recall" && (args.size() == 2 || args.size() == 3)) {
        unsigned long top_k = 0;
        if (args.size() == 3 && !parse_count(args[2], top_k)) {
            std::cerr << "Error: TOP_K must be a number\n";
            return 1;
        }
        auto memories = engine.retrieve_context(args[0], args[1],
                                                static_cast<uint32_t>(top_k));
        std::cout << memora::MemoryManager::format_context(memories);
        return 0;
    }

    if (command == "consolidate" && args.size() == 1) {
        memora::ConsolidationReport summary;
        auto status = engine.memories().consolidate(args[0], summary);
        std::cout << summary.examined << " examined, "
                  << summary.duplicates_removed << " duplicates removed, "
                  << summary.pruned << " pruned, "
                  << summary.conflicts.size() << " conflicts\n";
        return status == memora::Status::Ok ? 0 : report(status);
    }

    if (command == "forget" && args.size() == 1) {
        return report(engine.memories().remove(args[0]));
    }

    std::cerr << "Unknown command or wrong arguments: " << command << "\n";
    print_usage();
    return 1;
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string config_path;
    std::string command;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        if (!command.empty()) {
            args.emplace_back(argv[i]);
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else {
            command = argv[i];
        }
    }

    if (command.empty()) {
        print_usage();
        return 1;
    }

    auto config = config_path.empty() ? memora::Config::load()
                                      : memora::Config::load_from(config_path);

    if (command == "redact" || command == "detect") {
        return run_pii(command, args, config);
    }

    memora::Engine engine(config);
    int rc = run_command(command, args, engine);
    engine.drain();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
