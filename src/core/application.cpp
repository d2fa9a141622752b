/*
 * sandfs C++ - Application Implementation
 */
#include <sandfs/core/application.hpp>
#include <sandfs/core/logger.hpp>
#include <sandfs/core/utils.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <unistd.h>

namespace sandfs {

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Sandboxed file system tool server\n\n"
              << "Usage: " << prog << " [options] [config.json]\n\n"
              << "Options:\n"
              << "  -h, --help            Show this help message\n"
              << "  -v, --version         Show version\n"
              << "  --config <file>       Configuration file (default: config.json)\n"
              << "  --root <dir>          Sandbox root (overrides filesystem.root)\n"
              << "  --log-level <level>   debug, info, warn, error or none\n"
              << "  --no-color            Plain log output (overrides log_color)\n"
              << "  --tools               Print the tool descriptions and exit\n\n"
              << "Tool calls are read from stdin, one JSON object per line:\n"
              << "  {\"tool\": \"read_file\", \"arguments\": {\"path\": \"notes.txt\"}}\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

void signal_handler(int sig) {
    (void)sig;
    Application::instance().stop();
}

void install_signal_handlers() {
    // No SA_RESTART: a blocking read on stdin returns so the loop can exit
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : running_(true)
    , exit_code_(0)
    , config_file_("config.json")
    , config_explicit_(false)
    , no_color_(false)
    , print_tools_(false)
{}

bool Application::parse_args(int argc, char* argv[]) {
    config_file_ = "config.json";
    config_explicit_ = false;
    root_override_.clear();
    log_level_override_.clear();
    no_color_ = false;
    print_tools_ = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--no-color") == 0) {
            no_color_ = true;
            continue;
        }
        if (strcmp(argv[i], "--tools") == 0) {
            print_tools_ = true;
            continue;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            config_explicit_ = true;
            continue;
        }
        if (strcmp(argv[i], "--root") == 0 && i + 1 < argc) {
            root_override_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            log_level_override_ = std::string(argv[++i]);
            continue;
        }
        if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n\n";
            print_usage(argv[0]);
            exit_code_ = 2;
            return false;
        }
        // Positional config file
        config_file_ = std::string(argv[i]);
        config_explicit_ = true;
    }
    return true;
}

bool Application::load_config() {
    if (access(config_file_.c_str(), F_OK) != 0) {
        if (config_explicit_) {
            LOG_ERROR("Config file not found: %s", config_file_.c_str());
            return false;
        }
        LOG_DEBUG("No %s, using defaults", config_file_.c_str());
        return true;
    }

    if (!config_.load_file(config_file_)) {
        LOG_ERROR("Failed to load config from %s, aborting!", config_file_.c_str());
        return false;
    }
    LOG_INFO("Loaded config from %s", config_file_.c_str());
    return true;
}

void Application::setup_logging() {
    if (no_color_) {
        config_.set_bool("log_color", false);
    }
    Logger::instance().set_color(config_.get_bool("log_color", Logger::instance().color()));

    std::string level = log_level_override_.empty()
                      ? config_.get_string("log_level", "info")
                      : log_level_override_;
    Logger::instance().set_level(parse_log_level(level));
}

bool Application::setup_tools() {
    if (!root_override_.empty()) {
        config_.set_string("filesystem.root", root_override_);
    }

    if (!file_tool_.init(config_)) {
        LOG_ERROR("Failed to initialize the file tool");
        return false;
    }

    runner_.register_provider(file_tool_);
    LOG_INFO("Registered %zu tools", runner_.tools().size());
    return true;
}

bool Application::init(int argc, char* argv[]) {
    running_ = true;
    exit_code_ = 0;
    config_ = Config();

    if (!parse_args(argc, argv)) {
        return false;
    }

    // Command line level applies while the config is loading
    if (!log_level_override_.empty()) {
        Logger::instance().set_level(parse_log_level(log_level_override_));
    }

    if (!load_config()) {
        exit_code_ = 1;
        return false;
    }
    setup_logging();

    LOG_INFO("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!setup_tools()) {
        exit_code_ = 1;
        return false;
    }

    if (print_tools_) {
        std::cout << runner_.build_tools_prompt();
        return false;
    }

    install_signal_handlers();
    return true;
}

int Application::run(std::istream& in, std::ostream& out) {
    LOG_INFO("Serving tool calls (sandbox root: %s)",
             file_tool_.file_system() ? file_tool_.file_system()->root().c_str() : "?");

    std::string line;
    size_t served = 0;
    while (running_.load() && std::getline(in, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        out << runner_.run_line(trimmed) << std::endl;
        ++served;
    }

    LOG_DEBUG("[App] Served %zu tool calls", served);
    return 0;
}

void Application::shutdown() {
    LOG_INFO("Shutting down...");
    file_tool_.shutdown();
}

} // namespace sandfs
