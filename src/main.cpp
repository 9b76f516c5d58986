#include "config.h"
#include "connect_session.h"
#include "event_loop.h"
#include "file_source.h"
#include "file_transfer.h"
#include "io_poller.h"
#include "logger.h"
#include "session_directory.h"
#include "tcp_transport.h"

#include <csignal>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

using namespace peerlink;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handle_signal(int) {
    g_interrupted = 1;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <command> [options]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  share <file>               Serve a file to any peer that connects\n";
    std::cout << "  fetch <host:port>          Download the file served by a peer\n";
    std::cout << "  chat host                  Host a mesh chat session\n";
    std::cout << "  chat join <host:port>      Join the session hosted at host:port\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --port <n>                 Listen port (default from config, 0 = any)\n";
    std::cout << "  --host <addr>              Address advertised to peers (default 127.0.0.1)\n";
    std::cout << "  --password <p>             Protect (share) or unlock (fetch) a transfer\n";
    std::cout << "  --output <path>            Where fetch writes the file (default: its name)\n";
    std::cout << "  --name <name>              Character name for chat\n";
    std::cout << "  --config <path>            JSON configuration file\n";
    std::cout << "  --log-level <level>        debug, info, warn or error\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << program_name << " share notes.txt --port 9000 --password hunter2\n";
    std::cout << "  " << program_name << " fetch 127.0.0.1:9000 --password hunter2\n";
}

void print_chat_help() {
    std::cout << "\nChat commands:\n";
    std::cout << "  <text>      - Send a chat message\n";
    std::cout << "  /who        - List participants\n";
    std::cout << "  /history    - Show the chat history\n";
    std::cout << "  /quit       - Leave the session\n";
}

struct Options {
    std::vector<std::string> positional;
    std::map<std::string, std::string> values;

    bool has(const std::string& key) const { return values.count(key) > 0; }
    std::string get(const std::string& key, const std::string& fallback = "") const {
        auto it = values.find(key);
        return it == values.end() ? fallback : it->second;
    }
};

bool parse_options(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.compare(0, 2, "--") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            options.values[arg.substr(2)] = argv[++i];
        } else {
            options.positional.push_back(arg);
        }
    }
    return true;
}

bool parse_port(const Options& options, int fallback, int& port) {
    if (!options.has("port")) {
        port = fallback;
        return true;
    }
    try {
        port = std::stoi(options.get("port"));
    } catch (const std::exception&) {
        std::cerr << "Invalid port " << options.get("port") << std::endl;
        return false;
    }
    return true;
}

void run_until_interrupted(EventLoop& loop, const std::function<bool()>& done) {
    while (!g_interrupted && !done()) {
        loop.run_once(200);
    }
}

std::string format_item(const ChatItem& item) {
    if (const auto* chat = std::get_if<ChatMessage>(&item)) {
        return "<" + chat->character_name + (chat->is_human ? "" : " (auto)") + "> " + chat->content;
    }
    const auto& system = std::get<SystemMessage>(item);
    return "* " + system.character_name + (system.event == SystemEvent::JOINED ? " joined" : " left");
}

int run_share(EventLoop& loop, const Options& options, const PeerlinkConfig& config) {
    if (options.positional.size() < 2) {
        std::cerr << "share needs a file path" << std::endl;
        return 1;
    }
    std::shared_ptr<const FileSource> source = DiskFileSource::open(options.positional[1]);
    if (!source) {
        LOG_MAIN_ERROR("Cannot open " << options.positional[1]);
        return 1;
    }

    TcpTransport transport(loop, options.get("host", "127.0.0.1"));
    int port = 0;
    if (!parse_port(options, config.listen_port, port)) {
        return 1;
    }
    if (!transport.listen(port)) {
        LOG_MAIN_ERROR("Failed to listen on port " << port);
        return 1;
    }

    auto uploader = std::make_shared<TransferUploader>(loop, source, options.get("password"), config);
    uploader->on_session_update([](const UploadSession& session) {
        LOG_MAIN_INFO(session.peer_id << ": " << upload_status_to_string(session.status)
                      << " (" << session.bytes_acknowledged << "/" << session.total_size << ")");
    });
    uploader->serve(transport);

    const FileInfo& info = uploader->file_info();
    std::cout << "Sharing " << info.name << " (" << info.size << " bytes, " << info.type << ") at "
              << transport.local_id() << (uploader->password_protected() ? " [password]" : "") << std::endl;

    run_until_interrupted(loop, []() { return false; });
    uploader->stop();
    transport.shutdown();
    LOG_MAIN_INFO("Served " << uploader->completed_downloads() << " complete downloads");
    return 0;
}

int run_fetch(EventLoop& loop, const Options& options, const PeerlinkConfig& config) {
    if (options.positional.size() < 2) {
        std::cerr << "fetch needs the uploader address" << std::endl;
        return 1;
    }
    TcpTransport transport(loop, options.get("host", "127.0.0.1"));
    auto downloader = std::make_shared<TransferDownloader>(loop, transport, options.positional[1], config);
    downloader->set_client_info("peerlink-cli", "posix");

    const std::string password = options.get("password");
    bool finished = false;
    bool password_sent = false;

    downloader->on_status([&](DownloadStatus status) {
        LOG_MAIN_INFO("Download " << download_status_to_string(status));
        switch (status) {
            case DownloadStatus::PASSWORD_REQUIRED:
                if (password.empty() || password_sent) {
                    std::cerr << "The transfer is password protected, use --password" << std::endl;
                    finished = true;
                } else {
                    password_sent = true;
                    downloader->submit_password(password);
                }
                break;
            case DownloadStatus::PASSWORD_ERROR:
                std::cerr << "Wrong password" << std::endl;
                finished = true;
                break;
            case DownloadStatus::READY:
                downloader->start();
                break;
            case DownloadStatus::ERROR:
                std::cerr << "Transfer failed: " << downloader->error() << std::endl;
                finished = true;
                break;
            case DownloadStatus::CLOSED:
                finished = true;
                break;
            default:
                break;
        }
    });
    downloader->on_progress([](uint64_t received, uint64_t total) {
        LOG_MAIN_DEBUG("Received " << received << "/" << total);
    });

    bool saved = false;
    downloader->on_complete([&](const FileInfo& info, const std::vector<uint8_t>&) {
        std::string path = options.get("output", info.name);
        saved = downloader->save_to(path);
        if (saved) {
            std::cout << "Saved " << info.name << " (" << info.size << " bytes) to " << path << std::endl;
        }
        finished = true;
    });

    if (!downloader->connect()) {
        LOG_MAIN_ERROR("Could not dial " << options.positional[1]);
        return 1;
    }
    run_until_interrupted(loop, [&finished]() { return finished; });
    downloader->close();
    transport.shutdown();
    return saved ? 0 : 1;
}

int run_chat(EventLoop& loop, const Options& options, const PeerlinkConfig& config) {
    if (options.positional.size() < 2 ||
        (options.positional[1] == "join" && options.positional.size() < 3)) {
        std::cerr << "chat needs 'host' or 'join <host:port>'" << std::endl;
        return 1;
    }
    const bool hosting = options.positional[1] == "host";
    if (!hosting && options.positional[1] != "join") {
        std::cerr << "Unknown chat mode " << options.positional[1] << std::endl;
        return 1;
    }

    auto transport = std::make_shared<TcpTransport>(loop, options.get("host", "127.0.0.1"));
    int port = 0;
    if (!parse_port(options, config.listen_port, port)) {
        return 1;
    }
    if (!transport->listen(port)) {
        LOG_MAIN_ERROR("Failed to listen on port " << port);
        return 1;
    }

    CharacterInfo character;
    character.name = options.get("name", "peer-" + std::to_string(transport->listen_port()));

    // The directory lives with the host; guests dial the host address directly.
    LocalSessionDirectory directory;
    auto session = std::make_shared<ConnectSession>(loop, transport, directory, config);
    session->on_chat_message([](const ChatMessage& message) {
        std::cout << format_item(message) << std::endl;
    });
    session->on_state_change([](MeshState state) {
        if (state == MeshState::HOST_LEFT) {
            std::cout << "The host left the session" << std::endl;
        }
    });

    if (hosting) {
        HostOptions host_options;
        if (options.has("password")) host_options.password = options.get("password");
        auto created = session->host(character, host_options);
        if (!created) {
            return 1;
        }
        std::cout << "Hosting session " << created->slug << ". Guests run: peerlink chat join "
                  << transport->local_id() << std::endl;
    } else {
        if (!session->join_host(options.positional[2], character)) {
            LOG_MAIN_ERROR("Could not join " << options.positional[2]);
            return 1;
        }
    }
    print_chat_help();

    bool quit = false;
    std::string pending_input;
    loop.watch_fd(STDIN_FILENO, PollIn, [&](uint32_t) {
        char buffer[1024];
        ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
        if (n <= 0) {
            quit = true;
            return;
        }
        pending_input.append(buffer, static_cast<size_t>(n));
        size_t newline;
        while ((newline = pending_input.find('\n')) != std::string::npos) {
            std::string line = pending_input.substr(0, newline);
            pending_input.erase(0, newline + 1);
            if (line.empty()) {
                continue;
            }
            if (line == "/quit") {
                quit = true;
            } else if (line == "/who") {
                for (const auto& participant : session->store().participants()) {
                    std::cout << "  " << participant.peer_id << " "
                              << (participant.character ? participant.character->name : "?") << " ["
                              << participant_status_to_string(participant.status) << "]" << std::endl;
                }
            } else if (line == "/history") {
                for (const auto& item : session->store().history()) {
                    std::cout << format_item(item) << std::endl;
                }
            } else if (line[0] == '/') {
                print_chat_help();
            } else {
                if (!session->mesh().send_chat_message(line, true)) {
                    std::cout << "Message not sent" << std::endl;
                }
            }
        }
    });

    run_until_interrupted(loop, [&]() { return quit || session->mesh().state() == MeshState::HOST_LEFT; });
    loop.unwatch_fd(STDIN_FILENO);
    session->leave();
    loop.run_for(200);
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parse_options(argc, argv, options) || options.positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    PeerlinkConfig config;
    if (!load_config(options.get("config"), config)) {
        LOG_MAIN_ERROR("Invalid configuration file " << options.get("config"));
        return 1;
    }
    LogLevel level = config.log_level;
    if (options.has("log-level") && !Logger::parse_log_level(options.get("log-level"), level)) {
        std::cerr << "Unknown log level " << options.get("log-level") << std::endl;
        return 1;
    }
    Logger::getInstance().set_log_level(level);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGPIPE, SIG_IGN);

    EventLoop loop;
    const std::string& command = options.positional[0];
    if (command == "share") {
        return run_share(loop, options, config);
    }
    if (command == "fetch") {
        return run_fetch(loop, options, config);
    }
    if (command == "chat") {
        return run_chat(loop, options, config);
    }
    print_usage(argv[0]);
    return 1;
}
