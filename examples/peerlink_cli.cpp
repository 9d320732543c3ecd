#include "peerlink/core/config.hpp"
#include "peerlink/events/components.hpp"
#include "peerlink/events/event_queue.hpp"
#include "peerlink/events/events.hpp"
#include "peerlink/session/peer_session.hpp"
#include "peerlink/transport/rtc_transport.hpp"

#include <rtc/rtc.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using peerlink::PeerConfig;
using peerlink::session::PeerSession;
using peerlink::session::WizardStep;

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " host|join [-c config.json] [-l level]\n"
              << "  After connecting, type a line to chat, /send <path> to send a file,\n"
              << "  /reset to start over, /quit to exit.\n";
}

/// Pumps transport events until `done` holds or `timeout` elapses.
template<typename Predicate>
bool pump_until(PeerSession& session, Predicate done, std::chrono::seconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        session.process_events_for(100ms);
    }
    return true;
}

std::optional<std::string> read_code(const char* prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    return line;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string mode = argv[1];
    if (mode != "host" && mode != "join") {
        print_usage(argv[0]);
        return 1;
    }

    std::optional<fs::path> config_path;
    std::optional<std::string> log_level;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        }
    }

    PeerConfig config;
    if (config_path) {
        auto loaded = peerlink::load_config(*config_path);
        if (loaded.is_error()) {
            spdlog::critical("{}", loaded.error().describe());
            return 1;
        }
        config = loaded.value();
    }
    spdlog::set_level(spdlog::level::from_str(log_level.value_or(config.log_level)));
    rtc::InitLogger(rtc::LogLevel::Warning);

    auto created = PeerSession::create(
        [config]() -> std::unique_ptr<peerlink::transport::Transport> {
            return std::make_unique<peerlink::transport::RtcTransport>(config);
        },
        config);
    if (created.is_error()) {
        spdlog::critical("{}", created.error().describe());
        return 1;
    }
    auto session = std::move(created.value());

    peerlink::events::LoggerComponent logger(session->bus());
    peerlink::events::SessionStatsComponent stats(session->bus());

    session->bus().subscribe<peerlink::events::MessageAppendedEvent>(
        [](const peerlink::events::MessageAppendedEvent& e) {
            if (e.message.sender == peerlink::session::MessageSender::Remote) {
                std::cout << "peer> " << e.message.content << std::endl;
            }
        });
    session->bus().subscribe<peerlink::events::FileReceivedEvent>(
        [](const peerlink::events::FileReceivedEvent& e) {
            std::cout << "peer sent file " << e.file.name << " (" << e.file.format_size() << ")" << std::endl;
        });

    if (auto started = session->start(); started.is_error()) {
        spdlog::critical("{}", started.error().describe());
        return 1;
    }
    if (mode == "host") {
        auto begun = session->choose_host();
        if (begun.is_error()) {
            spdlog::critical("{}", begun.error().describe());
            return 1;
        }
        if (!pump_until(*session, [&] { return session->step() == WizardStep::SharingCode; }, 30s)) {
            spdlog::warn("Candidate gathering still running; sharing the code anyway");
        }
        auto offer = session->local_artifact();
        if (offer.is_error()) {
            spdlog::critical("{}", offer.error().describe());
            return 1;
        }
        std::cout << "\nSend this code to your peer:\n\n" << offer.value() << "\n\n";
        if (auto shared = session->confirm_code_shared(); shared.is_error()) {
            spdlog::warn("{}", shared.error().describe());
        }

        while (true) {
            auto answer = read_code("Paste the peer's answer code: ");
            if (!answer) {
                return 1;
            }
            auto accepted = session->accept_answer(*answer);
            if (accepted.is_ok()) {
                break;
            }
            std::cout << "Rejected: " << accepted.error().describe() << "\n";
        }
    } else {
        if (auto chosen = session->choose_joiner(); chosen.is_error()) {
            spdlog::critical("{}", chosen.error().describe());
            return 1;
        }
        while (true) {
            auto offer = read_code("Paste the host's offer code: ");
            if (!offer) {
                return 1;
            }
            auto accepted = session->accept_offer(*offer);
            if (accepted.is_ok()) {
                break;
            }
            std::cout << "Rejected: " << accepted.error().describe() << "\n";
        }
        if (!pump_until(*session, [&] { return session->step() == WizardStep::SharingCode; }, 30s)) {
            spdlog::warn("Candidate gathering still running; sharing the code anyway");
        }
        auto answer = session->local_artifact();
        if (answer.is_error()) {
            spdlog::critical("{}", answer.error().describe());
            return 1;
        }
        std::cout << "\nSend this code back to the host:\n\n" << answer.value() << "\n\n";
    }

    if (!pump_until(*session, [&] { return session->step() == WizardStep::Connected; }, 60s)) {
        spdlog::error("Connection not established: connectivity={}",
                      peerlink::transport::to_string(session->connection_state().connectivity_status));
        return 1;
    }
    std::cout << "Connected. Type to chat.\n";

    // getline cannot be interrupted, so the reader thread is left to end with the process.
    auto input = std::make_shared<peerlink::events::ThreadSafeQueue<std::string>>();
    std::thread([input] {
        std::string line;
        while (std::getline(std::cin, line)) {
            input->push(line);
        }
        input->push("/quit");
    }).detach();

    bool running = true;
    while (running) {
        session->process_events_for(100ms);
        if (!session->connection_state().is_channel_open()) {
            std::cout << "Channel closed by peer.\n";
            break;
        }

        while (auto line = input->try_pop()) {
            if (*line == "/quit") {
                running = false;
                break;
            }
            if (*line == "/reset") {
                session->reset();
                std::cout << "Session reset. Restart the program to connect again.\n";
                running = false;
                break;
            }
            if (line->rfind("/send ", 0) == 0) {
                auto sent = session->send_file(fs::path(line->substr(6)));
                if (sent.is_error()) {
                    std::cout << "Send failed: " << sent.error().describe() << "\n";
                }
                continue;
            }
            if (line->empty()) {
                continue;
            }
            auto sent = session->send_text(*line);
            if (sent.is_error()) {
                std::cout << "Send failed: " << sent.error().describe() << "\n";
            }
        }
    }

    session->process_events();
    stats.log_summary();
    return 0;
}
