#include "peerlink/core/config.hpp"
#include "peerlink/events/components.hpp"
#include "peerlink/session/peer_session.hpp"
#include "peerlink/transport/loopback_transport.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

using peerlink::PeerConfig;
using peerlink::session::FileInfo;
using peerlink::session::PeerSession;
using peerlink::session::WizardStep;
using peerlink::transport::LoopbackNetwork;

namespace fs = std::filesystem;

namespace {

std::unique_ptr<PeerSession> make_session(const std::shared_ptr<LoopbackNetwork>& network,
                                          const PeerConfig& config) {
    auto created = PeerSession::create(
        [network]() -> std::unique_ptr<peerlink::transport::Transport> {
            return network->make_transport();
        },
        config);
    if (created.is_error()) {
        spdlog::critical("Cannot create session: {}", created.error().describe());
        return nullptr;
    }
    return std::move(created.value());
}

bool check(const peerlink::Result<void>& result, const char* action) {
    if (result.is_error()) {
        spdlog::error("{} failed: {}", action, result.error().describe());
        return false;
    }
    return true;
}

FileInfo make_sample_file(std::size_t size) {
    FileInfo file;
    file.name = "sample.txt";
    file.mime_type = "text/plain";
    file.data.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        file.data.push_back(static_cast<std::uint8_t>('a' + (i % 26)));
    }
    return file;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<fs::path> config_path;
    std::optional<std::string> log_level;
    std::size_t file_size = 40 * 1024;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = fs::path(argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            log_level = argv[++i];
        } else if ((arg == "-s" || arg == "--file-size") && i + 1 < argc) {
            file_size = static_cast<std::size_t>(std::stoul(argv[++i]));
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

    auto network = LoopbackNetwork::create();
    auto host = make_session(network, config);
    auto joiner = make_session(network, config);
    if (!host || !joiner) {
        return 1;
    }

    peerlink::events::LoggerComponent host_logger(host->bus());
    peerlink::events::SessionStatsComponent host_stats(host->bus());
    peerlink::events::SessionStatsComponent joiner_stats(joiner->bus());

    spdlog::info("── host: generating offer ──");
    if (!check(host->start(), "host start") || !check(host->choose_host(), "choose_host")) {
        return 1;
    }
    host->process_events();
    auto offer = host->local_artifact();
    if (offer.is_error()) {
        spdlog::error("No offer: {}", offer.error().describe());
        return 1;
    }
    spdlog::info("Offer code ({} chars): {}", offer.value().size(), offer.value());
    if (!check(host->confirm_code_shared(), "confirm_code_shared")) {
        return 1;
    }

    spdlog::info("── joiner: pasting offer ──");
    if (!check(joiner->start(), "joiner start") || !check(joiner->choose_joiner(), "choose_joiner") ||
        !check(joiner->accept_offer(offer.value()), "accept_offer")) {
        return 1;
    }
    joiner->process_events();
    auto answer = joiner->local_artifact();
    if (answer.is_error()) {
        spdlog::error("No answer: {}", answer.error().describe());
        return 1;
    }
    spdlog::info("Answer code ({} chars): {}", answer.value().size(), answer.value());

    spdlog::info("── host: pasting answer ──");
    if (!check(host->accept_answer(answer.value()), "accept_answer")) {
        return 1;
    }
    host->process_events();
    joiner->process_events();

    if (host->step() != WizardStep::Connected || joiner->step() != WizardStep::Connected) {
        spdlog::error("Peers did not connect: host={} joiner={}",
                      peerlink::session::to_string(host->step()),
                      peerlink::session::to_string(joiner->step()));
        return 1;
    }

    spdlog::info("── chat ──");
    if (auto sent = host->send_text("hi"); sent.is_error()) {
        spdlog::error("host send failed: {}", sent.error().describe());
        return 1;
    }
    joiner->process_events();
    if (auto sent = joiner->send_text("hello from the joiner"); sent.is_error()) {
        spdlog::error("joiner send failed: {}", sent.error().describe());
        return 1;
    }
    host->process_events();
    for (const auto& message : joiner->messages()) {
        spdlog::info("joiner log #{}: {}", message.id, message.content);
    }

    spdlog::info("── file ──");
    const auto sample = make_sample_file(file_size);
    auto transfer = host->send_file(sample);
    if (transfer.is_error()) {
        spdlog::error("send_file failed: {}", transfer.error().describe());
        return 1;
    }
    joiner->process_events();
    for (const auto& file : joiner->received_files()) {
        spdlog::info("joiner received {} ({}) intact={}", file.name, file.format_size(),
                     file.data == sample.data);
    }

    host_stats.log_summary();
    joiner_stats.log_summary();

    host->reset();
    joiner->reset();
    return 0;
}
