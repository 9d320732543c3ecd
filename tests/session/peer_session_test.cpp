#include <gtest/gtest.h>
#include "peerlink/events/events.hpp"
#include "peerlink/qr/qr_renderer.hpp"
#include "peerlink/session/peer_session.hpp"
#include "peerlink/transport/loopback_transport.hpp"

#include <memory>
#include <vector>

using peerlink::ErrorCode;
using peerlink::PeerConfig;
using namespace peerlink::session;
using namespace peerlink::transport;

namespace {

/// Renders a code as a one-row strip, one pixel per character.
class StripRenderer : public peerlink::qr::QrRenderer {
public:
    peerlink::Result<peerlink::qr::RasterImage> render(const std::string& text) const override {
        ++calls;
        last_text = text;
        peerlink::qr::RasterImage image;
        image.width = static_cast<std::uint32_t>(text.size());
        image.height = 1;
        image.pixels.assign(text.begin(), text.end());
        return peerlink::Ok(image);
    }

    mutable int calls = 0;
    mutable std::string last_text;
};

} // namespace

class PeerSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = LoopbackNetwork::create();
        host_ = make_session();
        joiner_ = make_session();
        ASSERT_TRUE(host_);
        ASSERT_TRUE(joiner_);
    }

    std::unique_ptr<PeerSession> make_session(PeerConfig config = {}) {
        auto network = network_;
        auto created = PeerSession::create(
            [network]() -> std::unique_ptr<Transport> { return network->make_transport(); },
            std::move(config));
        if (created.is_error()) {
            return nullptr;
        }
        return std::move(created.value());
    }

    /// Host side up to SharingCode; returns the offer code.
    std::string host_offer() {
        EXPECT_TRUE(host_->start().is_ok());
        EXPECT_TRUE(host_->choose_host().is_ok());
        host_->process_events();
        auto offer = host_->local_artifact();
        EXPECT_TRUE(offer.is_ok());
        return offer.is_ok() ? offer.value() : std::string();
    }

    void connect() {
        const auto offer = host_offer();
        ASSERT_TRUE(host_->confirm_code_shared().is_ok());

        ASSERT_TRUE(joiner_->start().is_ok());
        ASSERT_TRUE(joiner_->choose_joiner().is_ok());
        ASSERT_TRUE(joiner_->accept_offer(offer).is_ok());
        joiner_->process_events();
        auto answer = joiner_->local_artifact();
        ASSERT_TRUE(answer.is_ok());

        ASSERT_TRUE(host_->accept_answer(answer.value()).is_ok());
        host_->process_events();
        joiner_->process_events();
    }

    std::shared_ptr<LoopbackNetwork> network_;
    std::unique_ptr<PeerSession> host_;
    std::unique_ptr<PeerSession> joiner_;
};

TEST(PeerSessionCreate, RejectsBadArguments) {
    auto no_factory = PeerSession::create(TransportFactory{}, PeerConfig{});
    ASSERT_TRUE(no_factory.is_error());
    EXPECT_EQ(no_factory.error().code, ErrorCode::InvalidArgument);

    auto network = LoopbackNetwork::create();
    PeerConfig config;
    config.max_chunk_size = 0;
    auto bad_chunk = PeerSession::create(
        [network]() -> std::unique_ptr<Transport> { return network->make_transport(); }, config);
    EXPECT_TRUE(bad_chunk.is_error());
}

TEST_F(PeerSessionTest, HappyPathDeliversChat) {
    std::vector<WizardStep> host_steps;
    host_->bus().subscribe<peerlink::events::WizardStepChangedEvent>(
        [&](const peerlink::events::WizardStepChangedEvent& e) { host_steps.push_back(e.current); });

    connect();

    EXPECT_EQ(host_->step(), WizardStep::Connected);
    EXPECT_EQ(joiner_->step(), WizardStep::Connected);
    EXPECT_TRUE(host_->connection_state().is_channel_open());
    EXPECT_TRUE(joiner_->connection_state().is_channel_open());
    EXPECT_EQ(host_steps, (std::vector<WizardStep>{
                              WizardStep::ChooseRole, WizardStep::GeneratingCode, WizardStep::SharingCode,
                              WizardStep::WaitingForAnswer, WizardStep::Connected}));

    ASSERT_TRUE(host_->send_text("hi").is_ok());
    joiner_->process_events();

    ASSERT_EQ(joiner_->messages().size(), 1u);
    EXPECT_EQ(joiner_->messages()[0].sender, MessageSender::Remote);
    EXPECT_EQ(joiner_->messages()[0].content, "hi");
    ASSERT_EQ(host_->messages().size(), 1u);
    EXPECT_EQ(host_->messages()[0].sender, MessageSender::Local);
}

TEST_F(PeerSessionTest, JoinerPassesThroughSharingCode) {
    const auto offer = host_offer();
    std::vector<WizardStep> joiner_steps;
    joiner_->bus().subscribe<peerlink::events::WizardStepChangedEvent>(
        [&](const peerlink::events::WizardStepChangedEvent& e) { joiner_steps.push_back(e.current); });

    ASSERT_TRUE(joiner_->start().is_ok());
    ASSERT_TRUE(joiner_->choose_joiner().is_ok());
    EXPECT_EQ(joiner_->negotiation_state(), NegotiationState::Uninitialized);

    ASSERT_TRUE(joiner_->accept_offer(offer).is_ok());
    joiner_->process_events();

    EXPECT_EQ(joiner_->step(), WizardStep::SharingCode);
    EXPECT_EQ(joiner_steps, (std::vector<WizardStep>{
                                WizardStep::ChooseRole, WizardStep::WaitingForConnection, WizardStep::SharingCode}));
}

TEST_F(PeerSessionTest, ChannelOpeningBeforeConfirmSkipsAhead) {
    const auto offer = host_offer();
    ASSERT_EQ(host_->step(), WizardStep::SharingCode);

    ASSERT_TRUE(joiner_->start().is_ok());
    ASSERT_TRUE(joiner_->choose_joiner().is_ok());
    ASSERT_TRUE(joiner_->accept_offer(offer).is_ok());
    joiner_->process_events();

    // The host pastes the answer without ever pressing "code shared".
    ASSERT_TRUE(host_->accept_answer(joiner_->local_artifact().value()).is_ok());
    host_->process_events();

    EXPECT_EQ(host_->step(), WizardStep::Connected);
}

TEST_F(PeerSessionTest, BadOfferKeepsJoinerWaiting) {
    ASSERT_TRUE(joiner_->start().is_ok());
    ASSERT_TRUE(joiner_->choose_joiner().is_ok());

    auto result = joiner_->accept_offer("definitely not a code");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidOffer);
    EXPECT_TRUE(result.error().is_decode_error());
    EXPECT_EQ(joiner_->step(), WizardStep::WaitingForConnection);

    // Re-pasting a good code still works.
    const auto offer = host_offer();
    EXPECT_TRUE(joiner_->accept_offer(offer).is_ok());
}

TEST_F(PeerSessionTest, AcceptOfferOutsideWaitingStepIsInvalidState) {
    const auto offer = host_offer();

    auto before_role = joiner_->accept_offer(offer);
    ASSERT_TRUE(before_role.is_error());
    EXPECT_EQ(before_role.error().code, ErrorCode::InvalidState);
}

TEST_F(PeerSessionTest, ChooseHostRequiresChooseRoleStep) {
    auto result = host_->choose_host();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(host_->negotiation_state(), NegotiationState::Uninitialized);
}

TEST_F(PeerSessionTest, ResetForgetsNegotiation) {
    const auto offer = host_offer();
    ASSERT_FALSE(offer.empty());

    std::size_t resets = 0;
    host_->bus().subscribe<peerlink::events::SessionResetEvent>(
        [&](const peerlink::events::SessionResetEvent&) { resets++; });

    host_->reset();

    EXPECT_EQ(resets, 1u);
    EXPECT_EQ(host_->step(), WizardStep::Welcome);
    EXPECT_EQ(host_->negotiation_state(), NegotiationState::Uninitialized);
    EXPECT_TRUE(host_->local_artifact().is_error());

    auto answer = host_->accept_answer(offer);
    ASSERT_TRUE(answer.is_error());
    EXPECT_EQ(answer.error().code, ErrorCode::InvalidState);
}

TEST_F(PeerSessionTest, ResetDiscardsChatAndReleasesTransport) {
    connect();
    ASSERT_TRUE(host_->send_text("hello").is_ok());
    joiner_->process_events();
    ASSERT_EQ(network_->endpoint_count(), 2u);

    host_->reset();

    EXPECT_TRUE(host_->messages().empty());
    EXPECT_FALSE(host_->is_chat_enabled());
    // Old transport gone, replacement registered.
    EXPECT_EQ(network_->endpoint_count(), 2u);

    joiner_->process_events();
    EXPECT_EQ(joiner_->connection_state().channel_status, ChannelStatus::Closed);
    EXPECT_EQ(joiner_->step(), WizardStep::Connected);
    EXPECT_FALSE(joiner_->is_chat_enabled());
}

TEST_F(PeerSessionTest, FileTransferArrivesIntact) {
    PeerConfig small_chunks;
    small_chunks.max_chunk_size = 1024;
    host_ = make_session(small_chunks);
    ASSERT_TRUE(host_);
    connect();

    FileInfo file;
    file.name = "cat.png";
    file.mime_type = "image/png";
    for (int i = 0; i < 5000; ++i) {
        file.data.push_back(static_cast<std::uint8_t>(i % 256));
    }

    std::vector<std::uint32_t> outgoing_progress;
    host_->bus().subscribe<peerlink::events::FileTransferProgressEvent>(
        [&](const peerlink::events::FileTransferProgressEvent& e) {
            EXPECT_TRUE(e.outgoing);
            outgoing_progress.push_back(e.chunks_done);
        });
    std::vector<std::string> received_names;
    joiner_->bus().subscribe<peerlink::events::FileReceivedEvent>(
        [&](const peerlink::events::FileReceivedEvent& e) { received_names.push_back(e.file.name); });

    auto transfer = host_->send_file(file);
    ASSERT_TRUE(transfer.is_ok());
    EXPECT_EQ(outgoing_progress, (std::vector<std::uint32_t>{1, 2, 3, 4, 5}));

    joiner_->process_events();

    ASSERT_EQ(joiner_->received_files().size(), 1u);
    const auto& received = joiner_->received_files()[0];
    EXPECT_EQ(received.name, "cat.png");
    EXPECT_TRUE(received.is_image());
    EXPECT_EQ(received.data, file.data);
    EXPECT_EQ(received_names, (std::vector<std::string>{"cat.png"}));
    EXPECT_TRUE(joiner_->messages().empty());
}

TEST_F(PeerSessionTest, SendFileChecksChannelAndSize) {
    FileInfo file;
    file.name = "a.txt";
    file.data = {1, 2, 3};

    auto early = host_->send_file(file);
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error().code, ErrorCode::InvalidState);

    PeerConfig tiny_limit;
    tiny_limit.max_file_size_mb = 1;
    host_ = make_session(tiny_limit);
    ASSERT_TRUE(host_);
    connect();

    FileInfo big;
    big.name = "big.bin";
    big.data.assign(1024 * 1024 + 1, 0);
    auto rejected = host_->send_file(big);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().code, ErrorCode::InvalidArgument);
}

TEST_F(PeerSessionTest, FileAtMaximumChunkSizeFitsTheChannel) {
    PeerConfig max_chunks;
    max_chunks.max_chunk_size = PeerConfig::kMaxChunkSize;
    host_ = make_session(max_chunks);
    ASSERT_TRUE(host_);
    connect();

    FileInfo file;
    file.name = "archive.zip";
    file.mime_type = "application/zip";
    file.data.assign(PeerConfig::kMaxChunkSize + 100, 0x5A);

    std::uint32_t total_chunks = 0;
    host_->bus().subscribe<peerlink::events::FileTransferProgressEvent>(
        [&](const peerlink::events::FileTransferProgressEvent& e) { total_chunks = e.total_chunks; });

    auto transfer = host_->send_file(file);
    ASSERT_TRUE(transfer.is_ok());
    EXPECT_EQ(total_chunks, 2u);

    joiner_->process_events();

    ASSERT_EQ(joiner_->received_files().size(), 1u);
    EXPECT_EQ(joiner_->received_files()[0].data, file.data);
}

TEST_F(PeerSessionTest, UndecodableFramesAreDropped) {
    connect();

    ASSERT_TRUE(host_->send_text("before").is_ok());
    // Neither a text nor a chunk frame.
    joiner_->bus().emit(peerlink::events::ChannelMessageReceivedEvent{{0x7F, 0x00}});
    joiner_->process_events();

    ASSERT_EQ(joiner_->messages().size(), 1u);
    EXPECT_EQ(joiner_->messages()[0].content, "before");
}

TEST_F(PeerSessionTest, RendersArtifactThroughQrBoundary) {
    StripRenderer renderer;

    auto too_early = host_->render_artifact_qr(renderer);
    ASSERT_TRUE(too_early.is_error());
    EXPECT_EQ(renderer.calls, 0);

    const auto offer = host_offer();
    auto image = host_->render_artifact_qr(renderer);

    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(renderer.calls, 1);
    EXPECT_EQ(renderer.last_text, offer);
    EXPECT_EQ(image.value().width, offer.size());
}

TEST_F(PeerSessionTest, UnreachablePeerLeavesSessionInspectable) {
    network_->set_reachable(false);
    connect();

    EXPECT_EQ(host_->connection_state().connectivity_status, ConnectivityStatus::Failed);
    EXPECT_EQ(host_->step(), WizardStep::WaitingForAnswer);
    EXPECT_FALSE(host_->is_chat_enabled());

    host_->reset();
    EXPECT_EQ(host_->step(), WizardStep::Welcome);
}
