#include "tusup/upload/session.hpp"

#include <gtest/gtest.h>

using tusup::ErrorKind;
using tusup::network::Url;
using tusup::upload::UploadPhase;
using tusup::upload::UploadSession;
namespace state = tusup::upload::state;

namespace {

Url upload_url() {
    return Url::parse("https://files.example.com/u/1").take_value();
}

} // namespace

TEST(UploadSessionTest, StartsIdle) {
    UploadSession session{".videos.clip.mp4"};
    EXPECT_EQ(session.phase(), UploadPhase::Idle);
    EXPECT_EQ(session.fingerprint(), ".videos.clip.mp4");
    EXPECT_FALSE(session.upload_url().has_value());
    EXPECT_FALSE(session.offset().has_value());
}

TEST(UploadSessionTest, FollowsCreationPath) {
    UploadSession session{".videos.clip.mp4"};
    session.set_file_size(300);

    ASSERT_TRUE(session.transition_to(state::Creating{}).is_ok());
    ASSERT_TRUE(session.transition_to(state::OffsetSync{upload_url()}).is_ok());
    EXPECT_EQ(session.upload_url(), upload_url());

    ASSERT_TRUE(session.transition_to(state::Transferring{upload_url(), 0}).is_ok());
    ASSERT_TRUE(session.transition_to(state::Transferring{upload_url(), 100}).is_ok());
    EXPECT_EQ(session.offset(), std::optional<std::uint64_t>(100));

    ASSERT_TRUE(session.transition_to(state::Completed{}).is_ok());
    EXPECT_EQ(session.phase(), UploadPhase::Completed);
    EXPECT_FALSE(session.upload_url().has_value());
    EXPECT_FALSE(session.offset().has_value());
}

TEST(UploadSessionTest, RejectsIllegalTransitions) {
    UploadSession session{"fp"};

    auto skip = session.transition_to(state::Transferring{upload_url(), 0});
    ASSERT_TRUE(skip.is_error());
    EXPECT_EQ(skip.error().kind, ErrorKind::InvalidState);

    ASSERT_TRUE(session.transition_to(state::Creating{}).is_ok());
    EXPECT_TRUE(session.transition_to(state::Completed{}).is_error());
    EXPECT_EQ(session.phase(), UploadPhase::Creating);
}

TEST(UploadSessionTest, OffsetCannotPassFileSize) {
    UploadSession session{"fp"};
    session.set_file_size(300);
    ASSERT_TRUE(session.transition_to(state::Resuming{}).is_ok());
    ASSERT_TRUE(session.transition_to(state::OffsetSync{upload_url()}).is_ok());

    auto beyond = session.transition_to(state::Transferring{upload_url(), 301});
    ASSERT_TRUE(beyond.is_error());
    EXPECT_EQ(session.phase(), UploadPhase::OffsetSync);
}

TEST(UploadSessionTest, FailureKeepsUrlAndOffset) {
    UploadSession session{"fp"};
    ASSERT_TRUE(session.transition_to(state::Creating{}).is_ok());
    ASSERT_TRUE(session.transition_to(state::OffsetSync{upload_url()}).is_ok());
    ASSERT_TRUE(session.transition_to(state::Transferring{upload_url(), 200}).is_ok());

    ASSERT_TRUE(session.mark_failed("connection reset").is_ok());
    EXPECT_EQ(session.phase(), UploadPhase::Failed);
    EXPECT_EQ(session.upload_url(), upload_url());
    EXPECT_EQ(session.offset(), std::optional<std::uint64_t>(200));
    EXPECT_EQ(std::get<state::Failed>(session.state()).last_error, "connection reset");

    // A retry starts over from resume or create
    EXPECT_TRUE(session.transition_to(state::Resuming{}).is_ok());
}

TEST(UploadSessionTest, PauseForgetsEverything) {
    UploadSession session{"fp"};
    session.set_file_size(300);
    session.set_chunk_size(30);
    ASSERT_TRUE(session.transition_to(state::Creating{}).is_ok());
    ASSERT_TRUE(session.transition_to(state::OffsetSync{upload_url()}).is_ok());

    session.reset_to_paused();
    EXPECT_EQ(session.phase(), UploadPhase::Paused);
    EXPECT_TRUE(session.fingerprint().empty());
    EXPECT_FALSE(session.file_size().has_value());
    EXPECT_EQ(session.chunk_size(), 0u);
    EXPECT_FALSE(session.upload_url().has_value());

    EXPECT_TRUE(session.mark_failed("late error").is_error());
    EXPECT_TRUE(session.transition_to(state::Creating{}).is_ok());
}

TEST(UploadSessionTest, PhaseNames) {
    EXPECT_STREQ(tusup::upload::phase_name(UploadPhase::OffsetSync), "OffsetSync");
    EXPECT_STREQ(tusup::upload::phase_name(UploadPhase::Transferring), "Transferring");
}
