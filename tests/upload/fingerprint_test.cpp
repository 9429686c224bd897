#include "tusup/upload/fingerprint.hpp"

#include <gtest/gtest.h>

using tusup::upload::generate_fingerprint;

TEST(FingerprintTest, CollapsesSeparatorRuns) {
    EXPECT_EQ(generate_fingerprint("/tmp/a b.mp4"), ".tmp.a.b.mp4");
    EXPECT_EQ(generate_fingerprint("C:\\Videos\\clip--final.mov"), "C.Videos.clip.final.mov");
    EXPECT_EQ(generate_fingerprint("my_video_01"), "my_video_01");
}

TEST(FingerprintTest, Deterministic) {
    EXPECT_EQ(generate_fingerprint("/data/movie.mp4"), generate_fingerprint("/data/movie.mp4"));
    EXPECT_NE(generate_fingerprint("/data/movie.mp4"), generate_fingerprint("/data/movie.mov"));
    EXPECT_EQ(generate_fingerprint(""), "");
}
