#include "quality_classifier.hpp"

#include <gtest/gtest.h>

using namespace duckdb;

static Candidate MakeCandidate(const std::string &url, const std::string &hint = "") {
	Candidate candidate;
	candidate.raw_url = url;
	candidate.source_page_url = "https://phimmoi.net/phim/x/tap-1/";
	candidate.method = DiscoveryMethod::SCRIPT;
	candidate.depth = 1;
	candidate.quality_hint = hint;
	return candidate;
}

TEST(QualityClassifierTest, DetectsFormatFromExtension) {
	EXPECT_EQ(DetectFormat("https://cdn.example/a/video.mp4"), StreamFormat::MP4);
	EXPECT_EQ(DetectFormat("https://cdn.example/a/video.M4V?x=1"), StreamFormat::MP4);
	EXPECT_EQ(DetectFormat("https://cdn.example/a/index.m3u8"), StreamFormat::M3U8);
	EXPECT_EQ(DetectFormat("https://cdn.example/a/movie.mkv"), StreamFormat::MKV);
	EXPECT_EQ(DetectFormat("https://cdn.example/a/movie.avi"), StreamFormat::AVI);
	EXPECT_EQ(DetectFormat("https://cdn.example/a/clip.webm"), StreamFormat::WEBM);
}

TEST(QualityClassifierTest, DetectsHlsWithoutExtension) {
	EXPECT_EQ(DetectFormat("https://cdn.example/hls/abc/master"), StreamFormat::M3U8);
	EXPECT_EQ(DetectFormat("https://cdn.example/play?file=master.m3u8"), StreamFormat::M3U8);
	EXPECT_EQ(DetectFormat("https://cdn.example/embed/abc"), StreamFormat::UNKNOWN);
}

TEST(QualityClassifierTest, DetectsQualityTokens) {
	EXPECT_EQ(DetectQuality("https://cdn.example/2160p/a.mp4"), StreamQuality::Q4K);
	EXPECT_EQ(DetectQuality("https://cdn.example/a-4K.mp4"), StreamQuality::Q4K);
	EXPECT_EQ(DetectQuality("https://cdn.example/uhd/a.mp4"), StreamQuality::Q4K);
	EXPECT_EQ(DetectQuality("https://cdn.example/a_1080p.mp4"), StreamQuality::Q1080P);
	EXPECT_EQ(DetectQuality("https://cdn.example/FHD/a.mp4"), StreamQuality::Q1080P);
	EXPECT_EQ(DetectQuality("https://cdn.example/fullhd/a.mp4"), StreamQuality::Q1080P);
	EXPECT_EQ(DetectQuality("https://cdn.example/720p/video.mp4"), StreamQuality::Q720P);
	EXPECT_EQ(DetectQuality("https://cdn.example/a.480p.mp4"), StreamQuality::Q480P);
	EXPECT_EQ(DetectQuality("https://cdn.example/video360p.mp4"), StreamQuality::Q360P);
	EXPECT_EQ(DetectQuality("https://cdn.example/a.mp4"), StreamQuality::UNKNOWN);
}

TEST(QualityClassifierTest, IgnoresDigitsThatAreNotTokens) {
	EXPECT_EQ(DetectQuality("https://cdn.example/ep1720p.mp4"), StreamQuality::UNKNOWN);
	EXPECT_EQ(DetectQuality("https://cdn.example/h264k/a.mp4"), StreamQuality::UNKNOWN);
}

TEST(QualityClassifierTest, FilenameBeatsPathBeatsQuery) {
	EXPECT_EQ(DetectQuality("https://cdn.example/1080p/ep1-480p.mp4"), StreamQuality::Q480P);
	EXPECT_EQ(DetectQuality("https://cdn.example/720p/ep1.mp4?q=1080p"), StreamQuality::Q720P);
	EXPECT_EQ(DetectQuality("https://cdn.example/ep1.mp4?quality=1080p"), StreamQuality::Q1080P);
}

TEST(QualityClassifierTest, HintUsedOnlyWithoutUrlToken) {
	auto from_hint = QualityClassifier::Classify(MakeCandidate("https://cdn.example/v/a.mp4", "HD 1080"));
	EXPECT_EQ(from_hint.quality, StreamQuality::Q1080P);
	EXPECT_EQ(from_hint.quality_rank, 4);

	auto url_wins = QualityClassifier::Classify(MakeCandidate("https://cdn.example/v/a-720p.mp4", "1080p"));
	EXPECT_EQ(url_wins.quality, StreamQuality::Q720P);
	EXPECT_EQ(url_wins.quality_rank, 3);

	auto unknown = QualityClassifier::Classify(MakeCandidate("https://cdn.example/v/a.mp4", "Server 2"));
	EXPECT_EQ(unknown.quality, StreamQuality::UNKNOWN);
	EXPECT_EQ(unknown.quality_rank, 0);
}

TEST(QualityClassifierTest, ClassifyCarriesCandidateFields) {
	auto link = QualityClassifier::Classify(MakeCandidate("https://cdn.example/720p/video.mp4"));
	EXPECT_EQ(link.url, "https://cdn.example/720p/video.mp4");
	EXPECT_EQ(link.format, StreamFormat::MP4);
	EXPECT_EQ(link.quality, StreamQuality::Q720P);
	EXPECT_EQ(link.quality_rank, 3);
	EXPECT_FALSE(link.validated);
	EXPECT_EQ(link.method, DiscoveryMethod::SCRIPT);
	EXPECT_EQ(link.depth, 1);
	EXPECT_EQ(link.source_page_url, "https://phimmoi.net/phim/x/tap-1/");
}

TEST(QualityClassifierTest, RanksAndNames) {
	EXPECT_EQ(QualityRank(StreamQuality::Q4K), 5);
	EXPECT_EQ(QualityRank(StreamQuality::Q1080P), 4);
	EXPECT_EQ(QualityRank(StreamQuality::Q720P), 3);
	EXPECT_EQ(QualityRank(StreamQuality::Q480P), 2);
	EXPECT_EQ(QualityRank(StreamQuality::Q360P), 1);
	EXPECT_EQ(QualityRank(StreamQuality::UNKNOWN), 0);
	EXPECT_STREQ(StreamQualityToString(StreamQuality::Q4K), "4K");
	EXPECT_STREQ(StreamQualityToString(StreamQuality::Q720P), "720p");
	EXPECT_STREQ(StreamFormatToString(StreamFormat::WEBM), "WebM");
	EXPECT_STREQ(StreamFormatToString(StreamFormat::M3U8), "M3U8");
}
