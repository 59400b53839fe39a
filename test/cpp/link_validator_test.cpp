#include "link_validator.hpp"
#include "cancellation.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

using namespace duckdb;

static StreamLink MakeLink(const std::string &url) {
	StreamLink link;
	link.url = url;
	link.format = StreamFormat::MP4;
	return link;
}

class LinkValidatorTest : public ::testing::Test {
protected:
	void SetUp() override {
		transport = std::make_shared<FakeTransport>();
	}

	LinkValidator MakeValidator(int max_concurrent = 5) {
		return LinkValidator(transport, "TestAgent/1.0", 5000, max_concurrent);
	}

	std::shared_ptr<FakeTransport> transport;
};

TEST_F(LinkValidatorTest, HeadSuccessValidates) {
	const std::string url = "https://cdn.example/720p/video.mp4";
	transport->RouteHead(url, FakeTransport::Media("video/mp4", 734003200));
	auto link = MakeValidator().Validate(MakeLink(url));
	EXPECT_TRUE(link.validated);
	EXPECT_EQ(link.content_type, "video/mp4");
	EXPECT_EQ(link.content_length, 734003200);

	auto calls = transport->Calls();
	ASSERT_EQ(calls.size(), 1u);
	EXPECT_EQ(calls[0].method, HttpMethod::HEAD);
	EXPECT_LE(calls[0].timeout_ms, 5000);
}

TEST_F(LinkValidatorTest, FallsBackToRangedGetWhenHeadRefused) {
	const std::string url = "https://cdn.example/ep1.m3u8";
	transport->RouteHead(url, FakeTransport::Status(405));
	auto partial = FakeTransport::Media("application/vnd.apple.mpegurl", 1024);
	partial.status_code = 206;
	partial.range_total = 4096;
	transport->RouteGet(url, partial);

	auto link = MakeValidator().Validate(MakeLink(url));
	EXPECT_TRUE(link.validated);
	EXPECT_EQ(link.content_length, 4096);

	auto calls = transport->Calls();
	ASSERT_EQ(calls.size(), 2u);
	EXPECT_EQ(calls[1].method, HttpMethod::GET);
	EXPECT_EQ(calls[1].range, "0-1023");
}

TEST_F(LinkValidatorTest, FailuresLeaveLinkUnvalidated) {
	transport->RouteHead("https://cdn.example/gone.mp4", FakeTransport::Status(404));
	transport->RouteHead("https://cdn.example/slow.mp4", FakeTransport::Timeout());
	transport->RouteHead("https://cdn.example/broken.mp4", FakeTransport::Status(500));

	auto validator = MakeValidator();
	EXPECT_FALSE(validator.Validate(MakeLink("https://cdn.example/gone.mp4")).validated);
	EXPECT_FALSE(validator.Validate(MakeLink("https://cdn.example/slow.mp4")).validated);
	EXPECT_FALSE(validator.Validate(MakeLink("https://cdn.example/broken.mp4")).validated);
	// No ranged GET unless HEAD was refused
	EXPECT_EQ(transport->CallCount(), 3u);
}

TEST_F(LinkValidatorTest, ValidateAllKeepsEveryLink) {
	std::vector<StreamLink> links;
	for (int i = 0; i < 12; i++) {
		std::string url = "https://cdn.example/v/" + std::to_string(i) + ".mp4";
		transport->RouteHead(url, i % 2 == 0 ? FakeTransport::Status(200) : FakeTransport::Status(403));
		links.push_back(MakeLink(url));
	}
	EXPECT_TRUE(MakeValidator(5).ValidateAll(links));
	ASSERT_EQ(links.size(), 12u);
	for (int i = 0; i < 12; i++) {
		EXPECT_EQ(links[i].url, "https://cdn.example/v/" + std::to_string(i) + ".mp4");
		EXPECT_EQ(links[i].validated, i % 2 == 0);
	}
	EXPECT_EQ(transport->CallCount(), 12u);
}

TEST_F(LinkValidatorTest, StoppedTokenSkipsProbes) {
	std::vector<StreamLink> links = {MakeLink("https://cdn.example/a.mp4"), MakeLink("https://cdn.example/b.mp4")};
	CancellationToken cancel;
	cancel.SetDeadline(CancellationToken::Clock::now() - std::chrono::milliseconds(1));
	EXPECT_FALSE(MakeValidator().ValidateAll(links, &cancel));
	EXPECT_EQ(links.size(), 2u);
	EXPECT_FALSE(links[0].validated);
	EXPECT_EQ(transport->CallCount(), 0u);
}
