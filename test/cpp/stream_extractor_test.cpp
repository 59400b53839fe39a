#include "stream_extractor.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <memory>

using namespace duckdb;

static const std::string EPISODE = "https://phimmoi.net/phim/x/tap-1/";

class StreamExtractorTest : public ::testing::Test {
protected:
	void SetUp() override {
		transport = std::make_shared<FakeTransport>();
		config = DefaultExtractorConfig();
		config.allowed_domains = {"phimmoi.net"};
		config.validate_links = false;
	}

	std::unique_ptr<StreamExtractor> MakeExtractor(std::shared_ptr<RateLimiter> limiter = nullptr) {
		auto extractor = std::make_unique<StreamExtractor>(config, transport, limiter);
		extractor->Fetcher().SetSleepFunction([](std::chrono::milliseconds) { return true; });
		return extractor;
	}

	std::shared_ptr<FakeTransport> transport;
	ExtractorConfig config;
};

TEST_F(StreamExtractorTest, UnsupportedDomainMakesNoRequests) {
	auto extractor = MakeExtractor();
	auto outcome = extractor->ExtractLinks("https://evil.example/phim/x/tap-1/", "alice");
	EXPECT_EQ(outcome.error, ExtractionErrorType::INVALID_URL);
	EXPECT_EQ(outcome.url_error, UrlErrorType::UNSUPPORTED_DOMAIN);
	EXPECT_TRUE(outcome.links.empty());
	EXPECT_EQ(transport->CallCount(), 0u);
}

TEST_F(StreamExtractorTest, MalformedAndHomepageUrlsAreRejected) {
	auto extractor = MakeExtractor();
	auto outcome = extractor->ExtractLinks("not a url", "alice");
	EXPECT_EQ(outcome.error, ExtractionErrorType::INVALID_URL);
	EXPECT_EQ(outcome.url_error, UrlErrorType::MALFORMED_URL);

	outcome = extractor->ExtractLinks("https://phimmoi.net/", "alice");
	EXPECT_EQ(outcome.error, ExtractionErrorType::INVALID_URL);
	EXPECT_EQ(outcome.url_error, UrlErrorType::HOMEPAGE_NOT_ALLOWED);
	EXPECT_EQ(transport->CallCount(), 0u);
}

TEST_F(StreamExtractorTest, SingleSourceTagIsRankedAndValidated) {
	config.validate_links = true;
	transport->RouteGet(EPISODE, FakeTransport::Page("<video><source src=\"https://cdn.example/720p/video.mp4\"></video>"));
	transport->RouteHead("https://cdn.example/720p/video.mp4", FakeTransport::Media("video/mp4", 1048576));

	auto outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	ASSERT_TRUE(outcome.Ok()) << outcome.message;
	ASSERT_EQ(outcome.links.size(), 1u);
	const auto &link = outcome.links[0];
	EXPECT_EQ(link.url, "https://cdn.example/720p/video.mp4");
	EXPECT_EQ(link.format, StreamFormat::MP4);
	EXPECT_EQ(link.quality, StreamQuality::Q720P);
	EXPECT_EQ(link.quality_rank, 3);
	EXPECT_TRUE(link.validated);
	EXPECT_EQ(link.content_type, "video/mp4");
	EXPECT_EQ(link.content_length, 1048576);
	EXPECT_FALSE(outcome.partial);
}

TEST_F(StreamExtractorTest, UnreachableLinkIsKeptUnvalidated) {
	config.validate_links = true;
	transport->RouteGet(EPISODE, FakeTransport::Page("<video src=\"https://cdn.example/gone.mp4\"></video>"));

	auto outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	ASSERT_TRUE(outcome.Ok());
	ASSERT_EQ(outcome.links.size(), 1u);
	EXPECT_FALSE(outcome.links[0].validated);
}

TEST_F(StreamExtractorTest, DirectAndIframeLinksAreCombined) {
	transport->RouteGet(EPISODE, FakeTransport::Page("<video src=\"https://cdn.example/video.mp4\"></video>"
	                                                 "<iframe src=\"https://player.example/embed/9\"></iframe>"));
	transport->RouteGet("https://player.example/embed/9",
	                    FakeTransport::Page("<script>var player = {file: \"https://cdn.example/hls/stream.m3u8\"};</script>"));

	auto outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	ASSERT_TRUE(outcome.Ok());
	ASSERT_EQ(outcome.links.size(), 2u);
	EXPECT_EQ(outcome.links[0].url, "https://cdn.example/video.mp4");
	EXPECT_EQ(outcome.links[0].format, StreamFormat::MP4);
	EXPECT_EQ(outcome.links[0].depth, 0);
	EXPECT_EQ(outcome.links[1].url, "https://cdn.example/hls/stream.m3u8");
	EXPECT_EQ(outcome.links[1].format, StreamFormat::M3U8);
	EXPECT_EQ(outcome.links[1].depth, 1);
	EXPECT_EQ(outcome.links[1].source_page_url, "https://player.example/embed/9");
}

TEST_F(StreamExtractorTest, DuplicateAcrossStrategiesAndPagesAppearsOnce) {
	transport->RouteGet(EPISODE, FakeTransport::Page("<video src=\"https://cdn.example/a.mp4\"></video>"
	                                                 "<script>var src = \"https:\\/\\/cdn.example\\/a.mp4\";</script>"
	                                                 "<iframe src=\"https://player.example/e\"></iframe>"));
	transport->RouteGet("https://player.example/e",
	                    FakeTransport::Page("<source src=\"https://cdn.example/a.mp4#t=0\">"));

	auto outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	ASSERT_TRUE(outcome.Ok());
	ASSERT_EQ(outcome.links.size(), 1u);
	EXPECT_EQ(outcome.links[0].url, "https://cdn.example/a.mp4");
	EXPECT_EQ(outcome.links[0].depth, 0);
}

TEST_F(StreamExtractorTest, HigherQualitySortsFirst) {
	transport->RouteGet(EPISODE, FakeTransport::Page("<source src=\"https://cdn.example/ep1-360p.mp4\">"
	                                                 "<source src=\"https://cdn.example/ep1-720p.mp4\">"
	                                                 "<source src=\"https://cdn.example/ep1.mp4\">"
	                                                 "<source src=\"https://cdn.example/ep1-1080p.mp4\">"));

	auto outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	ASSERT_TRUE(outcome.Ok());
	ASSERT_EQ(outcome.links.size(), 4u);
	EXPECT_EQ(outcome.links[0].quality, StreamQuality::Q1080P);
	EXPECT_EQ(outcome.links[1].quality, StreamQuality::Q720P);
	EXPECT_EQ(outcome.links[2].quality, StreamQuality::Q360P);
	EXPECT_EQ(outcome.links[3].quality, StreamQuality::UNKNOWN);
	EXPECT_EQ(outcome.links[3].quality_rank, 0);
}

TEST_F(StreamExtractorTest, ValidatedLinkWinsQualityTie) {
	config.validate_links = true;
	transport->RouteGet(EPISODE, FakeTransport::Page("<source src=\"https://cdn1.example/720p/a.mp4\">"
	                                                 "<source src=\"https://cdn2.example/720p/a.mp4\">"));
	transport->RouteHead("https://cdn2.example/720p/a.mp4", FakeTransport::Status(200));

	auto outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	ASSERT_EQ(outcome.links.size(), 2u);
	EXPECT_EQ(outcome.links[0].url, "https://cdn2.example/720p/a.mp4");
	EXPECT_TRUE(outcome.links[0].validated);
	EXPECT_FALSE(outcome.links[1].validated);
}

TEST_F(StreamExtractorTest, IframeChainStopsAtMaxDepth) {
	config.max_iframe_depth = 2;
	auto level = [](int n) { return "https://player.example/level" + std::to_string(n); };
	transport->RouteGet(EPISODE, FakeTransport::Page("<video src=\"https://cdn.example/l0.mp4\"></video>"
	                                                 "<iframe src=\"" + level(1) + "\"></iframe>"));
	for (int n = 1; n <= 5; n++) {
		transport->RouteGet(level(n), FakeTransport::Page("<iframe src=\"" + level(n + 1) + "\"></iframe>"
		                                                  "<video src=\"https://cdn.example/l" + std::to_string(n) +
		                                                  ".mp4\"></video>"));
	}

	auto outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	ASSERT_TRUE(outcome.Ok());
	ASSERT_EQ(outcome.links.size(), 3u);
	for (const auto &link : outcome.links) {
		EXPECT_LE(link.depth, 2);
	}
	EXPECT_EQ(transport->CallCount(level(2)), 1u);
	EXPECT_EQ(transport->CallCount(level(3)), 0u);
	EXPECT_EQ(transport->CallCount(level(5)), 0u);
}

TEST_F(StreamExtractorTest, RateLimitDeniesThenRecovers) {
	auto now = std::make_shared<RateLimiter::Clock::time_point>(RateLimiter::Clock::now());
	auto limiter = std::make_shared<RateLimiter>(2, std::chrono::seconds(60), [now]() { return *now; });
	transport->RouteGet(EPISODE, FakeTransport::Page("<video src=\"https://cdn.example/a.mp4\"></video>"));
	auto extractor = MakeExtractor(limiter);

	EXPECT_TRUE(extractor->ExtractLinks(EPISODE, "alice").Ok());
	EXPECT_TRUE(extractor->ExtractLinks(EPISODE, "alice").Ok());
	auto denied = extractor->ExtractLinks(EPISODE, "alice");
	EXPECT_EQ(denied.error, ExtractionErrorType::RATE_LIMITED);
	EXPECT_EQ(denied.retry_after.count(), 60000);
	EXPECT_EQ(transport->CallCount(EPISODE), 2u);

	// Another requester has its own window
	EXPECT_TRUE(extractor->ExtractLinks(EPISODE, "bob").Ok());

	*now += std::chrono::seconds(61);
	EXPECT_TRUE(extractor->ExtractLinks(EPISODE, "alice").Ok());
}

TEST_F(StreamExtractorTest, RootTimeoutAfterRetries) {
	transport->RouteGet(EPISODE, FakeTransport::Timeout());

	auto outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	EXPECT_EQ(outcome.error, ExtractionErrorType::FETCH_FAILED);
	EXPECT_EQ(outcome.fetch_error, FetchErrorType::TIMEOUT);
	EXPECT_TRUE(outcome.links.empty());
	EXPECT_EQ(transport->CallCount(EPISODE), 3u);
}

TEST_F(StreamExtractorTest, RootHttpErrorCarriesStatus) {
	transport->RouteGet(EPISODE, FakeTransport::Status(403));

	auto outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	EXPECT_EQ(outcome.error, ExtractionErrorType::FETCH_FAILED);
	EXPECT_EQ(outcome.fetch_error, FetchErrorType::HTTP_ERROR);
	EXPECT_EQ(outcome.http_status, 403);
}

TEST_F(StreamExtractorTest, PageWithoutStreamsReportsNoLinks) {
	transport->RouteGet(EPISODE, FakeTransport::Page("<html><img src=\"/poster.jpg\"><script src=\"/app.js\"></script></html>"));

	auto outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	EXPECT_EQ(outcome.error, ExtractionErrorType::NO_LINKS_FOUND);
	EXPECT_TRUE(outcome.links.empty());
}

TEST_F(StreamExtractorTest, MaxLinksCapsResult) {
	config.max_links = 2;
	transport->RouteGet(EPISODE, FakeTransport::Page("<source src=\"https://cdn.example/1.mp4\">"
	                                                 "<source src=\"https://cdn.example/2.mp4\">"
	                                                 "<source src=\"https://cdn.example/3.mp4\">"));

	auto outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	ASSERT_EQ(outcome.links.size(), 2u);
	EXPECT_EQ(outcome.links[0].url, "https://cdn.example/1.mp4");
	EXPECT_EQ(outcome.links[1].url, "https://cdn.example/2.mp4");

	config.max_links = 0;
	outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	EXPECT_EQ(outcome.links.size(), 3u);
}

// Bumps the interrupt counter when a given URL is requested
class InterruptingTransport : public FakeTransport {
public:
	InterruptingTransport(std::string trigger, std::atomic<uint64_t> &interrupts)
	    : trigger_(std::move(trigger)), interrupts_(interrupts) {
	}

	HttpResponse Execute(const std::string &url, const HttpRequestOptions &options) override {
		if (url == trigger_) {
			interrupts_.fetch_add(1);
			HttpResponse response;
			response.error = "Callback aborted";
			response.cancelled = true;
			return response;
		}
		return FakeTransport::Execute(url, options);
	}

private:
	std::string trigger_;
	std::atomic<uint64_t> &interrupts_;
};

TEST_F(StreamExtractorTest, InterruptDuringIframesEndsExtraction) {
	std::atomic<uint64_t> interrupted {0};
	auto interrupting = std::make_shared<InterruptingTransport>("https://player.example/slow", interrupted);
	interrupting->RouteGet(EPISODE, FakeTransport::Page("<iframe src=\"https://player.example/slow\"></iframe>"));

	StreamExtractor extractor(config, interrupting);
	extractor.Fetcher().SetSleepFunction([](std::chrono::milliseconds) { return true; });
	extractor.LinkInterruptCounter(&interrupted);

	auto outcome = extractor.ExtractLinks(EPISODE, "alice");
	EXPECT_EQ(outcome.error, ExtractionErrorType::EXTRACTION_TIMEOUT);
	EXPECT_EQ(outcome.message, "Extraction interrupted");
}

TEST_F(StreamExtractorTest, ExpiredBudgetKeepsLinksFoundSoFar) {
	std::atomic<uint64_t> interrupted {0};
	auto interrupting = std::make_shared<InterruptingTransport>("https://player.example/slow", interrupted);
	interrupting->RouteGet(EPISODE, FakeTransport::Page("<video src=\"https://cdn.example/a.mp4\"></video>"
	                                                    "<iframe src=\"https://player.example/slow\"></iframe>"));

	StreamExtractor extractor(config, interrupting);
	extractor.LinkInterruptCounter(&interrupted);

	auto outcome = extractor.ExtractLinks(EPISODE, "alice");
	ASSERT_TRUE(outcome.Ok());
	ASSERT_EQ(outcome.links.size(), 1u);
	EXPECT_TRUE(outcome.partial);
}

TEST_F(StreamExtractorTest, CustomStrategyJoinsThePipeline) {
	transport->RouteGet(EPISODE, FakeTransport::Page("<div data-episode=\"42\"></div>"));
	auto extractor = MakeExtractor();
	EXPECT_EQ(extractor->Config().allowed_domains.size(), 1u);

	extractor->Patterns().AddStrategy("episode_id", [](const PageContent &page) {
		std::vector<Candidate> found;
		if (page.html.find("data-episode=\"42\"") != std::string::npos) {
			Candidate candidate;
			candidate.raw_url = "https://cdn.example/ep/42/1080p.m3u8";
			candidate.source_page_url = page.page_url;
			candidate.method = DiscoveryMethod::SCRIPT;
			candidate.depth = page.depth;
			found.push_back(candidate);
		}
		return found;
	});

	auto outcome = extractor->ExtractLinks(EPISODE, "alice");
	ASSERT_TRUE(outcome.Ok());
	ASSERT_EQ(outcome.links.size(), 1u);
	EXPECT_EQ(outcome.links[0].format, StreamFormat::M3U8);
	EXPECT_EQ(outcome.links[0].quality, StreamQuality::Q1080P);
	EXPECT_EQ(outcome.links[0].source_page_url, EPISODE);
}

TEST_F(StreamExtractorTest, InterruptBeforeStartDoesNotCancel) {
	std::atomic<uint64_t> interrupted {0};
	transport->RouteGet(EPISODE, FakeTransport::Page("<video src=\"https://cdn.example/a.mp4\"></video>"));
	auto extractor = MakeExtractor();
	extractor->LinkInterruptCounter(&interrupted);

	// An interrupt aimed at an earlier extraction
	interrupted.fetch_add(1);
	auto outcome = extractor->ExtractLinks(EPISODE, "alice");
	ASSERT_TRUE(outcome.Ok()) << outcome.message;
	EXPECT_FALSE(outcome.partial);
}

TEST_F(StreamExtractorTest, LocalAndPrivateTargetsAreNeverRequested) {
	config.validate_links = true;
	transport->SetDefaultHead(FakeTransport::Status(200));
	transport->RouteGet(EPISODE, FakeTransport::Page("<video src=\"http://127.0.0.1/x.mp4\"></video>"
	                                                 "<source src=\"https://cdn.example/ok.mp4\">"
	                                                 "<iframe src=\"http://127.0.0.1:8080/admin\"></iframe>"
	                                                 "<iframe src=\"http://169.254.169.254/latest/meta-data/\"></iframe>"
	                                                 "<script>var f = \"http://192.168.0.10/hls/index.m3u8\";</script>"));

	auto outcome = MakeExtractor()->ExtractLinks(EPISODE, "alice");
	ASSERT_TRUE(outcome.Ok());
	ASSERT_EQ(outcome.links.size(), 1u);
	EXPECT_EQ(outcome.links[0].url, "https://cdn.example/ok.mp4");

	for (const auto &call : transport->Calls()) {
		EXPECT_TRUE(call.url == EPISODE || call.url == "https://cdn.example/ok.mp4") << call.url;
	}
	EXPECT_EQ(transport->CallCount(), 2u);
}

TEST_F(StreamExtractorTest, CustomStrategyCannotReachPrivateHosts) {
	transport->RouteGet(EPISODE, FakeTransport::Page("<html></html>"));
	auto extractor = MakeExtractor();
	extractor->Patterns().AddStrategy("raw", [](const PageContent &page) {
		Candidate candidate;
		candidate.raw_url = "http://10.1.2.3/v/1080p.mp4";
		candidate.source_page_url = page.page_url;
		return std::vector<Candidate> {candidate};
	});

	auto outcome = extractor->ExtractLinks(EPISODE, "alice");
	EXPECT_EQ(outcome.error, ExtractionErrorType::NO_LINKS_FOUND);
	EXPECT_EQ(transport->CallCount(), 1u);
}
