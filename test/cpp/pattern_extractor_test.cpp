#include "pattern_extractor.hpp"
#include "script_scanner.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

using namespace duckdb;

static const std::string PAGE_URL = "https://phimmoi.net/phim/ten-phim/tap-1/";

static std::vector<std::string> Urls(const std::vector<Candidate> &candidates) {
	std::vector<std::string> urls;
	for (const auto &candidate : candidates) {
		urls.push_back(candidate.raw_url);
	}
	return urls;
}

static bool Contains(const std::vector<Candidate> &candidates, const std::string &url) {
	auto urls = Urls(candidates);
	return std::find(urls.begin(), urls.end(), url) != urls.end();
}

static const Candidate *Find(const std::vector<Candidate> &candidates, const std::string &url) {
	for (const auto &candidate : candidates) {
		if (candidate.raw_url == url) {
			return &candidate;
		}
	}
	return nullptr;
}

TEST(UrlHeuristicsTest, StreamExtensions) {
	EXPECT_TRUE(HasStreamExtension("https://cdn.example/a/video.mp4"));
	EXPECT_TRUE(HasStreamExtension("https://cdn.example/a/master.M3U8?token=1"));
	EXPECT_TRUE(HasStreamExtension("/v/movie.mkv#t=10"));
	EXPECT_FALSE(HasStreamExtension("https://cdn.example/mp4/"));
	EXPECT_FALSE(HasStreamExtension("https://cdn.example.mp4/"));

	EXPECT_TRUE(IsLikelyStreamUrl("https://cdn.example/hls/abc/index"));
	EXPECT_FALSE(IsLikelyStreamUrl("https://cdn.example/play.m3u8.php?id=1"));
	EXPECT_FALSE(IsLikelyStreamUrl("https://cdn.example/poster.jpg"));
	EXPECT_FALSE(IsLikelyStreamUrl("https://cdn.example/player.js"));
	EXPECT_FALSE(IsLikelyStreamUrl("not a url.mp4"));

	EXPECT_TRUE(HasStreamKeyword("https://cdn.example/stream/abc"));
	EXPECT_FALSE(HasStreamKeyword("https://example.com/about"));
}

TEST(UrlHeuristicsTest, ResolveCandidateUrl) {
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "/media/a.mp4"), "https://phimmoi.net/media/a.mp4");
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "//cdn.example/a.mp4"), "https://cdn.example/a.mp4");
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "https:\\/\\/cdn.example\\/a.mp4"), "https://cdn.example/a.mp4");
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "javascript:void(0)"), "");
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "data:video/mp4;base64,AAAA"), "");
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "blob:https://phimmoi.net/1234"), "");
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "about:blank"), "");
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, ""), "");
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "/player.php?url=https://abc.example/e/1"),
	          "https://phimmoi.net/player.php?url=https://abc.example/e/1");
}

TEST(UrlHeuristicsTest, LocalAndPrivateHostsAreDropped) {
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "http://127.0.0.1/x.mp4"), "");
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "http://127.0.0.1:8080/admin"), "");
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "http://169.254.169.254/latest/meta-data/"), "");
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "http://localhost/v.m3u8"), "");
	EXPECT_EQ(ResolveCandidateUrl(PAGE_URL, "http://[::1]/v.m3u8"), "");
	EXPECT_EQ(ResolveCandidateUrl("http://10.0.0.5/page", "/v.mp4"), "");
}

TEST(PatternExtractorTest, DirectMarkup) {
	std::string html = R"(<html><body>
		<video controls src="/media/ep1.mp4" poster="/img/p.jpg"></video>
		<video><source src="https://cdn.example/720p/video.mp4" type="video/mp4"></video>
		<div class="player" data-video="https://cdn2.example/hls/ep1/index.m3u8"></div>
		<a href="https://cdn3.example/files/ep1.mkv">Download</a>
		<a href="/phim/ten-phim/tap-2/">Next</a>
		<p>Backup: https://cdn4.example/ep1.webm</p>
	</body></html>)";
	PageContent page {html, PAGE_URL, 0};
	auto found = ExtractDirectMarkup(page);

	EXPECT_TRUE(Contains(found, "https://phimmoi.net/media/ep1.mp4"));
	EXPECT_TRUE(Contains(found, "https://cdn.example/720p/video.mp4"));
	EXPECT_TRUE(Contains(found, "https://cdn2.example/hls/ep1/index.m3u8"));
	EXPECT_TRUE(Contains(found, "https://cdn3.example/files/ep1.mkv"));
	EXPECT_TRUE(Contains(found, "https://cdn4.example/ep1.webm"));
	EXPECT_FALSE(Contains(found, "https://phimmoi.net/phim/ten-phim/tap-2/"));
	EXPECT_FALSE(Contains(found, "https://phimmoi.net/img/p.jpg"));
	for (const auto &candidate : found) {
		EXPECT_EQ(candidate.method, DiscoveryMethod::DIRECT);
		EXPECT_EQ(candidate.depth, 0);
		EXPECT_EQ(candidate.source_page_url, PAGE_URL);
	}
}

TEST(PatternExtractorTest, MetaTags) {
	std::string html = R"(<head>
		<meta property="og:video" content="https://cdn.example/og/ep1.mp4">
		<meta property="og:video:secure_url" content="https://cdn.example/og/ep1-secure.mp4">
		<meta name="twitter:player:stream" content="https://cdn.example/tw/ep1.m3u8">
		<meta property="og:image" content="https://cdn.example/og/thumb.jpg">
		<link rel="video_src" href="https://cdn.example/link/ep1.mp4">
	</head>)";
	PageContent page {html, PAGE_URL, 0};
	auto found = ExtractMetaTagLinks(page);
	EXPECT_EQ(found.size(), 4u);
	EXPECT_TRUE(Contains(found, "https://cdn.example/og/ep1.mp4"));
	EXPECT_TRUE(Contains(found, "https://cdn.example/og/ep1-secure.mp4"));
	EXPECT_TRUE(Contains(found, "https://cdn.example/tw/ep1.m3u8"));
	EXPECT_TRUE(Contains(found, "https://cdn.example/link/ep1.mp4"));
}

TEST(PatternExtractorTest, InlineScriptJsonKeepsQualityLabels) {
	std::string html = R"(<script>
		var playerData = {"sources": [
			{"file": "https:\/\/cdn.example\/v\/a.mp4", "label": "1080p"},
			{"file": "https:\/\/cdn.example\/v\/b.mp4", "label": "480p"}
		]};
	</script>)";
	PageContent page {html, PAGE_URL, 0};
	auto found = ExtractInlineScriptLinks(page);

	auto a = Find(found, "https://cdn.example/v/a.mp4");
	auto b = Find(found, "https://cdn.example/v/b.mp4");
	ASSERT_NE(a, nullptr);
	ASSERT_NE(b, nullptr);
	EXPECT_EQ(a->quality_hint, "1080p");
	EXPECT_EQ(b->quality_hint, "480p");
	EXPECT_EQ(a->method, DiscoveryMethod::SCRIPT);
}

TEST(PatternExtractorTest, InlineScriptLiteralsAndKeyedValues) {
	std::string html = R"(<script type="text/javascript">
		// var old = "https://cdn.example/old/commented.mp4";
		var hls = 'https://cdn.example/live/stream.m3u8';
		player.load({ file: "/media/stream/episode-1", autoplay: true });
		var poster = "https://cdn.example/poster.png";
	</script>
	<script type="text/template"><video src="https://cdn.example/template.mp4"></video></script>)";
	PageContent page {html, PAGE_URL, 0};
	auto found = ExtractInlineScriptLinks(page);

	EXPECT_TRUE(Contains(found, "https://cdn.example/live/stream.m3u8"));
	EXPECT_TRUE(Contains(found, "https://phimmoi.net/media/stream/episode-1"));
	EXPECT_FALSE(Contains(found, "https://cdn.example/old/commented.mp4"));
	EXPECT_FALSE(Contains(found, "https://cdn.example/poster.png"));
	EXPECT_FALSE(Contains(found, "https://cdn.example/template.mp4"));
}

TEST(PatternExtractorTest, PlayerConfigs) {
	std::string html = R"(<div id="player"></div><script>
		jwplayer("player").setup({
			sources: [{file: "https://cdn.example/jw/ep1-720.mp4", label: "720p"}],
			image: "https://cdn.example/jw/poster.jpg"
		});
		const dp = new DPlayer({ container: el, video: { url: 'https://cdn.example/dp/index.m3u8' } });
		videojs('vjs').src("https://cdn.example/vjs/master");
	</script>)";
	PageContent page {html, PAGE_URL, 0};
	auto found = ExtractPlayerConfigLinks(page);

	auto jw = Find(found, "https://cdn.example/jw/ep1-720.mp4");
	ASSERT_NE(jw, nullptr);
	EXPECT_EQ(jw->quality_hint, "720p");
	EXPECT_TRUE(Contains(found, "https://cdn.example/dp/index.m3u8"));
	EXPECT_TRUE(Contains(found, "https://cdn.example/vjs/master"));
	EXPECT_FALSE(Contains(found, "https://cdn.example/jw/poster.jpg"));
}

TEST(PatternExtractorTest, IframesAtNextDepth) {
	std::string html = R"(
		<iframe src="/embed/ep1" width="100%"></iframe>
		<iframe src="about:blank" data-src="https://player.example/e/abc"></iframe>
		<iframe src="https://www.facebook.com/plugins/comments.php?href=x"></iframe>
		<iframe src="https://cdn.example/direct/ep1.mp4"></iframe>
		<iframe src="javascript:false"></iframe>
		<iframe src="/player.php?url=https://abc.example/e/1"></iframe>
		<iframe src="http://127.0.0.1:8080/admin"></iframe>
		<iframe src="http://169.254.169.254/latest/meta-data/"></iframe>
		<iframe title="src=x" src="/embed/ep2"></iframe>)";
	PageContent page {html, PAGE_URL, 1};
	auto found = ExtractIframeLinks(page, {"facebook.com"});

	ASSERT_EQ(found.size(), 5u);
	EXPECT_EQ(found[0].raw_url, "https://phimmoi.net/embed/ep1");
	EXPECT_EQ(found[0].method, DiscoveryMethod::IFRAME);
	EXPECT_EQ(found[0].depth, 2);
	EXPECT_EQ(found[1].raw_url, "https://player.example/e/abc");
	EXPECT_EQ(found[2].raw_url, "https://cdn.example/direct/ep1.mp4");
	EXPECT_EQ(found[2].method, DiscoveryMethod::DIRECT);
	EXPECT_EQ(found[2].depth, 1);
	EXPECT_EQ(found[3].raw_url, "https://phimmoi.net/player.php?url=https://abc.example/e/1");
	EXPECT_EQ(found[3].method, DiscoveryMethod::IFRAME);
	EXPECT_EQ(found[3].depth, 2);
	EXPECT_EQ(found[4].raw_url, "https://phimmoi.net/embed/ep2");
}

TEST(PatternExtractorTest, RelativeSourceAfterQuotedLookalike) {
	std::string html = R"(<video poster="/p.jpg?src=1" src="/v/ep1.m3u8"></video>)";
	PageContent page {html, PAGE_URL, 0};
	auto found = ExtractDirectMarkup(page);
	ASSERT_EQ(found.size(), 1u);
	EXPECT_EQ(found[0].raw_url, "https://phimmoi.net/v/ep1.m3u8");
}

TEST(PatternExtractorTest, RunsAllStrategiesInOrder) {
	std::string html = R"(<video src="https://cdn.example/a.mp4"></video>
		<script>var src = "https://cdn.example/b.m3u8";</script>
		<iframe src="https://player.example/e/1"></iframe>)";
	PatternExtractor extractor;
	EXPECT_EQ(extractor.StrategyCount(), 5u);
	auto found = extractor.Extract(html, PAGE_URL, 0);

	ASSERT_FALSE(found.empty());
	EXPECT_EQ(found.front().raw_url, "https://cdn.example/a.mp4");
	EXPECT_EQ(found.back().raw_url, "https://player.example/e/1");
	EXPECT_EQ(found.back().method, DiscoveryMethod::IFRAME);
	EXPECT_TRUE(Contains(found, "https://cdn.example/b.m3u8"));
}

TEST(PatternExtractorTest, FailingStrategyDoesNotStopOthers) {
	PatternExtractor extractor;
	extractor.ClearStrategies();
	extractor.AddStrategy("broken", [](const PageContent &) -> std::vector<Candidate> {
		throw std::runtime_error("boom");
	});
	extractor.AddStrategy("direct", ExtractDirectMarkup);
	auto found = extractor.Extract("<video src=\"https://cdn.example/a.mp4\">", PAGE_URL, 0);
	ASSERT_EQ(found.size(), 1u);
	EXPECT_EQ(found[0].raw_url, "https://cdn.example/a.mp4");
}

TEST(PatternExtractorTest, MalformedHtmlDegradesGracefully) {
	std::string html = "<div><video src='https://cdn.example/broken.mp4'<p>unclosed <iframe src=\"/embed/2\"";
	PatternExtractor extractor;
	auto found = extractor.Extract(html, PAGE_URL, 0);
	EXPECT_TRUE(Contains(found, "https://cdn.example/broken.mp4"));
	EXPECT_TRUE(Contains(found, "https://phimmoi.net/embed/2"));
	EXPECT_TRUE(extractor.Extract("", PAGE_URL, 0).empty());
}

TEST(ScriptScannerTest, ExtractsJsonAssignmentsAndCallArguments) {
	auto values = ExtractJsonValues(R"(var a = {"x": 1}; window.cfg = [1, 2]; setup({"file": "v.mp4"}); if (a == {}) {})");
	ASSERT_EQ(values.size(), 3u);
	EXPECT_EQ(values[0], R"({"x": 1})");
	EXPECT_EQ(values[1], "[1, 2]");
	EXPECT_EQ(values[2], R"({"file": "v.mp4"})");
}

TEST(ScriptScannerTest, StripsCommentsButNotUrls) {
	std::string stripped = StripScriptComments("var u = \"https://a/b.mp4\"; // note\n/* block */x");
	EXPECT_NE(stripped.find("https://a/b.mp4"), std::string::npos);
	EXPECT_EQ(stripped.find("note"), std::string::npos);
	EXPECT_EQ(stripped.find("block"), std::string::npos);
}

TEST(ScriptScannerTest, FindsUrlsWithNumericHints) {
	auto hits = FindUrlsInJson(R"({"sources": [{"src": "https://c/a.mp4", "res": 720}]})",
	                           [](const std::string &value) { return IsLikelyStreamUrl(value); });
	ASSERT_EQ(hits.size(), 1u);
	EXPECT_EQ(hits[0].url, "https://c/a.mp4");
	EXPECT_EQ(hits[0].quality_hint, "720p");
}
