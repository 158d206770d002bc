#include "cli_options.hpp"
#include "reader_exception.hpp"
#include <gtest/gtest.h>

using namespace eshia;

static const char *START_URL = "https://lib.eshia.ir/15050/1/0";

TEST(CliOptionsTest, Defaults) {
	CliOptions options = ParseCliOptions({START_URL});
	EXPECT_EQ(options.start_url, START_URL);
	EXPECT_EQ(options.output_path, "book_text.txt");
	EXPECT_EQ(options.crawl.max_pages, 10000);
	EXPECT_DOUBLE_EQ(options.crawl.delay_seconds, 0.0);
	EXPECT_DOUBLE_EQ(options.crawl.timeout_seconds, 30.0);
	EXPECT_EQ(options.crawl.retries, 3);
	EXPECT_FALSE(options.quiet);
	EXPECT_FALSE(options.show_help);
}

TEST(CliOptionsTest, ParsesAllOptions) {
	CliOptions options = ParseCliOptions({"--max-pages", "25", START_URL, "-o", "out.txt", "--delay=0.5",
	                                      "--timeout", "12", "--retries=5", "--quiet"});
	EXPECT_EQ(options.start_url, START_URL);
	EXPECT_EQ(options.output_path, "out.txt");
	EXPECT_EQ(options.crawl.max_pages, 25);
	EXPECT_DOUBLE_EQ(options.crawl.delay_seconds, 0.5);
	EXPECT_DOUBLE_EQ(options.crawl.timeout_seconds, 12.0);
	EXPECT_EQ(options.crawl.retries, 5);
	EXPECT_TRUE(options.quiet);
}

TEST(CliOptionsTest, Help) {
	EXPECT_TRUE(ParseCliOptions({"--help"}).show_help);
	EXPECT_TRUE(ParseCliOptions({START_URL, "-h"}).show_help);
	EXPECT_NE(CliUsage("eshia_reader").find("--max-pages"), std::string::npos);
}

TEST(CliOptionsTest, RejectsOutOfRangeNumbers) {
	auto expect_message = [](std::vector<std::string> args, const std::string &message) {
		try {
			ParseCliOptions(std::move(args));
			FAIL() << "expected ArgumentException: " << message;
		} catch (const ArgumentException &e) {
			EXPECT_EQ(std::string(e.what()), message);
		}
	};
	expect_message({START_URL, "--max-pages", "0"}, "--max-pages must be >= 1");
	expect_message({START_URL, "--retries", "0"}, "--retries must be >= 1");
	expect_message({START_URL, "--timeout", "0"}, "--timeout must be > 0");
	expect_message({START_URL, "--delay", "-1"}, "--delay must be >= 0");
}

TEST(CliOptionsTest, RejectsMalformedInput) {
	EXPECT_THROW(ParseCliOptions({}), ArgumentException);
	EXPECT_THROW(ParseCliOptions({START_URL, "extra"}), ArgumentException);
	EXPECT_THROW(ParseCliOptions({START_URL, "--verbose"}), ArgumentException);
	EXPECT_THROW(ParseCliOptions({START_URL, "--max-pages"}), ArgumentException);
	EXPECT_THROW(ParseCliOptions({START_URL, "--max-pages", "ten"}), ArgumentException);
	EXPECT_THROW(ParseCliOptions({START_URL, "--delay", "nan"}), ArgumentException);
	EXPECT_THROW(ParseCliOptions({START_URL, "--output="}), ArgumentException);
	EXPECT_THROW(ParseCliOptions({"https://lib.eshia.ir/15050/1"}), ArgumentException);
	EXPECT_THROW(ParseCliOptions({"lib.eshia.ir/15050/1/0"}), ArgumentException);
}
