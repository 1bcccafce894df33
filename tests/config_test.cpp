#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include <static_server/config.hpp>

using static_server::config::parse_arguments;

namespace
{
    static_server::config::Settings parse(std::vector<const char *> args)
    {
        args.insert(args.begin(), "static_server");
        return parse_arguments(static_cast<int>(args.size()), args.data());
    }
}

TEST(ConfigTest, DefaultsWithoutArguments)
{
    // No flags gives the stock port, limits and document roots.
    auto settings = parse({});
    EXPECT_EQ(settings.port, 8000);
    EXPECT_EQ(settings.bind_address, "0.0.0.0");
    EXPECT_EQ(settings.root_path, "public_html");
    EXPECT_EQ(settings.assets_path, "server_assets");
    EXPECT_EQ(settings.max_connections, 4u);
    EXPECT_EQ(settings.rate_limit, 100u);
    EXPECT_EQ(settings.rate_window, std::chrono::seconds(60));
    EXPECT_EQ(settings.read_timeout, std::chrono::seconds(30));
    EXPECT_EQ(settings.log_file, "server.log");
    EXPECT_FALSE(settings.gzip);
}

TEST(ConfigTest, ParsesEveryOption)
{
    // Each flag lands in its field.
    auto settings = parse({"--port=9090", "--host=127.0.0.1", "-d", "/srv/www", "--assets", "/srv/assets",
                           "--max-connections=16", "--rate-limit=5", "--rate-window=10", "--read-timeout=3",
                           "--log-file=/tmp/access.log", "--gzip"});
    EXPECT_EQ(settings.port, 9090);
    EXPECT_EQ(settings.bind_address, "127.0.0.1");
    EXPECT_EQ(settings.root_path, "/srv/www");
    EXPECT_EQ(settings.assets_path, "/srv/assets");
    EXPECT_EQ(settings.max_connections, 16u);
    EXPECT_EQ(settings.rate_limit, 5u);
    EXPECT_EQ(settings.rate_window, std::chrono::seconds(10));
    EXPECT_EQ(settings.read_timeout, std::chrono::seconds(3));
    EXPECT_EQ(settings.log_file, "/tmp/access.log");
    EXPECT_TRUE(settings.gzip);
}

TEST(ConfigTest, RejectsBadValues)
{
    // Out-of-range, non-numeric and unknown arguments are refused.
    EXPECT_THROW(parse({"--port=0"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port=70000"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port=80x"}), std::invalid_argument);
    EXPECT_THROW(parse({"--max-connections=-1"}), std::invalid_argument);
    EXPECT_THROW(parse({"--rate-limit="}), std::invalid_argument);
    EXPECT_THROW(parse({"--directory"}), std::invalid_argument);
    EXPECT_THROW(parse({"--verbose"}), std::invalid_argument);
}
