#include "log/FileLog.hpp"

#define LogType FileLog
#include "LogTests.hpp"

#include "util/asio.hpp"
#include "util/util.hpp"

#include "coro_test.hpp"

#include <sstream>

namespace
{

std::filesystem::path getLogPath()
{
    return std::filesystem::temp_directory_path() / "videoflix-streamer_test.FileLog.log";
}

std::unique_ptr<Log::Log> createLog(IOContext &ioc, ::Log::Level minLevel)
{
    return std::make_unique<Log::FileLog>(ioc, getLogPath(), minLevel, false);
}

/**
 * Read the log file back, one item per line.
 */
std::vector<Log::Item> readLogFile()
{
    std::vector<std::byte> data = Util::readFile(getLogPath());
    std::istringstream stream(std::string((const char *)data.data(), data.size()));

    std::vector<Log::Item> items;
    std::string line;
    while (std::getline(stream, line)) {
        items.emplace_back(Log::Item::fromJsonString(line));
    }
    return items;
}

TEST(FileLog, JsonLines)
{
    IOContext ioc;
    std::unique_ptr<Log::Log> log = createLog(ioc);
    {
        Log::Context context = log->operator()("request");
        context << "what" << Log::Level::info << "get /videos/1/stream/720p";
    }
    ioc.run();

    std::vector<Log::Item> items = readLogFile();
    ASSERT_EQ(4u, items.size());
    EXPECT_EQ("log", items[0].kind);
    EXPECT_EQ("log context", items[1].kind);
    EXPECT_EQ("what", items[2].kind);
    EXPECT_EQ("get /videos/1/stream/720p", items[2].message);
    EXPECT_EQ("request", items[2].contextName);
    EXPECT_EQ("destroyed", items[3].message);

    // Timestamps survive to the microsecond, and don't go backwards.
    EXPECT_LE(items[1].logTime, items[2].logTime);
    EXPECT_LE(items[2].systemTime, items[3].systemTime);
}

TEST(FileLog, Truncates)
{
    {
        IOContext ioc;
        std::unique_ptr<Log::Log> log = createLog(ioc);
        log->operator()("first") << Log::Level::info << "first run";
        ioc.run();
    }
    {
        IOContext ioc;
        std::unique_ptr<Log::Log> log = createLog(ioc);
        log->operator()("second") << Log::Level::info << "second run";
        ioc.run();
    }

    for (const Log::Item &item: readLogFile()) {
        EXPECT_NE("first run", item.message);
    }
}

TEST(FileLog, LoadFromFile)
{
    // With a one-item cache, everything but the newest item is read back from the file.
    IOContext ioc;
    Log::FileLog log(ioc, getLogPath(), Log::Level::info, false, 1);
    Log::Context context = log("connection");
    for (int i = 0; i < 5; i++) {
        context << "endpoints" << Log::Level::info << "[::1]:" << 50000 + i << " -> [::1]:8080";
    }
    ioc.run();

    testCoSpawn([&log]() -> Awaitable<void> {
        EXPECT_EQ(7u, log.size());
        EXPECT_EQ("created", (co_await log[0]).message);
        EXPECT_EQ("[::1]:50000 -> [::1]:8080", (co_await log[2]).message);
        EXPECT_EQ("[::1]:50004 -> [::1]:8080", (co_await log[6]).message);
    }, ioc);
    ioc.restart();
    ioc.run();
}

} // namespace
