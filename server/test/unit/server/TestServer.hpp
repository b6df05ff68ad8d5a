#pragma once

#include "server/Server.hpp"

#include "server/Error.hpp"
#include "server/Request.hpp"

#include "coro_test.hpp"
#include "log.hpp"

#include <optional>
#include <string>

/**
 * What came back from a request to TestServer.
 */
struct ServerTestResult final
{
    std::optional<Server::ErrorKind> errorKind;
    std::string mimeType;

    /**
     * For requests that reached a test resource: "<resource name> <type> <path>". Otherwise the error message.
     */
    std::string body;
};

/**
 * Makes requests directly of Server::Server, with resources that say who they are and what they were asked for.
 */
class TestServer final : private Server::Server
{
public:
    ~TestServer() override;
    explicit TestServer(Log::Log &log) : Server(log) {}

    /**
     * Add a resource that answers with its name, the request type, and the path it was given.
     *
     * @param name Identifies the resource in responses. Defaults to the path.
     * @param allowNonEmptyPath Whether it takes requests for paths below it.
     * @param allowPost Whether it takes POST requests. Those read the whole body first.
     * @param maxRequestLength The body length it accepts.
     */
    void addResource(const ::Server::Path &path, std::string name = {}, bool allowNonEmptyPath = false,
                     bool allowPost = false, size_t maxRequestLength = 0);

    /**
     * Add a resource that throws Server::Error with the given kind and message.
     */
    void addErrorResource(const ::Server::Path &path, ::Server::ErrorKind kind, std::string message);

    /**
     * Add a resource that throws something other than Server::Error, optionally after writing some of the body.
     */
    void addThrowingResource(const ::Server::Path &path, bool afterWriting);

    /**
     * Make a request and complete it.
     */
    Awaitable<ServerTestResult> operator()(::Server::Path path,
                                           ::Server::Request::Type type = ::Server::Request::Type::get,
                                           std::string_view body = {});

    /**
     * Make a request and return whether the response was aborted.
     */
    Awaitable<bool> isAborted(::Server::Path path);
};

/**
 * A coroutine test with a fresh TestServer. Anything logged at warning or above fails the test.
 */
#define SERVER_TEST(TestSuiteName, TestName, ServerName) \
    static Awaitable<void> TestSuiteName##_##TestName##_withServer(TestServer &ServerName); \
    CORO_TEST(TestSuiteName, TestName, ioc) \
    { \
        ExpectNeverLog log(ioc, Log::Level::warning, [](const Log::Item &item) { \
            ADD_FAILURE() << "Unexpected log item: " << item.format(); \
        }); \
        TestServer server(log); \
        co_await TestSuiteName##_##TestName##_withServer(server); \
    } \
    static Awaitable<void> TestSuiteName##_##TestName##_withServer(TestServer &ServerName)
