#pragma once

#include <string>
#include <string_view>

namespace Server
{

/**
 * Response errors.
 *
 * These correspond to HTTP response codes.
 */
enum class ErrorKind
{
    /**
     * Malformed request for the resource.
     *
     * HTTP 400 Bad Request.
     */
    BadRequest,

    /**
     * The client is not allowed to access the resource, e.g: the path tried to escape its directory.
     *
     * HTTP 403 Forbidden.
     */
    Forbidden,

    /**
     * The resource does not exist.
     *
     * HTTP 404 Not Found.
     */
    NotFound,

    /**
     * Unsupported request type (Request::Type).
     *
     * HTTP 405 Method Not Allowed.
     */
    UnsupportedType,

    /**
     * The requested byte range lies outside the representation.
     *
     * HTTP 416 Range Not Satisfiable. The resource is expected to set the Content-Range header itself.
     */
    RangeNotSatisfiable,

    /**
     * An unknown or internal error happened.
     *
     * HTTP 500 Internal Server Error.
     */
    Internal
};

/**
 * An object that can be thrown as an exception from Resource::operator().
 *
 * If thrown before anything was written to the Response, Response::setErrorAndMessage is called with the values from
 * this object. The message is sent to the client, so it must not contain anything internal such as filesystem paths.
 */
struct Error final
{
    Error(ErrorKind kind, std::string_view message = {}) : kind(kind), message(message) {}
    Error(ErrorKind kind, const char *message) : kind(kind), message(message) {}
    Error(ErrorKind kind, std::string message) : kind(kind), message(std::move(message)) {}

    ErrorKind kind;
    std::string message;
};

} // namespace Server
