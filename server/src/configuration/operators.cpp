#include "configuration/configuration.hpp"

/**
 * @file
 *
 * These are used repeatedly (in the tests, and elsewhere), so don't keep code-generating them.
 */

#ifndef WITH_TESTING
Config::Root::~Root() = default;

Config::Root::Root(const Root &) = default;
Config::Root::Root(Root &&) noexcept = default;
Config::Root &Config::Root::operator=(const Root &) = default;
Config::Root &Config::Root::operator=(Root &&) noexcept = default;
#endif // WITH_TESTING

bool Config::Network::operator==(const Network &) const = default;
bool Config::Http::operator==(const Http &) const = default;
bool Config::Media::operator==(const Media &) const = default;
bool Config::Streaming::operator==(const Streaming &) const = default;
bool Config::Hls::operator==(const Hls &) const = default;
bool Config::Log::operator==(const Log &) const = default;
bool Config::Root::operator==(const Root &) const = default;
