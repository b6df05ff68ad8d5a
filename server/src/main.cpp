#include "configuration/configuration.hpp"
#include "instance/State.hpp"
#include "util/asio.hpp"
#include "util/util.hpp"

#include <cstdio>
#include <stdexcept>

namespace
{

Config::Root loadConfig(const std::filesystem::path &path)
{
    std::vector<std::byte> bytes;
    try {
        bytes = Util::readFile(path);
    }
    catch (const std::ios::failure &) {
        throw std::runtime_error("Could not read configuration file " + path.string() + ".");
    }
    return Config::Root::fromJson(std::string_view((const char *)bytes.data(), bytes.size()));
}

} // namespace

int main(int argc, const char * const *argv)
{
    if (argc != 2) {
        fprintf(stderr, "Usage: %s configuration.json\n", argc ? argv[0] : "videoflix-streamer");
        return 1;
    }

    try {
        Config::Root config = loadConfig(argv[1]);

        /* Load the catalog and start listening. Requests are handled in coroutines spawned by the server. */
        IOContext ioc;
        Instance::State state(config, ioc);
        ioc.run();
    }
    catch (const std::exception &e) {
        fprintf(stderr, "Exited with exception: %s\n", e.what());
    }
    return 1; // Only reached on error: the server runs until killed.
}
