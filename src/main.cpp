#include <asio.hpp>
#include <csignal>
#include <functional>
#include <iostream>
#include <string>

#include "ludo/access_log.hpp"
#include "ludo/catalog.hpp"
#include "ludo/catalog_api.hpp"
#include "ludo/file_io.hpp"
#include "ludo/server.hpp"

using namespace std::literals::chrono_literals;
using namespace ludo;
using namespace std::placeholders;

int main(int argc, char *argv[]) {
    try {
        if (argc > 5) {
            std::cerr << "Usage: ludo_server [<address> [<port> [<views_dir> [<static_dir>]]]]\n";
            std::cerr << "  Defaults:\n";
            std::cerr << "    ludo_server 0.0.0.0 3000 ./views ./static\n";
            return 1;
        }
        const std::string address = argc > 1 ? argv[1] : "0.0.0.0";
        const std::string port = argc > 2 ? argv[2] : "3000";
        const std::string viewsDir = argc > 3 ? argv[3] : "./views";
        const std::string staticDir = argc > 4 ? argv[4] : "./static";

        const Catalog catalog = Catalog::boardGames();

        asio::io_context ioc;
        Settings settings(5s, 100, 0);
        Server s(ioc, address, port, settings, 8 * 1024);

        // "/" serves the front page only, assets live below /static/.
        FileIO fileIO;
        fileIO.addMount("/", viewsDir, true);
        fileIO.addMount("/static/", staticDir);
        s.setFileIO(&fileIO);

        CatalogApi catalogApi(catalog);
        s.addRequestHandler(std::bind(&CatalogApi::handleRequest, &catalogApi, _1, _2));

        AccessLog accessLog(std::cout);
        s.setAccessLogHandler(accessLog.callback());

        s.setDebugMsgHandler(
            [](const std::string &msg) { std::cerr << "[DEBUG] " << msg << std::endl; });

        // Set up signal handling for graceful shutdown
        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](std::error_code /*ec*/, int /*signo*/) {
            std::cout << "\nShutting down server...\n";
            ioc.stop();
        });

        std::cout << "ludo_server listening on " << address << ":" << s.getBindedPort() << "\n";
        std::cout << "  Views:  " << viewsDir << "\n";
        std::cout << "  Static: " << staticDir << "\n";
        std::cout << "  " << catalog.size() << " products in catalog\n";
        std::cout << std::flush;

        // Run the server until stopped with Ctrl-C.
        ioc.run();
    } catch (std::exception &e) {
        std::cerr << "exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
