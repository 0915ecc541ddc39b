#include <cstdlib>
#include <exception>
#include <iostream>

#include "ferry/client/config.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/client/session.hpp"
#include "ferry/version.hpp"

int main(int argc, char *argv[])
{
    ferry::client::ClientConfig config;
    try
    {
        config = ferry::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Ferry client " << ferry::version() << "\n" << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    ferry::client::Logger logger(config.log_path);
    ferry::client::ClientSession session(std::move(config), std::move(logger), std::cout);
    return session.run() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
