#include <client/bridge_client.hpp>

#include <getopt.h>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {
void PrintUsage(const char *program)
{
    std::cerr << "Usage: " << program
              << " [--host H] [--port P] [--vendor V] [--family F] <prompt...>" << std::endl;
}
} // namespace

int main(int argc, char *argv[])
{
    TBridgeClientConfig config;

    static struct option options[] = {{"help", no_argument, nullptr, 'h'},
                                      {"host", required_argument, nullptr, 'H'},
                                      {"port", required_argument, nullptr, 'p'},
                                      {"vendor", required_argument, nullptr, 'v'},
                                      {"family", required_argument, nullptr, 'f'},
                                      {nullptr, 0, nullptr, 0}};
    int opt = 0;
    try
    {
        while ((opt = getopt_long(argc, argv, "hH:p:v:f:", options, nullptr)) != -1)
        {
            switch (opt)
            {
                case 'h':
                    PrintUsage(argv[0]);
                    return 0;
                case 'H':
                    config.host = optarg;
                    break;
                case 'p':
                    config.port = std::stoi(optarg);
                    break;
                case 'v':
                    config.vendor = optarg;
                    break;
                case 'f':
                    config.family = optarg;
                    break;
                default:
                    PrintUsage(argv[0]);
                    return 1;
            }
        }
    }
    catch (std::logic_error &e)
    {
        std::cerr << "Invalid port: " << e.what() << std::endl;
        return 1;
    }

    std::string prompt;
    for (int i = optind; i < argc; ++i)
    {
        if (!prompt.empty())
        {
            prompt += ' ';
        }
        prompt += argv[i];
    }
    if (prompt.empty())
    {
        PrintUsage(argv[0]);
        return 1;
    }

    try
    {
        const CBridgeClient client(config);
        client.ChatStream(prompt, [](std::string_view fragment) {
            std::cout << fragment << std::flush;
            return true;
        });
        std::cout << std::endl;
    }
    catch (CBridgeClientError &e)
    {
        std::cerr << std::endl << "Error: " << e.what() << std::endl;
        return e.Status() == 0 ? 2 : 1;
    }
    catch (std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 255;
    }

    return 0;
}
