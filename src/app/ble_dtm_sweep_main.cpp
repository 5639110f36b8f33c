#include "cli_options.hpp"
#include "cli_runner.hpp"

#include <exception>
#include <iostream>

int main(int argc, char **argv)
{
    ble::dtm::CLIOptions options;
    std::string error_message;
    if(!ble::dtm::parse_cli_options(argc, argv, options, error_message))
    {
        if(!error_message.empty())
        {
            std::cerr << "Error: " << error_message << "\n\n";
        }
        std::cerr << ble::dtm::usage() << std::endl;
        return 64;
    }

    try
    {
        return ble::dtm::run_cli(options);
    }
    catch(const std::exception &ex)
    {
        std::cerr << "Unhandled exception: " << ex.what() << std::endl;
    }
    return 70;
}
