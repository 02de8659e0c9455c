#include <mdkatex/converter.hpp>

#include <iostream>
#include <string>

int main()
{
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(nullptr);

    std::string input_buffer;
    input_buffer.reserve(128000);

    std::string line_buffer;
    line_buffer.reserve(512);

    while (std::getline(std::cin, line_buffer))
    {
        input_buffer.append(line_buffer);
        input_buffer.append(1, '\n');
    }

    if (std::cin.bad())
    {
        std::cerr << "((MDKATEX ERROR))(?): Failed to read from standard "
                     "input\n"
                  << std::endl;

        return 1;
    }

    std::string output_buffer;
    output_buffer.reserve(input_buffer.size() + 1024);

    mdkatex::converter converter{std::cerr};

    constexpr mdkatex::converter::config cfg{};

    if (!converter.convert(cfg, output_buffer, input_buffer))
    {
        std::cerr << "((MDKATEX ERROR))(?): Fatal error during mdkatex "
                     "conversion process\n"
                  << std::endl;

        return 1;
    }

    std::cout << output_buffer << std::flush;

    if (!std::cout)
    {
        std::cerr << "((MDKATEX ERROR))(?): Failed to write to standard "
                     "output\n"
                  << std::endl;

        return 1;
    }

    return 0;
}
