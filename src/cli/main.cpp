#include <iostream>
#include <casket/utils/string.hpp>
#include <mqcert/cli/command_dispatcher.hpp>
#include <mqcert/pki/error.hpp>

using namespace mqcert::cmd;

int main(int argc, char* argv[])
{
    try
    {
        std::vector<std::string_view> args(argv + 1, argv + argc);

        if (args.empty())
        {
            std::cerr << "Use '--help' to print commands" << std::endl;
            return EXIT_SUCCESS;
        }
        else if (casket::equals(args.front(), "-h") || casket::equals(args.front(), "--help"))
        {
            CommandDispatcher::Instance().printCommands(std::cout);
            return EXIT_SUCCESS;
        }

        auto cmd = CommandDispatcher::Instance().createCommand(argv[1]);
        args.erase(args.begin());
        cmd->execute(args);
    }
    catch (const std::exception& e)
    {
        const auto kind = mqcert::pki::errorKind(e);
        std::cerr << "error: " << kind << ": " << e.what() << std::endl;
        return kind == "ValidationError" ? 2 : EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
